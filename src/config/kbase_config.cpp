#include <kbase/chunking/chunker.h>
#include <kbase/config/config_helpers.h>
#include <kbase/config/kbase_config.h>

#include <spdlog/spdlog.h>

namespace kbase::config {

namespace {

Error badValue(const std::string& section, const std::string& key, const std::string& raw) {
    return Error{ErrorCode::InvalidConfig,
                 "invalid value for [" + section + "] " + key + ": '" + raw + "'"};
}

// Each reader leaves out untouched when the key is absent.
class SectionReader {
public:
    SectionReader(const std::filesystem::path& path, std::string section)
        : section_(std::move(section)), values_(parse_config_section(path, section_)) {}

    Result<void> readSize(const std::string& key, size_t& out) const {
        auto it = values_.find(key);
        if (it == values_.end())
            return {};
        auto v = parse_int(it->second);
        if (!v || *v < 0)
            return badValue(section_, key, it->second);
        out = static_cast<size_t>(*v);
        return {};
    }

    Result<void> readDouble(const std::string& key, double& out) const {
        auto it = values_.find(key);
        if (it == values_.end())
            return {};
        auto v = parse_double(it->second);
        if (!v)
            return badValue(section_, key, it->second);
        out = *v;
        return {};
    }

    Result<void> readBool(const std::string& key, bool& out) const {
        auto it = values_.find(key);
        if (it == values_.end())
            return {};
        auto v = parse_bool(it->second);
        if (!v)
            return badValue(section_, key, it->second);
        out = *v;
        return {};
    }

    void readString(const std::string& key, std::string& out) const {
        if (auto it = values_.find(key); it != values_.end())
            out = it->second;
    }

    const std::string& section() const { return section_; }

private:
    std::string section_;
    std::map<std::string, std::string> values_;
};

#define KBASE_TRY(expr)                                                                            \
    do {                                                                                           \
        if (auto _r = (expr); !_r)                                                                 \
            return _r.error();                                                                     \
    } while (0)

} // namespace

Result<KbaseConfig> loadConfig(const std::filesystem::path& configPath) {
    KbaseConfig cfg;
    cfg.configPath = configPath;
    cfg.dataDir = get_data_dir();

    std::error_code ec;
    if (configPath.empty() || !std::filesystem::exists(configPath, ec)) {
        spdlog::debug("No config file at '{}', using defaults", configPath.string());
        return cfg;
    }

    SectionReader core(configPath, "core");
    std::string dataDir;
    core.readString("data_dir", dataDir);
    if (!dataDir.empty())
        cfg.dataDir = expand_tilde(dataDir);
    core.readString("log_level", cfg.logLevel);

    SectionReader embedding(configPath, "embedding");
    KBASE_TRY(embedding.readSize("cache_capacity", cfg.embedding.cacheCapacity));
    std::string policy;
    embedding.readString("cache_policy", policy);
    if (!policy.empty()) {
        auto parsed = core::parseEvictionPolicy(policy);
        if (!parsed)
            return badValue("embedding", "cache_policy", policy);
        cfg.embedding.cachePolicy = *parsed;
    }
    size_t timeoutMs = static_cast<size_t>(cfg.embedding.requestTimeout.count());
    KBASE_TRY(embedding.readSize("request_timeout_ms", timeoutMs));
    cfg.embedding.requestTimeout = std::chrono::milliseconds(timeoutMs);
    std::string native;
    embedding.readString("native_providers", native);
    if (!native.empty())
        cfg.embedding.nativeProviders = parse_list(native);

    SectionReader kb(configPath, "knowledge");
    KBASE_TRY(kb.readSize("document_count", cfg.knowledge.documentCount));
    KBASE_TRY(kb.readSize("chunk_size", cfg.knowledge.chunkSize));
    KBASE_TRY(kb.readSize("chunk_overlap", cfg.knowledge.chunkOverlap));
    KBASE_TRY(kb.readDouble("threshold", cfg.knowledge.threshold));
    if (auto valid = chunking::validate(
            chunking::ChunkingConfig{cfg.knowledge.chunkSize, cfg.knowledge.chunkOverlap});
        !valid) {
        return Error{ErrorCode::InvalidConfig, "[knowledge] " + valid.error().message};
    }

    SectionReader retrieval(configPath, "retrieval");
    KBASE_TRY(retrieval.readBool("query_expansion", cfg.retrieval.enableQueryExpansion));
    KBASE_TRY(retrieval.readBool("hybrid_search", cfg.retrieval.enableHybridSearch));
    KBASE_TRY(retrieval.readBool("diversity_filter", cfg.retrieval.enableDiversityFilter));
    KBASE_TRY(retrieval.readBool("rerank", cfg.retrieval.enableRerank));
    KBASE_TRY(retrieval.readSize("max_candidates", cfg.retrieval.maxCandidates));
    KBASE_TRY(retrieval.readDouble("diversity_threshold", cfg.retrieval.diversityThreshold));
    KBASE_TRY(retrieval.readSize("max_query_variants", cfg.retrieval.maxQueryVariants));
    if (auto valid = cfg.retrieval.validate(); !valid) {
        return Error{ErrorCode::InvalidConfig, "[retrieval] " + valid.error().message};
    }

    const std::string prefix = "models.";
    for (const auto& section : list_config_sections(configPath, prefix)) {
        SectionReader m(configPath, section);
        vector::ModelDescriptor model;
        model.id = unquote(section.substr(prefix.size()));
        m.readString("provider", model.provider);
        m.readString("api_key", model.apiKey);
        m.readString("base_url", model.baseUrl);
        std::string keyEnv;
        m.readString("api_key_env", keyEnv);
        if (model.apiKey.empty() && !keyEnv.empty()) {
            if (const char* v = std::getenv(keyEnv.c_str()); v)
                model.apiKey = v;
        }
        KBASE_TRY(m.readSize("dimensions", model.dimensions));
        if (model.id.empty() || model.provider.empty()) {
            return Error{ErrorCode::InvalidConfig,
                         "[" + section + "] needs a model id and a provider"};
        }
        cfg.models.push_back(std::move(model));
    }

    spdlog::debug("Loaded config '{}' ({} models)", configPath.string(), cfg.models.size());
    return cfg;
}

#undef KBASE_TRY

void applyEnvironmentOverrides(KbaseConfig& config) {
    if (const char* env = std::getenv("KBASE_DATA_DIR"); env && *env) {
        config.dataDir = expand_tilde(env);
    }
    if (const char* env = std::getenv("KBASE_LOG_LEVEL"); env && *env) {
        config.logLevel = env;
    }
}

} // namespace kbase::config
