#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <kbase/config/config_helpers.h>
#include <kbase/config/kbase_config.h>
#include <kbase/core/uuid.h>
#include <kbase/http/http_client.h>
#include <kbase/knowledge/knowledge_base_manager.h>
#include <kbase/knowledge/knowledge_context.h>
#include <kbase/storage/database.h>
#include <kbase/storage/knowledge_base_repository.h>
#include <kbase/storage/vector_store.h>
#include <kbase/vector/embedding_provider.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace {

using namespace kbase;

void configureLogging(const std::string& level, bool verbose) {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

json metadataToJson(const knowledge::ChunkMetadata& m) {
    json j;
    j["source"] = m.source;
    if (m.fileName)
        j["fileName"] = *m.fileName;
    if (m.fileId)
        j["fileId"] = *m.fileId;
    j["chunkIndex"] = m.chunkIndex;
    j["createdAt"] = core::toEpochMillis(m.createdAt);
    j["degraded"] = m.degraded;
    return j;
}

json baseToJson(const knowledge::KnowledgeBase& kb) {
    json j;
    j["id"] = kb.id;
    j["name"] = kb.name;
    if (kb.description)
        j["description"] = *kb.description;
    j["model"] = kb.model;
    j["dimensions"] = kb.dimensions;
    j["documentCount"] = kb.documentCount;
    j["chunkSize"] = kb.chunkSize;
    j["chunkOverlap"] = kb.chunkOverlap;
    j["threshold"] = kb.threshold;
    j["createdAt"] = core::toEpochMillis(kb.createdAt);
    j["updatedAt"] = core::toEpochMillis(kb.updatedAt);
    return j;
}

json chunkToJson(const knowledge::ChunkRecord& c) {
    return json{{"id", c.id},
                {"knowledgeBaseId", c.knowledgeBaseId},
                {"content", c.content},
                {"dimensions", c.vector.size()},
                {"metadata", metadataToJson(c.metadata)}};
}

json resultToJson(const knowledge::SearchResult& r) {
    return json{{"chunkId", r.chunkId},
                {"content", r.content},
                {"score", r.score},
                {"metadata", metadataToJson(r.metadata)}};
}

/// Owns every collaborator for one CLI invocation
struct Runtime {
    std::shared_ptr<storage::Database> db;
    std::shared_ptr<knowledge::KnowledgeBaseManager> manager;
};

Result<Runtime> buildRuntime(const config::KbaseConfig& cfg) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.dataDir, ec);
    if (ec) {
        return Error{ErrorCode::InvalidConfig,
                     "cannot create data directory '" + cfg.dataDir.string() + "': " + ec.message()};
    }

    Runtime rt;
    rt.db = std::make_shared<storage::Database>();
    if (auto r = rt.db->open(cfg.databasePath().string()); !r)
        return r.error();
    if (auto r = rt.db->enableWAL(); !r)
        spdlog::warn("WAL mode unavailable: {}", r.error().message);

    auto store = std::make_shared<storage::SqliteVectorStore>(rt.db);
    if (auto r = store->initialize(); !r)
        return r.error();
    auto repo = std::make_shared<storage::SqliteKnowledgeBaseRepository>(rt.db);
    if (auto r = repo->initialize(); !r)
        return r.error();

    auto embeddings = vector::makeEmbeddingProvider(http::makeCurlHttpClient(), cfg.embedding);
    auto models = std::make_shared<vector::StaticModelCatalog>(cfg.models);

    knowledge::ManagerOptions options;
    options.defaults = cfg.knowledge;
    options.retrieval = cfg.retrieval;

    rt.manager = std::make_shared<knowledge::KnowledgeBaseManager>(
        repo, store, embeddings, models, std::make_shared<knowledge::LoggingEventListener>(),
        options);
    return rt;
}

int emit(const json& j) {
    std::cout << j.dump(2) << std::endl;
    return 0;
}

int fail(const Error& e) {
    spdlog::error("{}", e.message);
    json j;
    j["error"] = errorToString(e.code);
    j["message"] = e.message;
    std::cout << j.dump(2) << std::endl;
    return 1;
}

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "cannot read '" + path.string() + "'"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"kbase - knowledge-base retrieval", "kbase"};
    app.require_subcommand(1);

    std::string configPath;
    std::string dataDir;
    bool verbose = false;
    app.add_option("--config", configPath, "Path to config.toml");
    app.add_option("--data-dir", dataDir, "Data directory (overrides config)");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    // create
    auto* createCmd = app.add_subcommand("create", "Create a knowledge base");
    knowledge::KnowledgeBaseDraft draft;
    std::string description;
    size_t dimensions = 0, documentCount = 0, chunkSize = 0, chunkOverlap = 0;
    double threshold = 0.0;
    createCmd->add_option("name", draft.name, "Knowledge base name")->required();
    createCmd->add_option("-m,--model", draft.model, "Embedding model id")->required();
    auto* descOpt = createCmd->add_option("-d,--description", description);
    auto* dimOpt = createCmd->add_option("--dimensions", dimensions, "Vector width");
    auto* countOpt = createCmd->add_option("--document-count", documentCount, "Default top-k");
    auto* sizeOpt = createCmd->add_option("--chunk-size", chunkSize);
    auto* overlapOpt = createCmd->add_option("--chunk-overlap", chunkOverlap);
    auto* thresholdOpt = createCmd->add_option("--threshold", threshold);

    // list
    auto* listCmd = app.add_subcommand("list", "List knowledge bases");

    // delete
    auto* deleteCmd = app.add_subcommand("delete", "Delete a knowledge base and its chunks");
    std::string baseId;
    deleteCmd->add_option("id", baseId, "Knowledge base id")->required();

    // add
    auto* addCmd = app.add_subcommand("add", "Chunk, embed and store a document");
    std::string addFile;
    std::string addSource;
    addCmd->add_option("file", addFile, "Document to ingest")
        ->required()
        ->check(CLI::ExistingFile);
    addCmd->add_option("--kb", baseId, "Knowledge base id")->required();
    addCmd->add_option("--source", addSource, "Source label (defaults to the path)");

    // docs
    auto* docsCmd = app.add_subcommand("docs", "List chunks of a knowledge base");
    bool degradedOnly = false;
    std::string removeChunk;
    docsCmd->add_option("--kb", baseId, "Knowledge base id");
    docsCmd->add_flag("--degraded", degradedOnly, "Only chunks stored with fallback vectors");
    docsCmd->add_option("--remove", removeChunk, "Delete the chunk with this id");

    // search
    auto* searchCmd = app.add_subcommand("search", "Search one or more knowledge bases");
    std::string query;
    std::vector<std::string> baseIds;
    size_t limit = 0;
    double searchThreshold = 0.0;
    bool plain = false;
    bool asContext = false;
    searchCmd->add_option("query", query, "Search query")->required();
    searchCmd->add_option("--kb", baseIds, "Knowledge base id (repeatable)")->required();
    auto* limitOpt = searchCmd->add_option("-l,--limit", limit, "Maximum results");
    auto* searchThresholdOpt = searchCmd->add_option("-t,--threshold", searchThreshold);
    searchCmd->add_flag("--plain", plain, "Skip the enhanced retrieval pipeline");
    searchCmd->add_flag("--context", asContext, "Print references as a prompt context block");

    // repair
    auto* repairCmd = app.add_subcommand("repair", "Re-embed chunks stored with fallback vectors");
    repairCmd->add_option("--kb", baseId, "Knowledge base id")->required();

    CLI11_PARSE(app, argc, argv);

    try {
        auto loaded = config::loadConfig(config::get_config_path(configPath));
        if (!loaded) {
            configureLogging("warn", verbose);
            return fail(loaded.error());
        }
        auto cfg = std::move(loaded).value();
        config::applyEnvironmentOverrides(cfg);
        if (!dataDir.empty())
            cfg.dataDir = config::expand_tilde(dataDir);
        configureLogging(cfg.logLevel, verbose);

        auto runtime = buildRuntime(cfg);
        if (!runtime)
            return fail(runtime.error());
        auto& manager = *runtime.value().manager;

        if (*createCmd) {
            if (*descOpt)
                draft.description = description;
            if (*dimOpt)
                draft.dimensions = dimensions;
            if (*countOpt)
                draft.documentCount = documentCount;
            if (*sizeOpt)
                draft.chunkSize = chunkSize;
            if (*overlapOpt)
                draft.chunkOverlap = chunkOverlap;
            if (*thresholdOpt)
                draft.threshold = threshold;
            auto r = manager.createKnowledgeBase(draft);
            return r ? emit(baseToJson(r.value())) : fail(r.error());
        }

        if (*listCmd) {
            auto r = manager.listKnowledgeBases();
            if (!r)
                return fail(r.error());
            json out = json::array();
            for (const auto& kb : r.value())
                out.push_back(baseToJson(kb));
            return emit(out);
        }

        if (*deleteCmd) {
            auto r = manager.deleteKnowledgeBase(baseId);
            if (!r)
                return fail(r.error());
            return emit(json{{"id", baseId}, {"chunksRemoved", r.value()}});
        }

        if (*addCmd) {
            auto content = readFile(addFile);
            if (!content)
                return fail(content.error());
            knowledge::SourceMetadata source;
            source.source = addSource.empty() ? addFile : addSource;
            source.fileName = std::filesystem::path(addFile).filename().string();
            source.fileId = core::generateUUID();
            auto r = manager.addDocument(baseId, content.value(), source);
            if (!r)
                return fail(r.error());
            size_t degraded = 0;
            json chunks = json::array();
            for (const auto& c : r.value()) {
                degraded += c.metadata.degraded ? 1 : 0;
                chunks.push_back(c.id);
            }
            return emit(json{{"knowledgeBaseId", baseId},
                             {"chunks", chunks},
                             {"degraded", degraded}});
        }

        if (*docsCmd) {
            if (!removeChunk.empty()) {
                auto r = manager.deleteDocument(removeChunk);
                if (!r)
                    return fail(r.error());
                return emit(json{{"id", removeChunk}, {"deleted", r.value()}});
            }
            if (baseId.empty())
                return fail(Error{ErrorCode::InvalidArgument, "--kb is required"});
            auto r = degradedOnly ? manager.listDegradedChunks(baseId)
                                  : manager.listDocuments(baseId);
            if (!r)
                return fail(r.error());
            json out = json::array();
            for (const auto& c : r.value())
                out.push_back(chunkToJson(c));
            return emit(out);
        }

        if (*searchCmd) {
            if (baseIds.size() == 1 && !asContext) {
                knowledge::SearchRequest req;
                req.knowledgeBaseId = baseIds.front();
                req.query = query;
                if (*limitOpt)
                    req.limit = limit;
                if (*searchThresholdOpt)
                    req.threshold = searchThreshold;
                req.useEnhanced = !plain;
                auto r = manager.search(req);
                if (!r)
                    return fail(r.error());
                json out = json::array();
                for (const auto& hit : r.value())
                    out.push_back(resultToJson(hit));
                return emit(out);
            }

            knowledge::KnowledgeContextService context(runtime.value().manager);
            knowledge::ReferenceOptions options;
            if (*limitOpt)
                options.limit = limit;
            options.threshold = *searchThresholdOpt ? searchThreshold : cfg.knowledge.threshold;
            auto refs = context.collectReferences(core::generateUUID(), query, baseIds, options);
            if (!refs)
                return fail(refs.error());
            if (asContext) {
                std::cout << knowledge::KnowledgeContextService::formatReferencesContext(
                                 refs.value())
                          << std::endl;
                return 0;
            }
            auto text = knowledge::KnowledgeContextService::formatReferencesJson(refs.value());
            std::cout << (text.empty() ? "[]" : text) << std::endl;
            return 0;
        }

        if (*repairCmd) {
            auto r = manager.reembedDegradedChunks(baseId);
            if (!r)
                return fail(r.error());
            return emit(json{{"knowledgeBaseId", baseId}, {"repaired", r.value()}});
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
