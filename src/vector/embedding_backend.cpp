#include <kbase/vector/embedding_backend.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kbase::vector {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxErrorBodyChars = 200;

std::string snippet(std::string_view body) {
    if (body.size() <= kMaxErrorBodyChars)
        return std::string(body);
    return std::string(body.substr(0, kMaxErrorBodyChars)) + "...";
}

std::string joinUrl(std::string base, std::string_view path) {
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    base.push_back('/');
    base.append(path);
    return base;
}

// Numeric JSON array -> vector; nullopt when any element is not a number
std::optional<Embedding> toEmbedding(const json& arr) {
    if (!arr.is_array() || arr.empty())
        return std::nullopt;
    Embedding out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.is_number())
            return std::nullopt;
        out.push_back(v.get<float>());
    }
    return out;
}

Error embeddingError(const ModelDescriptor& model, const std::string& cause) {
    return Error{ErrorCode::EmbeddingFailure,
                 "embedding with model '" + model.id + "' failed: " + cause};
}

// Shared POST + status handling for both variants
Result<std::string> postJson(http::IHttpClient& client, const ModelDescriptor& model,
                             std::string url, std::vector<http::Header> headers,
                             const json& body, std::chrono::milliseconds timeout,
                             const std::stop_token& stop) {
    http::HttpRequest req;
    req.url = std::move(url);
    req.headers = std::move(headers);
    req.headers.push_back({"Content-Type", "application/json"});
    req.body = body.dump();
    req.timeout = timeout;
    if (stop.stop_possible()) {
        req.shouldCancel = [stop] { return stop.stop_requested(); };
    }

    auto resp = client.post(req);
    if (!resp) {
        if (resp.error().code == ErrorCode::OperationCancelled) {
            return resp.error();
        }
        return embeddingError(model, resp.error().message);
    }
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "embedding request cancelled"};
    }
    if (!resp.value().ok()) {
        return embeddingError(model, "HTTP " + std::to_string(resp.value().status) + ": " +
                                         snippet(resp.value().body));
    }
    return std::move(resp).value().body;
}

} // namespace

Result<size_t> IEmbeddingBackend::probeDimension(const ModelDescriptor& model,
                                                 std::stop_token stop) {
    auto probe = generateEmbedding("test", model, stop);
    if (!probe) {
        return probe.error();
    }
    return probe.value().size();
}

Result<Embedding> parseGenericEmbeddingResponse(std::string_view body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::InvalidData, "response is not valid JSON"};
    }

    // {"data":[{"embedding":[...]}]}
    if (j.is_object() && j.contains("data") && j["data"].is_array() && !j["data"].empty()) {
        const auto& first = j["data"][0];
        if (first.is_object() && first.contains("embedding")) {
            if (auto e = toEmbedding(first["embedding"]))
                return std::move(*e);
        }
    }
    // {"embedding":[...]}
    if (j.is_object() && j.contains("embedding")) {
        if (auto e = toEmbedding(j["embedding"]))
            return std::move(*e);
    }
    // [...]
    if (j.is_array()) {
        if (auto e = toEmbedding(j))
            return std::move(*e);
    }
    return Error{ErrorCode::InvalidData, "unrecognized embedding response: " + snippet(body)};
}

Result<Embedding> parseGeminiEmbeddingResponse(std::string_view body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::InvalidData, "response is not valid JSON"};
    }
    if (j.is_object() && j.contains("embedding") && j["embedding"].is_object() &&
        j["embedding"].contains("values")) {
        if (auto e = toEmbedding(j["embedding"]["values"]))
            return std::move(*e);
    }
    return Error{ErrorCode::InvalidData, "unrecognized Gemini response: " + snippet(body)};
}

// =============================================================================
// GenericHttpEmbeddingBackend
// =============================================================================

GenericHttpEmbeddingBackend::GenericHttpEmbeddingBackend(
    std::shared_ptr<http::IHttpClient> client, std::chrono::milliseconds timeout)
    : client_(std::move(client)), timeout_(timeout) {}

std::string GenericHttpEmbeddingBackend::endpointFor(const ModelDescriptor& model) {
    return joinUrl(model.baseUrl, "embeddings");
}

Result<Embedding> GenericHttpEmbeddingBackend::generateEmbedding(const std::string& text,
                                                                 const ModelDescriptor& model,
                                                                 std::stop_token stop) {
    if (model.apiKey.empty()) {
        return embeddingError(model, "no API key configured for provider '" + model.provider +
                                         "'");
    }
    if (model.baseUrl.empty()) {
        return embeddingError(model, "no endpoint configured for provider '" + model.provider +
                                         "'");
    }

    json body = {{"model", model.id}, {"input", text}};
    auto raw = postJson(*client_, model, endpointFor(model),
                        {{"Authorization", "Bearer " + model.apiKey}}, body, timeout_, stop);
    if (!raw) {
        return raw.error();
    }

    auto parsed = parseGenericEmbeddingResponse(raw.value());
    if (!parsed) {
        return embeddingError(model, parsed.error().message);
    }
    spdlog::debug("Generic backend embedded {} chars with '{}' -> dim {}", text.size(), model.id,
                  parsed.value().size());
    return parsed;
}

// =============================================================================
// GeminiEmbeddingBackend
// =============================================================================

GeminiEmbeddingBackend::GeminiEmbeddingBackend(std::shared_ptr<http::IHttpClient> client,
                                               std::chrono::milliseconds timeout)
    : client_(std::move(client)), timeout_(timeout) {}

std::string GeminiEmbeddingBackend::endpointFor(const ModelDescriptor& model) {
    std::string base = model.baseUrl.empty() ? kDefaultBaseUrl : model.baseUrl;
    return joinUrl(std::move(base), "models/" + model.id + ":embedContent");
}

Result<Embedding> GeminiEmbeddingBackend::generateEmbedding(const std::string& text,
                                                            const ModelDescriptor& model,
                                                            std::stop_token stop) {
    if (model.apiKey.empty()) {
        return embeddingError(model, "no API key configured for provider '" + model.provider +
                                         "'");
    }

    json part;
    part["text"] = text;
    json body;
    body["model"] = "models/" + model.id;
    body["content"]["parts"] = json::array({part});
    body["taskType"] = "SEMANTIC_SIMILARITY";
    auto raw = postJson(*client_, model, endpointFor(model), {{"x-goog-api-key", model.apiKey}},
                        body, timeout_, stop);
    if (!raw) {
        return raw.error();
    }

    auto parsed = parseGeminiEmbeddingResponse(raw.value());
    if (!parsed) {
        return embeddingError(model, parsed.error().message);
    }
    return parsed;
}

} // namespace kbase::vector
