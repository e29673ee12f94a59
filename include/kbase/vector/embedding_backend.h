#pragma once

#include <kbase/core/types.h>
#include <kbase/http/http_client.h>
#include <kbase/vector/model_descriptor.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace kbase::vector {

/**
 * The closed set of backend variants a model can be served by
 */
enum class BackendVariant {
    Native,     // Provider-specific request/response contract
    GenericHttp // OpenAI-compatible POST {baseUrl}/embeddings
};

constexpr const char* variantName(BackendVariant v) {
    switch (v) {
        case BackendVariant::Native:
            return "native";
        case BackendVariant::GenericHttp:
            return "generic-http";
    }
    return "generic-http";
}

/**
 * Abstract interface for embedding backends
 */
class IEmbeddingBackend {
public:
    virtual ~IEmbeddingBackend() = default;

    virtual Result<Embedding> generateEmbedding(const std::string& text,
                                                const ModelDescriptor& model,
                                                std::stop_token stop = {}) = 0;

    /**
     * Width of the vectors this backend produces for model. The default
     * implementation embeds a one-token probe and reports its length.
     */
    virtual Result<size_t> probeDimension(const ModelDescriptor& model, std::stop_token stop = {});

    virtual std::string getBackendName() const = 0;
};

/**
 * Response parsers, one per wire contract.
 *
 * Generic bodies are matched against these shapes in order:
 *   {"data":[{"embedding":[...]}]}, {"embedding":[...]}, [...]
 * Gemini bodies must be {"embedding":{"values":[...]}}.
 */
Result<Embedding> parseGenericEmbeddingResponse(std::string_view body);
Result<Embedding> parseGeminiEmbeddingResponse(std::string_view body);

/**
 * OpenAI-compatible endpoint: POST {baseUrl}/embeddings with a Bearer key.
 */
class GenericHttpEmbeddingBackend final : public IEmbeddingBackend {
public:
    GenericHttpEmbeddingBackend(std::shared_ptr<http::IHttpClient> client,
                                std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Result<Embedding> generateEmbedding(const std::string& text, const ModelDescriptor& model,
                                        std::stop_token stop = {}) override;
    std::string getBackendName() const override { return "generic-http"; }

    static std::string endpointFor(const ModelDescriptor& model);

private:
    std::shared_ptr<http::IHttpClient> client_;
    std::chrono::milliseconds timeout_;
};

/**
 * Gemini embedContent API, the shipped native variant.
 */
class GeminiEmbeddingBackend final : public IEmbeddingBackend {
public:
    static constexpr const char* kDefaultBaseUrl =
        "https://generativelanguage.googleapis.com/v1beta";

    GeminiEmbeddingBackend(std::shared_ptr<http::IHttpClient> client,
                           std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Result<Embedding> generateEmbedding(const std::string& text, const ModelDescriptor& model,
                                        std::stop_token stop = {}) override;
    std::string getBackendName() const override { return "gemini"; }

    static std::string endpointFor(const ModelDescriptor& model);

private:
    std::shared_ptr<http::IHttpClient> client_;
    std::chrono::milliseconds timeout_;
};

} // namespace kbase::vector
