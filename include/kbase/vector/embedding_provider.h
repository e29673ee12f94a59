#pragma once

#include <kbase/core/bounded_cache.h>
#include <kbase/core/types.h>
#include <kbase/http/http_client.h>
#include <kbase/vector/embedding_backend.h>
#include <kbase/vector/model_descriptor.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace kbase::vector {

struct EmbeddingProviderConfig {
    size_t cacheCapacity = 100;
    core::EvictionPolicy cachePolicy = core::EvictionPolicy::FIFO;
    std::vector<std::string> nativeProviders{"gemini"}; ///< Provider tags served natively
    std::chrono::milliseconds requestTimeout{30000};
};

/**
 * @brief Text -> vector resolution with a bounded (model, text) cache
 *
 * Successful embeddings are cached write-once per key; failures never are.
 */
class EmbeddingProvider {
public:
    EmbeddingProvider(std::shared_ptr<IEmbeddingBackend> genericBackend,
                      std::shared_ptr<IEmbeddingBackend> nativeBackend,
                      EmbeddingProviderConfig config = {});

    EmbeddingProvider(const EmbeddingProvider&) = delete;
    EmbeddingProvider& operator=(const EmbeddingProvider&) = delete;

    /**
     * Embed text with model. Errors are EmbeddingFailure, or OperationCancelled
     * when stop was requested mid-flight.
     */
    Result<Embedding> embed(const std::string& text, const ModelDescriptor& model,
                            std::stop_token stop = {});

    /**
     * Vector width for model. Probes the backend; on failure falls back to the
     * declared width, then the known-model table, then 1536. Returns nullopt
     * only when stop was requested.
     */
    std::optional<size_t> dimensionsOf(const ModelDescriptor& model, std::stop_token stop);
    size_t dimensionsOf(const ModelDescriptor& model);

    BackendVariant variantFor(const ModelDescriptor& model) const;

    core::CacheStats cacheStats() const { return cache_.stats(); }
    size_t cacheSize() const { return cache_.size(); }
    void clearCache() { cache_.clear(); }

private:
    struct CacheKey {
        std::string model;
        std::string text;
        bool operator==(const CacheKey& other) const {
            return model == other.model && text == other.text;
        }
    };
    struct CacheKeyHash {
        size_t operator()(const CacheKey& k) const {
            size_t h = std::hash<std::string>{}(k.model);
            return h ^ (std::hash<std::string>{}(k.text) + 0x9e3779b97f4a7c15ull + (h << 6) +
                        (h >> 2));
        }
    };

    IEmbeddingBackend& backendFor(const ModelDescriptor& model) const;

    std::shared_ptr<IEmbeddingBackend> generic_;
    std::shared_ptr<IEmbeddingBackend> native_;
    EmbeddingProviderConfig config_;
    core::BoundedCache<CacheKey, Embedding, CacheKeyHash> cache_;
};

/**
 * Wires the curl-backed generic and Gemini backends over one HTTP client.
 */
std::shared_ptr<EmbeddingProvider> makeEmbeddingProvider(std::shared_ptr<http::IHttpClient> client,
                                                         EmbeddingProviderConfig config = {});

/**
 * @brief Background dimension probe where a newer probe supersedes the older
 *
 * start() requests stop on any running probe before launching the next one. A
 * superseded or cancelled probe never invokes its callback. Callbacks run on
 * the probe's worker thread.
 */
class DimensionProbe {
public:
    using Callback = std::function<void(const ModelDescriptor&, size_t)>;

    explicit DimensionProbe(std::shared_ptr<EmbeddingProvider> provider);
    ~DimensionProbe();

    DimensionProbe(const DimensionProbe&) = delete;
    DimensionProbe& operator=(const DimensionProbe&) = delete;

    void start(ModelDescriptor model, Callback onResolved);
    void cancel();

    /// Width from the most recent probe that completed without being superseded
    std::optional<size_t> lastResult() const;

private:
    std::shared_ptr<EmbeddingProvider> provider_;
    mutable std::mutex mutex_;
    uint64_t generation_ = 0;
    std::optional<size_t> lastResult_;
    std::jthread worker_;
};

} // namespace kbase::vector
