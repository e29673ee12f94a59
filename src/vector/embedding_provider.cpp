#include <kbase/vector/dim_resolver.h>
#include <kbase/vector/embedding_provider.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kbase::vector {

EmbeddingProvider::EmbeddingProvider(std::shared_ptr<IEmbeddingBackend> genericBackend,
                                     std::shared_ptr<IEmbeddingBackend> nativeBackend,
                                     EmbeddingProviderConfig config)
    : generic_(std::move(genericBackend)), native_(std::move(nativeBackend)),
      config_(std::move(config)), cache_(config_.cacheCapacity, config_.cachePolicy) {}

BackendVariant EmbeddingProvider::variantFor(const ModelDescriptor& model) const {
    if (native_ && std::find(config_.nativeProviders.begin(), config_.nativeProviders.end(),
                             model.provider) != config_.nativeProviders.end()) {
        return BackendVariant::Native;
    }
    return BackendVariant::GenericHttp;
}

IEmbeddingBackend& EmbeddingProvider::backendFor(const ModelDescriptor& model) const {
    return variantFor(model) == BackendVariant::Native ? *native_ : *generic_;
}

Result<Embedding> EmbeddingProvider::embed(const std::string& text, const ModelDescriptor& model,
                                           std::stop_token stop) {
    CacheKey key{model.id, text};
    if (auto hit = cache_.get(key)) {
        spdlog::debug("Embedding cache hit for model '{}'", model.id);
        return std::move(*hit);
    }
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "embedding request cancelled"};
    }
    if (!generic_) {
        return Error{ErrorCode::EmbeddingFailure, "no embedding backend configured"};
    }

    auto result = backendFor(model).generateEmbedding(text, model, stop);
    if (!result) {
        return result.error();
    }
    if (result.value().empty()) {
        return Error{ErrorCode::EmbeddingFailure,
                     "model '" + model.id + "' returned an empty embedding"};
    }
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "embedding request cancelled"};
    }

    cache_.put(key, result.value());
    return result;
}

std::optional<size_t> EmbeddingProvider::dimensionsOf(const ModelDescriptor& model,
                                                      std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::nullopt;
    }

    std::optional<size_t> probed;
    std::string failure;
    if (variantFor(model) == BackendVariant::Native) {
        auto r = native_->probeDimension(model, stop);
        if (r) {
            probed = r.value();
        } else {
            failure = r.error().message;
        }
    } else {
        auto r = embed("test", model, stop);
        if (r) {
            probed = r.value().size();
        } else {
            failure = r.error().message;
        }
    }

    if (stop.stop_requested()) {
        return std::nullopt;
    }

    std::optional<size_t> declared;
    if (model.dimensions > 0) {
        declared = model.dimensions;
    }
    if (probed) {
        return *probed;
    }
    auto fallback = dimres::resolve_dim(model.id, declared);
    spdlog::warn("Dimension probe for model '{}' failed ({}); using {}", model.id, failure,
                 fallback);
    return fallback;
}

size_t EmbeddingProvider::dimensionsOf(const ModelDescriptor& model) {
    return dimensionsOf(model, std::stop_token{}).value_or(dimres::kDefaultDim);
}

std::shared_ptr<EmbeddingProvider> makeEmbeddingProvider(std::shared_ptr<http::IHttpClient> client,
                                                         EmbeddingProviderConfig config) {
    auto generic = std::make_shared<GenericHttpEmbeddingBackend>(client, config.requestTimeout);
    auto native = std::make_shared<GeminiEmbeddingBackend>(client, config.requestTimeout);
    return std::make_shared<EmbeddingProvider>(std::move(generic), std::move(native),
                                               std::move(config));
}

// =============================================================================
// DimensionProbe
// =============================================================================

DimensionProbe::DimensionProbe(std::shared_ptr<EmbeddingProvider> provider)
    : provider_(std::move(provider)) {}

DimensionProbe::~DimensionProbe() {
    cancel();
}

void DimensionProbe::start(ModelDescriptor model, Callback onResolved) {
    std::jthread previous;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++generation_;
        previous = std::move(worker_);
    }
    // Joins outside the lock; the old worker takes mutex_ before reporting.
    if (previous.joinable()) {
        previous.request_stop();
        previous.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        return; // a newer start() got in while we were joining
    }
    worker_ = std::jthread([this, generation, model = std::move(model),
                            onResolved = std::move(onResolved)](std::stop_token stop) {
        auto dim = provider_->dimensionsOf(model, stop);
        if (!dim) {
            spdlog::debug("Dimension probe for '{}' cancelled", model.id);
            return;
        }
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (stop.stop_requested() || generation != generation_) {
                return;
            }
            lastResult_ = *dim;
        }
        if (onResolved && !stop.stop_requested()) {
            onResolved(model, *dim);
        }
    });
}

void DimensionProbe::cancel() {
    std::jthread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        previous = std::move(worker_);
    }
    if (previous.joinable()) {
        previous.request_stop();
        previous.join();
    }
}

std::optional<size_t> DimensionProbe::lastResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastResult_;
}

} // namespace kbase::vector
