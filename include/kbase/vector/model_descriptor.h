#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kbase::vector {

/**
 * @brief Resolved embedding model: who serves it and how to reach it
 */
struct ModelDescriptor {
    std::string id;
    std::string provider; ///< Provider tag, selects the backend variant
    std::string apiKey;
    std::string baseUrl;
    size_t dimensions = 0; ///< Declared width, 0 when unknown
};

/**
 * @brief Resolves model identifiers stored on knowledge bases
 */
class IModelCatalog {
public:
    virtual ~IModelCatalog() = default;
    virtual std::optional<ModelDescriptor> resolve(const std::string& modelId) const = 0;
    virtual std::vector<ModelDescriptor> list() const = 0;
};

class StaticModelCatalog : public IModelCatalog {
public:
    StaticModelCatalog() = default;
    explicit StaticModelCatalog(std::vector<ModelDescriptor> models) {
        for (auto& m : models) {
            add(std::move(m));
        }
    }

    void add(ModelDescriptor model) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = model.id;
        models_[id] = std::move(model);
    }

    std::optional<ModelDescriptor> resolve(const std::string& modelId) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = models_.find(modelId);
        if (it == models_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<ModelDescriptor> list() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ModelDescriptor> out;
        out.reserve(models_.size());
        for (const auto& [_, m] : models_) {
            out.push_back(m);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ModelDescriptor> models_;
};

} // namespace kbase::vector
