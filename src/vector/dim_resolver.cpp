#include <kbase/vector/dim_resolver.h>

#include <array>
#include <utility>

namespace kbase::vector::dimres {

namespace {

constexpr std::array<std::pair<std::string_view, std::size_t>, 14> kKnownModels{{
    {"text-embedding-3-small", 1536},
    {"text-embedding-3-large", 3072},
    {"text-embedding-ada-002", 1536},
    {"Doubao-embedding", 1024},
    {"Doubao-embedding-large", 1536},
    {"BAAI/bge-large-zh-v1.5", 1024},
    {"BAAI/bge-large-en-v1.5", 1024},
    {"BAAI/bge-m3", 1024},
    {"jina-embeddings-v2-base-zh", 768},
    {"jina-embeddings-v2-base-en", 768},
    {"jina-embeddings-v3", 1024},
    {"text-embedding-v2", 1024},
    {"embedding-2", 1536},
    {"hunyuan-embedding", 1024},
}};

} // namespace

std::optional<std::size_t> known_model_dim(std::string_view modelId) {
    for (const auto& [id, dim] : kKnownModels) {
        if (id == modelId)
            return dim;
    }
    return std::nullopt;
}

std::size_t resolve_dim(std::string_view modelId, std::optional<std::size_t> probedDim,
                        std::size_t defaultDim) {
    if (probedDim && *probedDim > 0)
        return *probedDim;
    if (auto known = known_model_dim(modelId))
        return *known;
    return defaultDim;
}

} // namespace kbase::vector::dimres
