#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace kbase::vector::dimres {

inline constexpr std::size_t kDefaultDim = 1536;

// Width of a well-known embedding model, nullopt for unknown identifiers.
std::optional<std::size_t> known_model_dim(std::string_view modelId);

// Resolve dimension with precedence: probed -> known model table -> defaultDim.
std::size_t resolve_dim(std::string_view modelId, std::optional<std::size_t> probedDim,
                        std::size_t defaultDim = kDefaultDim);

} // namespace kbase::vector::dimres
