#pragma once

#include <kbase/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kbase::chunking {

/**
 * Sliding-window parameters, measured in characters (Unicode code points)
 */
struct ChunkingConfig {
    size_t chunkSize = 1000;
    size_t overlap = 200;

    size_t stride() const { return chunkSize - overlap; }
};

/**
 * Represents a single document chunk
 */
struct TextChunk {
    std::string content;
    size_t index = 0;       // Position in document (0-based)
    size_t startOffset = 0; // Character offset in document
    size_t endOffset = 0;   // One past the last character

    size_t length() const { return endOffset - startOffset; }
};

/**
 * Validates chunkSize > overlap >= 0.
 */
Result<void> validate(const ChunkingConfig& config);

/**
 * Splits text into overlapping windows of config.chunkSize characters, advancing
 * by chunkSize - overlap. Windows stop once one reaches the end of the text, so
 * the final chunk always carries characters no earlier chunk has. Multi-byte
 * UTF-8 sequences are never split.
 */
Result<std::vector<TextChunk>> chunkText(std::string_view text, const ChunkingConfig& config);

/**
 * Convenience form returning only the chunk strings.
 */
Result<std::vector<std::string>> chunk(std::string_view text, size_t chunkSize, size_t overlap);

/**
 * Number of code points in a UTF-8 string; invalid lead bytes count as one.
 */
size_t characterCount(std::string_view text);

} // namespace kbase::chunking
