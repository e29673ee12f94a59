#include <kbase/chunking/chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kbase::chunking {

namespace {

size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80)
        return 1;
    if ((lead >> 5) == 0x6)
        return 2;
    if ((lead >> 4) == 0xE)
        return 3;
    if ((lead >> 3) == 0x1E)
        return 4;
    return 1;
}

// Byte offset of every code point plus a trailing entry equal to text.size()
std::vector<size_t> codePointOffsets(std::string_view text) {
    std::vector<size_t> offsets;
    offsets.reserve(text.size() + 1);
    size_t pos = 0;
    while (pos < text.size()) {
        offsets.push_back(pos);
        pos += sequenceLength(static_cast<unsigned char>(text[pos]));
    }
    offsets.push_back(text.size());
    return offsets;
}

} // namespace

Result<void> validate(const ChunkingConfig& config) {
    if (config.chunkSize == 0) {
        return Error{ErrorCode::InvalidConfig, "chunk size must be greater than zero"};
    }
    if (config.overlap >= config.chunkSize) {
        return Error{ErrorCode::InvalidConfig,
                     "chunk overlap (" + std::to_string(config.overlap) +
                         ") must be smaller than chunk size (" +
                         std::to_string(config.chunkSize) + ")"};
    }
    return {};
}

size_t characterCount(std::string_view text) {
    return codePointOffsets(text).size() - 1;
}

Result<std::vector<TextChunk>> chunkText(std::string_view text, const ChunkingConfig& config) {
    if (auto valid = validate(config); !valid) {
        return valid.error();
    }

    std::vector<TextChunk> chunks;
    if (text.empty()) {
        return chunks;
    }

    const auto offsets = codePointOffsets(text);
    const size_t total = offsets.size() - 1;
    const size_t stride = config.stride();

    for (size_t start = 0; start < total; start += stride) {
        size_t end = std::min(start + config.chunkSize, total);

        TextChunk chunk;
        chunk.index = chunks.size();
        chunk.startOffset = start;
        chunk.endOffset = end;
        chunk.content = std::string(text.substr(offsets[start], offsets[end] - offsets[start]));
        chunks.push_back(std::move(chunk));

        if (end == total) {
            break;
        }
    }

    spdlog::debug("Chunked {} characters into {} chunks (size={}, overlap={})", total,
                  chunks.size(), config.chunkSize, config.overlap);
    return chunks;
}

Result<std::vector<std::string>> chunk(std::string_view text, size_t chunkSize, size_t overlap) {
    auto chunks = chunkText(text, ChunkingConfig{chunkSize, overlap});
    if (!chunks) {
        return chunks.error();
    }
    std::vector<std::string> out;
    out.reserve(chunks.value().size());
    for (auto& c : chunks.value()) {
        out.push_back(std::move(c.content));
    }
    return out;
}

} // namespace kbase::chunking
