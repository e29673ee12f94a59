#include <kbase/storage/knowledge_base_repository.h>
#include <kbase/storage/vector_store.h>

#include <algorithm>

namespace kbase::storage {

using knowledge::ChunkRecord;
using knowledge::KnowledgeBase;

// =============================================================================
// InMemoryVectorStore
// =============================================================================

Result<void> InMemoryVectorStore::put(const ChunkRecord& record) {
    if (record.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "chunk record id must not be empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const ChunkRecord& r) { return r.id == record.id; });
    if (it != records_.end()) {
        *it = record;
    } else {
        records_.push_back(record);
    }
    return {};
}

Result<std::optional<ChunkRecord>> InMemoryVectorStore::get(const std::string& chunkId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const ChunkRecord& r) { return r.id == chunkId; });
    if (it == records_.end()) {
        return std::optional<ChunkRecord>{};
    }
    return std::optional<ChunkRecord>{*it};
}

Result<size_t> InMemoryVectorStore::deleteByKnowledgeBase(const std::string& baseId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = records_.size();
    std::erase_if(records_, [&](const ChunkRecord& r) { return r.knowledgeBaseId == baseId; });
    return before - records_.size();
}

Result<bool> InMemoryVectorStore::deleteById(const std::string& chunkId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto removed = std::erase_if(records_, [&](const ChunkRecord& r) { return r.id == chunkId; });
    return removed > 0;
}

Result<std::vector<ChunkRecord>>
InMemoryVectorStore::listByKnowledgeBase(const std::string& baseId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkRecord> out;
    for (const auto& r : records_) {
        if (r.knowledgeBaseId == baseId) {
            out.push_back(r);
        }
    }
    return out;
}

// =============================================================================
// InMemoryKnowledgeBaseRepository
// =============================================================================

Result<void> InMemoryKnowledgeBaseRepository::put(const KnowledgeBase& base) {
    if (base.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "knowledge base id must not be empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(bases_.begin(), bases_.end(),
                           [&](const KnowledgeBase& b) { return b.id == base.id; });
    if (it != bases_.end()) {
        *it = base;
    } else {
        bases_.push_back(base);
    }
    return {};
}

Result<std::optional<KnowledgeBase>> InMemoryKnowledgeBaseRepository::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(bases_.begin(), bases_.end(),
                           [&](const KnowledgeBase& b) { return b.id == id; });
    if (it == bases_.end()) {
        return std::optional<KnowledgeBase>{};
    }
    return std::optional<KnowledgeBase>{*it};
}

Result<std::vector<KnowledgeBase>> InMemoryKnowledgeBaseRepository::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    return bases_;
}

Result<bool> InMemoryKnowledgeBaseRepository::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto removed = std::erase_if(bases_, [&](const KnowledgeBase& b) { return b.id == id; });
    return removed > 0;
}

} // namespace kbase::storage
