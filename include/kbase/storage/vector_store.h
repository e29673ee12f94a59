#pragma once

#include <kbase/core/types.h>
#include <kbase/knowledge/types.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kbase::storage {

/**
 * @brief Narrow read/write contract over persisted chunk records
 *
 * Stores neither rank nor filter; listing returns records in the order they
 * were first put. Re-putting an existing id replaces the record in place.
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    virtual Result<void> put(const knowledge::ChunkRecord& record) = 0;
    virtual Result<std::optional<knowledge::ChunkRecord>> get(const std::string& chunkId) = 0;
    virtual Result<size_t> deleteByKnowledgeBase(const std::string& baseId) = 0;
    /// false when no record had that id
    virtual Result<bool> deleteById(const std::string& chunkId) = 0;
    virtual Result<std::vector<knowledge::ChunkRecord>>
    listByKnowledgeBase(const std::string& baseId) = 0;
};

class InMemoryVectorStore final : public IVectorStore {
public:
    Result<void> put(const knowledge::ChunkRecord& record) override;
    Result<std::optional<knowledge::ChunkRecord>> get(const std::string& chunkId) override;
    Result<size_t> deleteByKnowledgeBase(const std::string& baseId) override;
    Result<bool> deleteById(const std::string& chunkId) override;
    Result<std::vector<knowledge::ChunkRecord>>
    listByKnowledgeBase(const std::string& baseId) override;

private:
    std::mutex mutex_;
    std::vector<knowledge::ChunkRecord> records_; // insertion order
};

class Database;

/**
 * SQLite-backed store. Vectors live in a BLOB column; insertion order is the
 * rowid, which an upsert preserves.
 */
class SqliteVectorStore final : public IVectorStore {
public:
    explicit SqliteVectorStore(std::shared_ptr<Database> db);

    /// Creates the chunks table when missing
    Result<void> initialize();

    Result<void> put(const knowledge::ChunkRecord& record) override;
    Result<std::optional<knowledge::ChunkRecord>> get(const std::string& chunkId) override;
    Result<size_t> deleteByKnowledgeBase(const std::string& baseId) override;
    Result<bool> deleteById(const std::string& chunkId) override;
    Result<std::vector<knowledge::ChunkRecord>>
    listByKnowledgeBase(const std::string& baseId) override;

private:
    std::shared_ptr<Database> db_;
};

} // namespace kbase::storage
