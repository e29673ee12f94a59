#include <kbase/core/uuid.h>
#include <kbase/storage/database.h>
#include <kbase/storage/knowledge_base_repository.h>
#include <kbase/storage/vector_store.h>

#include <spdlog/spdlog.h>

namespace kbase::storage {

using knowledge::ChunkRecord;
using knowledge::KnowledgeBase;

namespace {

constexpr const char* kChunkColumns =
    "id, knowledge_base_id, content, vector, source, file_name, file_id, chunk_index, "
    "created_at, degraded";

constexpr const char* kBaseColumns =
    "id, name, description, model, dimensions, document_count, chunk_size, chunk_overlap, "
    "threshold, created_at, updated_at";

Result<void> bindOptional(Statement& stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        return stmt.bind(index, *value);
    }
    return stmt.bind(index, nullptr);
}

std::optional<std::string> optionalText(const Statement& stmt, int column) {
    if (stmt.isNull(column)) {
        return std::nullopt;
    }
    return stmt.getString(column);
}

Result<ChunkRecord> readChunk(const Statement& stmt) {
    ChunkRecord record;
    record.id = stmt.getString(0);
    record.knowledgeBaseId = stmt.getString(1);
    record.content = stmt.getString(2);
    auto vec = decodeVector(stmt.getBlob(3));
    if (!vec) {
        return Error{ErrorCode::InvalidData,
                     "chunk " + record.id + ": " + vec.error().message};
    }
    record.vector = std::move(vec).value();
    record.metadata.source = stmt.getString(4);
    record.metadata.fileName = optionalText(stmt, 5);
    record.metadata.fileId = optionalText(stmt, 6);
    record.metadata.chunkIndex = static_cast<size_t>(stmt.getInt64(7));
    record.metadata.createdAt = core::fromEpochMillis(stmt.getInt64(8));
    record.metadata.degraded = stmt.getInt(9) != 0;
    return record;
}

KnowledgeBase readBase(const Statement& stmt) {
    KnowledgeBase base;
    base.id = stmt.getString(0);
    base.name = stmt.getString(1);
    base.description = optionalText(stmt, 2);
    base.model = stmt.getString(3);
    base.dimensions = static_cast<size_t>(stmt.getInt64(4));
    base.documentCount = static_cast<size_t>(stmt.getInt64(5));
    base.chunkSize = static_cast<size_t>(stmt.getInt64(6));
    base.chunkOverlap = static_cast<size_t>(stmt.getInt64(7));
    base.threshold = stmt.getDouble(8);
    base.createdAt = core::fromEpochMillis(stmt.getInt64(9));
    base.updatedAt = core::fromEpochMillis(stmt.getInt64(10));
    return base;
}

} // namespace

// =============================================================================
// SqliteVectorStore
// =============================================================================

SqliteVectorStore::SqliteVectorStore(std::shared_ptr<Database> db) : db_(std::move(db)) {}

Result<void> SqliteVectorStore::initialize() {
    std::lock_guard<std::mutex> lock(db_->mutex());
    return db_->execute(R"sql(
        CREATE TABLE IF NOT EXISTS kb_chunks (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT NOT NULL UNIQUE,
            knowledge_base_id TEXT NOT NULL,
            content TEXT NOT NULL,
            vector BLOB NOT NULL,
            source TEXT NOT NULL,
            file_name TEXT,
            file_id TEXT,
            chunk_index INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            degraded INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_kb_chunks_base ON kb_chunks(knowledge_base_id, seq);
    )sql");
}

Result<void> SqliteVectorStore::put(const ChunkRecord& record) {
    if (record.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "chunk record id must not be empty"};
    }
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare(std::string("INSERT INTO kb_chunks (") + kChunkColumns +
                                   ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                                   "ON CONFLICT(id) DO UPDATE SET "
                                   "knowledge_base_id = excluded.knowledge_base_id, "
                                   "content = excluded.content, vector = excluded.vector, "
                                   "source = excluded.source, file_name = excluded.file_name, "
                                   "file_id = excluded.file_id, "
                                   "chunk_index = excluded.chunk_index, "
                                   "created_at = excluded.created_at, "
                                   "degraded = excluded.degraded");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();

    auto blob = encodeVector(record.vector);
    if (auto r = stmt.bindAll(record.id, record.knowledgeBaseId, record.content,
                              std::span<const std::byte>(blob), record.metadata.source);
        !r) {
        return r;
    }
    if (auto r = bindOptional(stmt, 6, record.metadata.fileName); !r)
        return r;
    if (auto r = bindOptional(stmt, 7, record.metadata.fileId); !r)
        return r;
    if (auto r = stmt.bind(8, static_cast<int64_t>(record.metadata.chunkIndex)); !r)
        return r;
    if (auto r = stmt.bind(9, core::toEpochMillis(record.metadata.createdAt)); !r)
        return r;
    if (auto r = stmt.bind(10, record.metadata.degraded ? 1 : 0); !r)
        return r;
    return stmt.execute();
}

Result<std::optional<ChunkRecord>> SqliteVectorStore::get(const std::string& chunkId) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult =
        db_->prepare(std::string("SELECT ") + kChunkColumns + " FROM kb_chunks WHERE id = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bind(1, chunkId); !r) {
        return r.error();
    }
    auto row = stmt.step();
    if (!row) {
        return row.error();
    }
    if (!row.value()) {
        return std::optional<ChunkRecord>{};
    }
    auto record = readChunk(stmt);
    if (!record) {
        return record.error();
    }
    return std::optional<ChunkRecord>{std::move(record).value()};
}

Result<size_t> SqliteVectorStore::deleteByKnowledgeBase(const std::string& baseId) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare("DELETE FROM kb_chunks WHERE knowledge_base_id = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bind(1, baseId); !r) {
        return r.error();
    }
    if (auto r = stmt.execute(); !r) {
        return r.error();
    }
    return static_cast<size_t>(db_->changes());
}

Result<bool> SqliteVectorStore::deleteById(const std::string& chunkId) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare("DELETE FROM kb_chunks WHERE id = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bind(1, chunkId); !r) {
        return r.error();
    }
    if (auto r = stmt.execute(); !r) {
        return r.error();
    }
    return db_->changes() > 0;
}

Result<std::vector<ChunkRecord>> SqliteVectorStore::listByKnowledgeBase(const std::string& baseId) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare(std::string("SELECT ") + kChunkColumns +
                                   " FROM kb_chunks WHERE knowledge_base_id = ? ORDER BY seq");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bind(1, baseId); !r) {
        return r.error();
    }

    std::vector<ChunkRecord> out;
    while (true) {
        auto row = stmt.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        auto record = readChunk(stmt);
        if (!record) {
            return record.error();
        }
        out.push_back(std::move(record).value());
    }
    return out;
}

// =============================================================================
// SqliteKnowledgeBaseRepository
// =============================================================================

SqliteKnowledgeBaseRepository::SqliteKnowledgeBaseRepository(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

Result<void> SqliteKnowledgeBaseRepository::initialize() {
    std::lock_guard<std::mutex> lock(db_->mutex());
    return db_->execute(R"sql(
        CREATE TABLE IF NOT EXISTS knowledge_bases (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT NOT NULL UNIQUE,
            name TEXT NOT NULL,
            description TEXT,
            model TEXT NOT NULL,
            dimensions INTEGER NOT NULL,
            document_count INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            chunk_overlap INTEGER NOT NULL,
            threshold REAL NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )sql");
}

Result<void> SqliteKnowledgeBaseRepository::put(const KnowledgeBase& base) {
    if (base.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "knowledge base id must not be empty"};
    }
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare(
        std::string("INSERT INTO knowledge_bases (") + kBaseColumns +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET name = excluded.name, "
        "description = excluded.description, model = excluded.model, "
        "dimensions = excluded.dimensions, document_count = excluded.document_count, "
        "chunk_size = excluded.chunk_size, chunk_overlap = excluded.chunk_overlap, "
        "threshold = excluded.threshold, updated_at = excluded.updated_at");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bindAll(base.id, base.name); !r)
        return r;
    if (auto r = bindOptional(stmt, 3, base.description); !r)
        return r;
    if (auto r = stmt.bind(4, base.model); !r)
        return r;
    if (auto r = stmt.bind(5, static_cast<int64_t>(base.dimensions)); !r)
        return r;
    if (auto r = stmt.bind(6, static_cast<int64_t>(base.documentCount)); !r)
        return r;
    if (auto r = stmt.bind(7, static_cast<int64_t>(base.chunkSize)); !r)
        return r;
    if (auto r = stmt.bind(8, static_cast<int64_t>(base.chunkOverlap)); !r)
        return r;
    if (auto r = stmt.bind(9, base.threshold); !r)
        return r;
    if (auto r = stmt.bind(10, core::toEpochMillis(base.createdAt)); !r)
        return r;
    if (auto r = stmt.bind(11, core::toEpochMillis(base.updatedAt)); !r)
        return r;
    return stmt.execute();
}

Result<std::optional<KnowledgeBase>> SqliteKnowledgeBaseRepository::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare(std::string("SELECT ") + kBaseColumns +
                                   " FROM knowledge_bases WHERE id = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bind(1, id); !r) {
        return r.error();
    }
    auto row = stmt.step();
    if (!row) {
        return row.error();
    }
    if (!row.value()) {
        return std::optional<KnowledgeBase>{};
    }
    return std::optional<KnowledgeBase>{readBase(stmt)};
}

Result<std::vector<KnowledgeBase>> SqliteKnowledgeBaseRepository::list() {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare(std::string("SELECT ") + kBaseColumns +
                                   " FROM knowledge_bases ORDER BY seq");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    std::vector<KnowledgeBase> out;
    while (true) {
        auto row = stmt.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        out.push_back(readBase(stmt));
    }
    return out;
}

Result<bool> SqliteKnowledgeBaseRepository::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(db_->mutex());
    auto stmtResult = db_->prepare("DELETE FROM knowledge_bases WHERE id = ?");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bind(1, id); !r) {
        return r.error();
    }
    if (auto r = stmt.execute(); !r) {
        return r.error();
    }
    return db_->changes() > 0;
}

} // namespace kbase::storage
