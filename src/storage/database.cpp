#include <kbase/storage/database.h>

#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace kbase::storage {

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int"};
    }
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind double"};
    }
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string_view"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind blob"};
    }
    return {};
}

Result<void> Statement::execute() {
    constexpr int kMaxRetries = 5;
    auto backoff = std::chrono::milliseconds(10);

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE) {
            return {};
        }
        // Transient lock errors are retried with exponential backoff
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        return Error{ErrorCode::DatabaseError,
                     "Failed to execute statement: " + std::string(sqlite3_errstr(rc))};
    }
    return Error{ErrorCode::DatabaseError, "Failed to execute statement: max retries exceeded"};
}

Result<bool> Statement::step() {
    constexpr int kMaxRetries = 5;
    auto backoff = std::chrono::milliseconds(10);

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        }
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        return Error{ErrorCode::DatabaseError,
                     "Failed to step statement: " + std::string(sqlite3_errstr(rc))};
    }
    return Error{ErrorCode::DatabaseError, "Failed to step statement: max retries exceeded"};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};

    std::vector<std::byte> result(static_cast<size_t>(size));
    std::memcpy(result.data(), blob, static_cast<size_t>(size));
    return result;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// Database implementation
Database::~Database() {
    close();
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    int flags = 0;
    switch (mode) {
        case ConnectionMode::Create:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case ConnectionMode::Memory:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    // Set busy timeout to avoid indefinite blocking
    sqlite3_busy_timeout(db_, 5000);

    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : getErrorMessage();
        sqlite3_free(errMsg);
        return Error{ErrorCode::DatabaseError, error};
    }
    return {};
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

std::string Database::getErrorMessage() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

std::vector<std::byte> encodeVector(const Embedding& vec) {
    std::vector<std::byte> out;
    out.reserve(vec.size() * sizeof(float));
    for (float v : vec) {
        uint32_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        for (int shift = 0; shift < 32; shift += 8) {
            out.push_back(static_cast<std::byte>((bits >> shift) & 0xFFu));
        }
    }
    return out;
}

Result<Embedding> decodeVector(const std::vector<std::byte>& blob) {
    if (blob.size() % sizeof(float) != 0) {
        return Error{ErrorCode::InvalidData, "vector blob size " + std::to_string(blob.size()) +
                                                 " is not a multiple of " +
                                                 std::to_string(sizeof(float))};
    }
    Embedding out;
    out.reserve(blob.size() / sizeof(float));
    for (size_t i = 0; i < blob.size(); i += sizeof(float)) {
        uint32_t bits = 0;
        for (int b = 3; b >= 0; --b) {
            bits = (bits << 8) | std::to_integer<uint32_t>(blob[i + static_cast<size_t>(b)]);
        }
        float v = 0.0f;
        std::memcpy(&v, &bits, sizeof(v));
        out.push_back(v);
    }
    return out;
}

} // namespace kbase::storage
