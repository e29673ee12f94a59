#pragma once

#include <kbase/core/types.h>

#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kbase::storage {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    Memory, ///< In-memory database
    Create  ///< Read-write, create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    Result<void> enableWAL();

    /**
     * @brief Lock shared by every store on this connection
     *
     * Hold it across a statement and the changes() call that reads its count.
     */
    std::mutex& mutex() { return mutex_; }

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;

    std::string getErrorMessage() const;
};

// Float vectors are stored as IEEE-754 little-endian bytes regardless of host order
std::vector<std::byte> encodeVector(const Embedding& vec);
Result<Embedding> decodeVector(const std::vector<std::byte>& blob);

} // namespace kbase::storage
