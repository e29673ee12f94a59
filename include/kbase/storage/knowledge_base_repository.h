#pragma once

#include <kbase/core/types.h>
#include <kbase/knowledge/types.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kbase::storage {

class Database;

/**
 * @brief Keyed collection of knowledge-base entities
 */
class IKnowledgeBaseRepository {
public:
    virtual ~IKnowledgeBaseRepository() = default;

    virtual Result<void> put(const knowledge::KnowledgeBase& base) = 0;
    virtual Result<std::optional<knowledge::KnowledgeBase>> get(const std::string& id) = 0;
    virtual Result<std::vector<knowledge::KnowledgeBase>> list() = 0;
    virtual Result<bool> remove(const std::string& id) = 0;
};

class InMemoryKnowledgeBaseRepository final : public IKnowledgeBaseRepository {
public:
    Result<void> put(const knowledge::KnowledgeBase& base) override;
    Result<std::optional<knowledge::KnowledgeBase>> get(const std::string& id) override;
    Result<std::vector<knowledge::KnowledgeBase>> list() override;
    Result<bool> remove(const std::string& id) override;

private:
    std::mutex mutex_;
    std::vector<knowledge::KnowledgeBase> bases_;
};

class SqliteKnowledgeBaseRepository final : public IKnowledgeBaseRepository {
public:
    explicit SqliteKnowledgeBaseRepository(std::shared_ptr<Database> db);

    Result<void> initialize();

    Result<void> put(const knowledge::KnowledgeBase& base) override;
    Result<std::optional<knowledge::KnowledgeBase>> get(const std::string& id) override;
    Result<std::vector<knowledge::KnowledgeBase>> list() override;
    Result<bool> remove(const std::string& id) override;

private:
    std::shared_ptr<Database> db_;
};

} // namespace kbase::storage
