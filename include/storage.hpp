#pragma once
#include "model.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace booklend {

// Thrown for unreadable or malformed storage and for failed writes.
struct StorageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// --- JSON codec (ADL hooks for nlohmann::json) ---
void to_json(nlohmann::json& j, const Loan& loan);
void from_json(const nlohmann::json& j, Loan& loan);
void to_json(nlohmann::json& j, const Book& book);
void from_json(const nlohmann::json& j, Book& book);
void to_json(nlohmann::json& j, const BorrowedBook& entry);
void from_json(const nlohmann::json& j, BorrowedBook& entry);
void to_json(nlohmann::json& j, const Member& member);
void from_json(const nlohmann::json& j, Member& member);

// --- Backends: two independent record arrays ---
struct IStorage {
    virtual ~IStorage() = default;
    // an absent collection loads as an empty array
    virtual nlohmann::json loadBooks() = 0;
    virtual nlohmann::json loadMembers() = 0;
    virtual void saveBooks(const nlohmann::json& books) = 0;
    virtual void saveMembers(const nlohmann::json& members) = 0;
};

class FileJsonStorage : public IStorage {
public:
    FileJsonStorage(std::filesystem::path booksPath, std::filesystem::path membersPath);

    nlohmann::json loadBooks() override;
    nlohmann::json loadMembers() override;
    void saveBooks(const nlohmann::json& books) override;
    void saveMembers(const nlohmann::json& members) override;

    const std::filesystem::path& booksPath() const { return booksPath_; }
    const std::filesystem::path& membersPath() const { return membersPath_; }

private:
    std::filesystem::path booksPath_;
    std::filesystem::path membersPath_;

    static nlohmann::json readArray(const std::filesystem::path& path);
    static void writeArray(const std::filesystem::path& path, const nlohmann::json& j);
};

class MemoryStorage : public IStorage {
public:
    MemoryStorage() = default;

    nlohmann::json loadBooks() override { return books_; }
    nlohmann::json loadMembers() override { return members_; }
    void saveBooks(const nlohmann::json& books) override { books_ = books; ++saves_; }
    void saveMembers(const nlohmann::json& members) override { members_ = members; ++saves_; }

    // number of collection writes so far (books and members count separately)
    int saveCount() const { return saves_; }

private:
    nlohmann::json books_ = nlohmann::json::array();
    nlohmann::json members_ = nlohmann::json::array();
    int saves_{0};
};

// --- Whole-dataset load/save ---
struct Snapshot {
    std::vector<Book> books;
    std::vector<Member> members;
};

Snapshot loadSnapshot(IStorage& storage);

// writes books first, then members
void saveSnapshot(IStorage& storage, const std::vector<Book>& books, const std::vector<Member>& members);

} // namespace booklend
