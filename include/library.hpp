#pragma once
#include "model.hpp"
#include "storage.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstddef>

namespace booklend {

// --- Activity log ---
struct ActivityLog {
    virtual ~ActivityLog() = default;
    virtual void record(const std::string& event, const std::string& detail) = 0;
};

struct ConsoleActivityLog : ActivityLog {
    void record(const std::string& event, const std::string& detail) override;
};

struct NullActivityLog : ActivityLog {
    void record(const std::string&, const std::string&) override {}
};

// --- Configuration ---
struct LibraryConfig {
    std::filesystem::path booksFile{"books.json"};
    std::filesystem::path membersFile{"members.json"};
    int loanDays{DEFAULT_LOAN_DAYS};
    bool seedWhenEmpty{true};
};

// --- Catalog store ---
class Catalog {
    std::vector<Book> books;
    friend class LendingLedger;
    Book* findMutable(const std::string& bookId);
public:
    Catalog() = default;
    explicit Catalog(std::vector<Book> books);

    // ids are B####, one past the highest id in use
    Result<std::string> addBook(const std::string& title, const std::string& author, int totalCopies);

    // drops the book and its loans; members' mirror entries are left as they are
    bool removeBook(const std::string& bookId);

    // case-insensitive substring of title or author
    std::vector<Book> searchBooks(const std::string& keyword) const;

    const std::vector<Book>& listBooks() const { return books; }
    const Book* findBook(const std::string& bookId) const;
    bool empty() const { return books.empty(); }
    std::size_t size() const { return books.size(); }
};

// --- Roster store ---
class Roster {
    std::vector<Member> members;
    friend class LendingLedger;
    Member* findMutable(const std::string& memberId);
public:
    Roster() = default;
    explicit Roster(std::vector<Member> members);

    Result<std::string> addMember(const std::string& name, const std::string& contact);
    const std::vector<Member>& listMembers() const { return members; }
    std::optional<Member> getMember(const std::string& memberId) const;
    std::optional<std::size_t> borrowedCountByMember(const std::string& memberId) const;
    const Member* findMember(const std::string& memberId) const;
    bool empty() const { return members.empty(); }
    std::size_t size() const { return members.size(); }
};

// --- Lending ledger: the only writer of Book::activeLoans and Member::borrowedBooks ---
class LendingLedger {
    Catalog& catalog;
    Roster& roster;
public:
    LendingLedger(Catalog& catalog, Roster& roster);

    // returns the due date
    Result<Date> borrow(const std::string& memberId, const std::string& bookId,
                        Date today = today_utc(), int loanDays = DEFAULT_LOAN_DAYS);

    // releases every loan the member holds on the book; OK even if there is none
    Status returnBook(const std::string& memberId, const std::string& bookId);
};

struct MemberLoanCount {
    std::string memberId;
    std::string name;
    std::size_t count{};
};

// --- Facade: load-or-seed at construction, full save after every successful mutation ---
class Library {
    IStorage& storage;
    ActivityLog& log;
    LibraryConfig config;
    Catalog catalog;
    Roster roster;
    LendingLedger ledger;

    void seedBooks();
    void seedMembers();
public:
    // throws StorageError when the stored collections cannot be read
    Library(IStorage& storage, ActivityLog& log, LibraryConfig config = {});
    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;

    Result<std::string> addBook(const std::string& title, const std::string& author, int totalCopies = 1);
    bool removeBook(const std::string& bookId);
    Result<std::string> addMember(const std::string& name, const std::string& contact);
    Result<Date> borrow(const std::string& memberId, const std::string& bookId, Date today = today_utc());
    Status returnBook(const std::string& memberId, const std::string& bookId);

    std::vector<Book> searchBooks(const std::string& keyword) const;
    const std::vector<Book>& listBooks() const;
    const std::vector<Member>& listMembers() const;
    std::optional<Member> getMember(const std::string& memberId) const;
    std::optional<Book> getBook(const std::string& bookId) const;
    std::optional<std::vector<BorrowedBook>> memberLoans(const std::string& memberId) const;
    std::vector<MemberLoanCount> borrowSummary() const;

    const LibraryConfig& settings() const { return config; }

    // writes books, then members
    void save();
};

} // namespace booklend
