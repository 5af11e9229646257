#include "library.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace booklend {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
}

// prefix + 4 digits, one past the highest numeric suffix already used
template <typename T>
std::string nextId(char prefix, const std::vector<T>& items) {
    long highest = 0;
    for (auto& item : items) {
        const std::string& id = item.id;
        if (id.size() < 2 || id[0] != prefix) continue;
        const std::string digits = id.substr(1);
        if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c){ return std::isdigit(c); })) continue;
        if (digits.size() > 9) continue;
        highest = std::max(highest, std::stol(digits));
    }
    std::ostringstream out;
    out << prefix << std::setfill('0') << std::setw(4) << (highest + 1);
    return out.str();
}

} // namespace

// ----- ConsoleActivityLog -----
void ConsoleActivityLog::record(const std::string& event, const std::string& detail) {
    std::clog << "[LOG] " << event << " | " << detail << "\n";
}

// ----- Catalog -----
Catalog::Catalog(std::vector<Book> books) : books(std::move(books)) {}

Book* Catalog::findMutable(const std::string& bookId) {
    auto it = std::find_if(books.begin(), books.end(),
                           [&](const Book& b){ return b.id == bookId; });
    return it == books.end() ? nullptr : &*it;
}

const Book* Catalog::findBook(const std::string& bookId) const {
    auto it = std::find_if(books.begin(), books.end(),
                           [&](const Book& b){ return b.id == bookId; });
    return it == books.end() ? nullptr : &*it;
}

Result<std::string> Catalog::addBook(const std::string& title, const std::string& author, int totalCopies) {
    if (blank(title) || blank(author) || totalCopies < 1) {
        return Result<std::string>::failure(Status::INVALID_ARGUMENT);
    }
    Book book;
    book.id          = nextId('B', books);
    book.title       = title;
    book.author      = author;
    book.totalCopies = totalCopies;
    books.push_back(book);
    return Result<std::string>::success(book.id);
}

bool Catalog::removeBook(const std::string& bookId) {
    auto it = std::find_if(books.begin(), books.end(),
                           [&](const Book& b){ return b.id == bookId; });
    if (it == books.end()) return false;
    books.erase(it);
    return true;
}

std::vector<Book> Catalog::searchBooks(const std::string& keyword) const {
    const std::string needle = toLower(keyword);
    std::vector<Book> out;
    for (auto& b : books) {
        if (toLower(b.title).find(needle) != std::string::npos ||
            toLower(b.author).find(needle) != std::string::npos) {
            out.push_back(b);
        }
    }
    return out;
}

// ----- Roster -----
Roster::Roster(std::vector<Member> members) : members(std::move(members)) {}

Member* Roster::findMutable(const std::string& memberId) {
    auto it = std::find_if(members.begin(), members.end(),
                           [&](const Member& m){ return m.id == memberId; });
    return it == members.end() ? nullptr : &*it;
}

const Member* Roster::findMember(const std::string& memberId) const {
    auto it = std::find_if(members.begin(), members.end(),
                           [&](const Member& m){ return m.id == memberId; });
    return it == members.end() ? nullptr : &*it;
}

Result<std::string> Roster::addMember(const std::string& name, const std::string& contact) {
    if (blank(name)) return Result<std::string>::failure(Status::INVALID_ARGUMENT);
    Member m;
    m.id      = nextId('M', members);
    m.name    = name;
    m.contact = contact;
    members.push_back(m);
    return Result<std::string>::success(m.id);
}

std::optional<Member> Roster::getMember(const std::string& memberId) const {
    const Member* m = findMember(memberId);
    if (!m) return std::nullopt;
    return *m;
}

std::optional<std::size_t> Roster::borrowedCountByMember(const std::string& memberId) const {
    const Member* m = findMember(memberId);
    if (!m) return std::nullopt;
    return m->borrowedCount();
}

// ----- LendingLedger -----
LendingLedger::LendingLedger(Catalog& catalog, Roster& roster) : catalog(catalog), roster(roster) {}

Result<Date> LendingLedger::borrow(const std::string& memberId, const std::string& bookId,
                                   Date today, int loanDays) {
    if (loanDays < 1) return Result<Date>::failure(Status::INVALID_ARGUMENT);
    Member* m = roster.findMutable(memberId);
    if (!m) return Result<Date>::failure(Status::NOT_FOUND);
    Book* b = catalog.findMutable(bookId);
    if (!b) return Result<Date>::failure(Status::NOT_FOUND);
    if (b->availableCopies() <= 0) return Result<Date>::failure(Status::NO_COPIES_AVAILABLE);

    const Date due = addDays(today, loanDays);
    b->activeLoans.push_back(Loan{memberId, today, due});
    m->borrowedBooks.push_back(BorrowedBook{bookId, today, due});
    return Result<Date>::success(due);
}

Status LendingLedger::returnBook(const std::string& memberId, const std::string& bookId) {
    Member* m = roster.findMutable(memberId);
    Book* b = catalog.findMutable(bookId);
    if (!m || !b) return Status::NOT_FOUND;

    auto& loans = b->activeLoans;
    loans.erase(std::remove_if(loans.begin(), loans.end(),
                               [&](const Loan& L){ return L.memberId == memberId; }),
                loans.end());
    auto& mirror = m->borrowedBooks;
    mirror.erase(std::remove_if(mirror.begin(), mirror.end(),
                                [&](const BorrowedBook& e){ return e.bookId == bookId; }),
                 mirror.end());
    return Status::OK;
}

// ----- Library -----
Library::Library(IStorage& storage, ActivityLog& log, LibraryConfig config)
    : storage(storage), log(log), config(std::move(config)), ledger(catalog, roster) {
    Snapshot snap = loadSnapshot(storage);
    catalog = Catalog(std::move(snap.books));
    roster  = Roster(std::move(snap.members));
    log.record("LOADED", std::to_string(catalog.size()) + " books, " +
                         std::to_string(roster.size()) + " members");

    if (this->config.seedWhenEmpty) {
        if (catalog.empty()) seedBooks();
        if (roster.empty()) seedMembers();
    }
}

void Library::seedBooks() {
    const struct { const char* title; const char* author; int copies; } samples[] = {
        {"Python Basics",      "John Smith",     4},
        {"Data Structures",    "Mark Allen",     3},
        {"AI Fundamentals",    "Andrew Ng",      2},
        {"Machine Learning",   "Tom Mitchell",   5},
        {"Cybersecurity 101",  "Jane Doe",       3},
        {"Database Systems",   "Ramakrishnan",   2},
        {"Java Programming",   "James Gosling",  3},
        {"Operating Systems",  "Silberschatz",   2},
        {"Networks Explained", "Tanenbaum",      2},
        {"Cloud Computing",    "Rajkumar Buyya", 3},
    };
    for (auto& s : samples) catalog.addBook(s.title, s.author, s.copies);
    log.record("SEEDED", std::to_string(catalog.size()) + " sample books");
    save();
}

void Library::seedMembers() {
    const char* names[] = {
        "Ali Khan", "Sara Ahmed", "Syed Asad", "Fahad Ali", "Ayesha Bano",
        "Bilal Shaikh", "Hassan Raza", "Usman Tariq", "Zainab Fatima",
        "Nida Noor", "Ahmed Ali", "Maha Iqbal"
    };
    for (const char* name : names) {
        const std::string full(name);
        const std::string first = full.substr(0, full.find(' '));
        roster.addMember(full, toLower(first) + "@email.com");
    }
    log.record("SEEDED", std::to_string(roster.size()) + " sample members");
    save();
}

Result<std::string> Library::addBook(const std::string& title, const std::string& author, int totalCopies) {
    auto r = catalog.addBook(title, author, totalCopies);
    if (!r.ok()) return r;
    log.record("BOOK_ADDED", *r.value + " '" + title + "'");
    save();
    return r;
}

bool Library::removeBook(const std::string& bookId) {
    if (!catalog.removeBook(bookId)) return false;
    log.record("BOOK_REMOVED", bookId);
    save();
    return true;
}

Result<std::string> Library::addMember(const std::string& name, const std::string& contact) {
    auto r = roster.addMember(name, contact);
    if (!r.ok()) return r;
    log.record("MEMBER_ADDED", *r.value + " '" + name + "'");
    save();
    return r;
}

Result<Date> Library::borrow(const std::string& memberId, const std::string& bookId, Date today) {
    auto r = ledger.borrow(memberId, bookId, today, config.loanDays);
    if (!r.ok()) {
        log.record("BORROW_REJECTED", memberId + " " + bookId + " " + statusName(r.status));
        return r;
    }
    log.record("BORROWED", memberId + " " + bookId + " due " + formatDate(*r.value));
    save();
    return r;
}

Status Library::returnBook(const std::string& memberId, const std::string& bookId) {
    const Status s = ledger.returnBook(memberId, bookId);
    if (s != Status::OK) return s;
    log.record("RETURNED", memberId + " " + bookId);
    save();
    return s;
}

std::vector<Book> Library::searchBooks(const std::string& keyword) const {
    return catalog.searchBooks(keyword);
}

const std::vector<Book>& Library::listBooks() const { return catalog.listBooks(); }
const std::vector<Member>& Library::listMembers() const { return roster.listMembers(); }

std::optional<Member> Library::getMember(const std::string& memberId) const {
    return roster.getMember(memberId);
}

std::optional<Book> Library::getBook(const std::string& bookId) const {
    const Book* b = catalog.findBook(bookId);
    if (!b) return std::nullopt;
    return *b;
}

std::optional<std::vector<BorrowedBook>> Library::memberLoans(const std::string& memberId) const {
    const Member* m = roster.findMember(memberId);
    if (!m) return std::nullopt;
    return m->borrowedBooks;
}

std::vector<MemberLoanCount> Library::borrowSummary() const {
    std::vector<MemberLoanCount> out;
    for (auto& m : roster.listMembers()) {
        out.push_back(MemberLoanCount{m.id, m.name, m.borrowedCount()});
    }
    return out;
}

void Library::save() {
    saveSnapshot(storage, catalog.listBooks(), roster.listMembers());
    log.record("SAVED", std::to_string(catalog.size()) + " books, " +
                        std::to_string(roster.size()) + " members");
}

} // namespace booklend
