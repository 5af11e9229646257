#include <catch2/catch_all.hpp>
#include "library.hpp"
#include <algorithm>
#include <vector>

using namespace booklend;
using namespace std;

// captures events instead of printing them
struct TestActivityLog : ActivityLog {
    struct Entry { string event, detail; };
    vector<Entry> out;
    void record(const string& event, const string& detail) override {
        out.push_back({event, detail});
    }
    bool saw(const string& event) const {
        return any_of(out.begin(), out.end(), [&](const Entry& e){ return e.event == event; });
    }
};

static LibraryConfig unseeded() {
    LibraryConfig cfg;
    cfg.seedWhenEmpty = false;
    return cfg;
}

// B0001 (2 copies), B0002 (1 copy); M0001..M0003
static void seedMinimal(Library& lib) {
    lib.addBook("Python Basics", "John Smith", 2);
    lib.addBook("Data Structures", "Mark Allen", 1);
    lib.addMember("Ali Khan", "ali@email.com");
    lib.addMember("Sara Ahmed", "sara@email.com");
    lib.addMember("Syed Asad", "syed@email.com");
}

TEST_CASE("Scenario: two copies, three borrowers, one return") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    auto d = makeDate(2025,10,1);

    auto r1 = lib.borrow("M0001", "B0001", d);
    REQUIRE(r1.ok());
    REQUIRE(*r1.value == addDays(d, 14));
    REQUIRE(lib.getBook("B0001")->availableCopies() == 1);

    REQUIRE(lib.borrow("M0002", "B0001", d).ok());
    REQUIRE(lib.getBook("B0001")->availableCopies() == 0);

    auto r3 = lib.borrow("M0003", "B0001", d);
    REQUIRE(r3.status == Status::NO_COPIES_AVAILABLE);
    REQUIRE_FALSE(r3.value.has_value());

    REQUIRE(lib.returnBook("M0001", "B0001") == Status::OK);
    REQUIRE(lib.getBook("B0001")->availableCopies() == 1);
}

TEST_CASE("Borrow with no copies left changes nothing and does not save") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    auto d = makeDate(2025,10,1);
    REQUIRE(lib.borrow("M0001", "B0002", d).ok());

    const int saves = store.saveCount();
    const auto bookBefore = *lib.getBook("B0002");
    const auto memberBefore = *lib.getMember("M0002");

    REQUIRE(lib.borrow("M0002", "B0002", d).status == Status::NO_COPIES_AVAILABLE);
    REQUIRE(store.saveCount() == saves);
    REQUIRE(lib.getBook("B0002")->activeLoans == bookBefore.activeLoans);
    REQUIRE(lib.getMember("M0002")->borrowedBooks == memberBefore.borrowedBooks);
    REQUIRE(log.saw("BORROW_REJECTED"));
}

TEST_CASE("Borrow with an unknown member or book is NOT_FOUND") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    REQUIRE(lib.borrow("M0099", "B0001").status == Status::NOT_FOUND);
    REQUIRE(lib.borrow("M0001", "B0099").status == Status::NOT_FOUND);
    REQUIRE(lib.getBook("B0001")->activeLoans.empty());
    REQUIRE(lib.getMember("M0001")->borrowedBooks.empty());
}

TEST_CASE("Borrow then return restores availability and clears the mirror") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    auto d = makeDate(2025,12,25);
    const int before = lib.getBook("B0001")->availableCopies();

    REQUIRE(lib.borrow("M0002", "B0001", d).ok());
    auto loans = lib.memberLoans("M0002");
    REQUIRE(loans.has_value());
    REQUIRE(loans->size() == 1);
    REQUIRE((*loans)[0].bookId == "B0001");
    REQUIRE((*loans)[0].borrowDate == d);
    REQUIRE((*loans)[0].dueDate == makeDate(2026,1,8));

    const auto book = *lib.getBook("B0001");
    const auto& bookLoans = book.activeLoans;
    REQUIRE(bookLoans.size() == 1);
    REQUIRE(bookLoans[0].memberId == "M0002");

    REQUIRE(lib.returnBook("M0002", "B0001") == Status::OK);
    REQUIRE(lib.getBook("B0001")->availableCopies() == before);
    REQUIRE(lib.memberLoans("M0002")->empty());
}

TEST_CASE("Return with nothing borrowed is a successful no-op") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    REQUIRE(lib.returnBook("M0001", "B0001") == Status::OK);
    REQUIRE(lib.getBook("B0001")->availableCopies() == 2);
}

TEST_CASE("Return with unknown ids is NOT_FOUND") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    const int saves = store.saveCount();
    REQUIRE(lib.returnBook("M0099", "B0001") == Status::NOT_FOUND);
    REQUIRE(lib.returnBook("M0001", "B0099") == Status::NOT_FOUND);
    REQUIRE(store.saveCount() == saves);
}

TEST_CASE("Same member borrowing twice: one return releases both loans") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    auto d = makeDate(2025,10,1);
    REQUIRE(lib.borrow("M0001", "B0001", d).ok());
    REQUIRE(lib.borrow("M0001", "B0001", d).ok());
    REQUIRE(lib.getBook("B0001")->availableCopies() == 0);
    REQUIRE(lib.getMember("M0001")->borrowedCount() == 2);

    REQUIRE(lib.returnBook("M0001", "B0001") == Status::OK);
    REQUIRE(lib.getBook("B0001")->availableCopies() == 2);
    REQUIRE(lib.getMember("M0001")->borrowedCount() == 0);
}

TEST_CASE("Return only touches the given book and member") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    auto d = makeDate(2025,10,1);
    REQUIRE(lib.borrow("M0001", "B0001", d).ok());
    REQUIRE(lib.borrow("M0001", "B0002", d).ok());
    REQUIRE(lib.borrow("M0002", "B0001", d).ok());

    REQUIRE(lib.returnBook("M0001", "B0001") == Status::OK);
    auto m1 = *lib.getMember("M0001");
    REQUIRE(m1.borrowedBooks.size() == 1);
    REQUIRE(m1.borrowedBooks[0].bookId == "B0002");
    auto b1 = *lib.getBook("B0001");
    REQUIRE(b1.activeLoans.size() == 1);
    REQUIRE(b1.activeLoans[0].memberId == "M0002");
}

TEST_CASE("Available copies always equals total minus active loans") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    lib.addBook("AI Fundamentals", "Andrew Ng", 3);
    auto d = makeDate(2025,10,1);
    lib.borrow("M0001", "B0003", d);
    lib.borrow("M0002", "B0003", d);
    lib.borrow("M0003", "B0001", d);
    lib.returnBook("M0002", "B0003");
    for (auto& b : lib.listBooks()) {
        REQUIRE(b.availableCopies() == b.totalCopies - static_cast<int>(b.activeLoans.size()));
        REQUIRE(b.availableCopies() >= 0);
    }
}

TEST_CASE("Remove unknown book: not found, catalog unchanged") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    const auto size = lib.listBooks().size();
    REQUIRE_FALSE(lib.removeBook("B0099"));
    REQUIRE(lib.listBooks().size() == size);
}

TEST_CASE("Remove book with loans leaves member mirror entries behind") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    REQUIRE(lib.borrow("M0001", "B0001", makeDate(2025,10,1)).ok());
    REQUIRE(lib.removeBook("B0001"));
    REQUIRE_FALSE(lib.getBook("B0001").has_value());
    REQUIRE(lib.getMember("M0001")->borrowedCount() == 1);
    REQUIRE(log.saw("BOOK_REMOVED"));
}

TEST_CASE("Ids stay unique after a removal") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    auto third = lib.addBook("AI Fundamentals", "Andrew Ng", 2);
    REQUIRE(*third.value == "B0003");
    REQUIRE(lib.removeBook("B0002"));
    auto next = lib.addBook("Machine Learning", "Tom Mitchell", 5);
    REQUIRE(next.ok());
    REQUIRE(*next.value == "B0004");
    REQUIRE(lib.listBooks().back().id == "B0004");
}

TEST_CASE("Search: case-insensitive over title or author, stored order") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    lib.addBook("Advanced PYTHON", "Guido", 1);

    auto hits = lib.searchBooks("python");
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].title == "Python Basics");
    REQUIRE(hits[0].author == "John Smith");
    REQUIRE(hits[1].id == "B0003");

    REQUIRE(lib.searchBooks("mark allen").size() == 1);
    REQUIRE(lib.searchBooks("nomatch").empty());
    REQUIRE(lib.searchBooks("").size() == lib.listBooks().size());
}

TEST_CASE("Invalid arguments are rejected without saving") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    const int saves = store.saveCount();
    REQUIRE(lib.addBook("", "Someone", 1).status == Status::INVALID_ARGUMENT);
    REQUIRE(lib.addBook("Title", "   ", 1).status == Status::INVALID_ARGUMENT);
    REQUIRE(lib.addBook("Title", "Someone", 0).status == Status::INVALID_ARGUMENT);
    REQUIRE(lib.addBook("Title", "Someone", -3).status == Status::INVALID_ARGUMENT);
    REQUIRE(lib.addMember("", "x@email.com").status == Status::INVALID_ARGUMENT);
    REQUIRE(store.saveCount() == saves);
    REQUIRE(lib.listBooks().size() == 2);
    REQUIRE(lib.listMembers().size() == 3);
}

TEST_CASE("Ledger rejects a non-positive loan period") {
    Catalog catalog; Roster roster;
    catalog.addBook("Python Basics", "John Smith", 1);
    roster.addMember("Ali Khan", "");
    LendingLedger ledger(catalog, roster);
    REQUIRE(ledger.borrow("M0001", "B0001", makeDate(2025,10,1), 0).status == Status::INVALID_ARGUMENT);
    auto r = ledger.borrow("M0001", "B0001", makeDate(2025,10,1), 30);
    REQUIRE(r.ok());
    REQUIRE(*r.value == makeDate(2025,10,31));
}

TEST_CASE("Configured loan period drives the due date") {
    MemoryStorage store; TestActivityLog log;
    auto cfg = unseeded();
    cfg.loanDays = 7;
    Library lib(store, log, cfg);
    seedMinimal(lib);
    auto r = lib.borrow("M0001", "B0001", makeDate(2024,2,25));
    REQUIRE(r.ok());
    REQUIRE(*r.value == makeDate(2024,3,3));
}

TEST_CASE("Roster lookups and borrowed counts") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    seedMinimal(lib);
    REQUIRE(lib.getMember("M0002")->name == "Sara Ahmed");
    REQUIRE_FALSE(lib.getMember("M0042").has_value());
    REQUIRE_FALSE(lib.memberLoans("M0042").has_value());

    lib.borrow("M0003", "B0001", makeDate(2025,10,1));
    lib.borrow("M0003", "B0002", makeDate(2025,10,1));
    auto summary = lib.borrowSummary();
    REQUIRE(summary.size() == 3);
    REQUIRE(summary[0].memberId == "M0001");
    REQUIRE(summary[0].count == 0);
    REQUIRE(summary[2].name == "Syed Asad");
    REQUIRE(summary[2].count == 2);

    Roster roster;
    roster.addMember("Nida Noor", "nida@email.com");
    REQUIRE(roster.borrowedCountByMember("M0001") == std::optional<std::size_t>(0));
    REQUIRE_FALSE(roster.borrowedCountByMember("M0002").has_value());
}

TEST_CASE("Every successful mutation saves both collections") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log, unseeded());
    REQUIRE(store.saveCount() == 0);
    lib.addBook("Python Basics", "John Smith", 2);
    REQUIRE(store.saveCount() == 2);
    lib.addMember("Ali Khan", "ali@email.com");
    REQUIRE(store.saveCount() == 4);
    lib.borrow("M0001", "B0001", makeDate(2025,10,1));
    REQUIRE(store.saveCount() == 6);
    lib.returnBook("M0001", "B0001");
    REQUIRE(store.saveCount() == 8);
    lib.removeBook("B0001");
    REQUIRE(store.saveCount() == 10);
    REQUIRE(store.loadBooks().empty());
    REQUIRE(store.loadMembers().size() == 1);
}

TEST_CASE("State survives a reload from the same storage") {
    MemoryStorage store; TestActivityLog log;
    vector<Book> books;
    vector<Member> members;
    {
        Library lib(store, log, unseeded());
        seedMinimal(lib);
        lib.borrow("M0001", "B0001", makeDate(2025,10,1));
        lib.borrow("M0003", "B0002", makeDate(2025,12,30));
        books = lib.listBooks();
        members = lib.listMembers();
    }
    Library again(store, log, unseeded());
    REQUIRE(again.listBooks().size() == books.size());
    REQUIRE(again.listMembers().size() == members.size());
    for (size_t i = 0; i < books.size(); ++i) {
        const auto& a = again.listBooks()[i];
        REQUIRE(a.id == books[i].id);
        REQUIRE(a.title == books[i].title);
        REQUIRE(a.author == books[i].author);
        REQUIRE(a.totalCopies == books[i].totalCopies);
        REQUIRE(a.activeLoans == books[i].activeLoans);
    }
    for (size_t i = 0; i < members.size(); ++i) {
        const auto& m = again.listMembers()[i];
        REQUIRE(m.id == members[i].id);
        REQUIRE(m.contact == members[i].contact);
        REQUIRE(m.borrowedBooks == members[i].borrowedBooks);
    }
    REQUIRE(again.getBook("B0002")->activeLoans[0].dueDate == makeDate(2026,1,13));
}

TEST_CASE("Empty storage is seeded with the sample catalog and roster") {
    MemoryStorage store; TestActivityLog log;
    Library lib(store, log);
    REQUIRE(lib.listBooks().size() == 10);
    REQUIRE(lib.listMembers().size() == 12);
    auto first = *lib.getBook("B0001");
    REQUIRE(first.title == "Python Basics");
    REQUIRE(first.totalCopies == 4);
    REQUIRE(lib.getBook("B0010")->title == "Cloud Computing");
    REQUIRE(lib.getMember("M0001")->contact == "ali@email.com");
    REQUIRE(lib.getMember("M0012")->name == "Maha Iqbal");
    REQUIRE(store.loadBooks().size() == 10);
    REQUIRE(store.loadMembers().size() == 12);
    REQUIRE(log.saw("SEEDED"));
}

TEST_CASE("Seeding skips a collection that already has records") {
    MemoryStorage store; TestActivityLog log;
    {
        Library lib(store, log, unseeded());
        lib.addMember("Only Member", "only@email.com");
    }
    Library lib(store, log);
    REQUIRE(lib.listBooks().size() == 10);
    REQUIRE(lib.listMembers().size() == 1);
    REQUIRE(lib.listMembers()[0].name == "Only Member");
}

TEST_CASE("Status names are upper-case codes") {
    REQUIRE(string(statusName(Status::OK)) == "OK");
    REQUIRE(string(statusName(Status::NOT_FOUND)) == "NOT_FOUND");
    REQUIRE(string(statusName(Status::NO_COPIES_AVAILABLE)) == "NO_COPIES_AVAILABLE");
    REQUIRE(string(statusName(Status::INVALID_ARGUMENT)) == "INVALID_ARGUMENT");
}
