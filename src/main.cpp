#include "library.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace booklend;

static std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// false on end of input
static bool readLine(const std::string& prompt, std::string& out) {
    std::cout << prompt;
    if (!std::getline(std::cin, out)) return false;
    out = trim(out);
    return true;
}

static bool readNonEmpty(const std::string& prompt, std::string& out) {
    while (readLine(prompt, out)) {
        if (!out.empty()) return true;
        std::cout << "Input cannot be empty.\n";
    }
    return false;
}

static void printBooks(const std::vector<Book>& books) {
    std::cout << std::left << std::setw(8) << "BookID" << " | " << std::setw(25) << "Title" << " | "
              << std::setw(20) << "Author" << " | " << std::setw(6) << "Avail" << " | "
              << std::setw(5) << "Total" << "\n"
              << std::string(70, '-') << "\n";
    for (auto& b : books) {
        std::cout << std::setw(8) << b.id << " | " << std::setw(25) << b.title << " | "
                  << std::setw(20) << b.author << " | " << std::setw(6) << b.availableCopies() << " | "
                  << std::setw(5) << b.totalCopies << "\n";
    }
}

static void printMembers(const std::vector<Member>& members) {
    std::cout << std::left << std::setw(8) << "MemberID" << " | " << std::setw(20) << "Name" << " | "
              << std::setw(25) << "Contact" << "\n"
              << std::string(60, '-') << "\n";
    for (auto& m : members) {
        std::cout << std::setw(8) << m.id << " | " << std::setw(20) << m.name << " | "
                  << std::setw(25) << m.contact << "\n";
    }
}

static void printSummary(const std::vector<MemberLoanCount>& rows) {
    std::cout << std::left << std::setw(8) << "MemberID" << " | " << std::setw(20) << "Name" << " | "
              << "Borrowed Books\n"
              << std::string(45, '-') << "\n";
    for (auto& r : rows) {
        std::cout << std::setw(8) << r.memberId << " | " << std::setw(20) << r.name << " | "
                  << r.count << "\n";
    }
}

static std::string describe(Status s) {
    switch (s) {
        case Status::NOT_FOUND:           return "Member or Book not found!";
        case Status::NO_COPIES_AVAILABLE: return "No available copies.";
        case Status::INVALID_ARGUMENT:    return "Invalid input.";
        case Status::OK:                  break;
    }
    return "";
}

static void printMenu() {
    std::cout << "\n========== LIBRARY MANAGEMENT ==========\n"
              << "1. View All Books\n"
              << "2. View All Members\n"
              << "3. Add New Book\n"
              << "4. Add New Member\n"
              << "5. Borrow Book\n"
              << "6. Return Book\n"
              << "7. Search Book\n"
              << "8. Remove Book\n"
              << "9. View Member Borrowed Books\n"
              << "10. View Borrow Summary (All Members)\n"
              << "11. Save Data\n"
              << "12. Exit\n"
              << "========================================\n";
}

// returns false when the session is over
static bool runChoice(Library& lib, const std::string& choice) {
    std::string a, b;
    if (choice == "1") {
        std::cout << "\nAll Books:\n";
        printBooks(lib.listBooks());
    } else if (choice == "2") {
        std::cout << "\nAll Members:\n";
        printMembers(lib.listMembers());
    } else if (choice == "3") {
        std::string copies;
        if (!readNonEmpty("Enter book title: ", a) || !readNonEmpty("Enter author name: ", b)) return false;
        if (!readLine("Total copies: ", copies)) return false;
        int n = 1;
        if (!copies.empty()) {
            try { n = std::stoi(copies); }
            catch (const std::exception&) { std::cout << "Invalid number of copies.\n"; return true; }
        }
        auto r = lib.addBook(a, b, n);
        if (r.ok()) std::cout << "Book '" << a << "' added successfully as " << *r.value << "!\n";
        else        std::cout << describe(r.status) << "\n";
    } else if (choice == "4") {
        if (!readNonEmpty("Enter member name: ", a) || !readNonEmpty("Enter contact/email: ", b)) return false;
        auto r = lib.addMember(a, b);
        if (r.ok()) std::cout << "Member '" << a << "' added successfully as " << *r.value << "!\n";
        else        std::cout << describe(r.status) << "\n";
    } else if (choice == "5") {
        if (!readNonEmpty("Enter Member ID: ", a) || !readNonEmpty("Enter Book ID: ", b)) return false;
        auto r = lib.borrow(a, b);
        if (!r.ok()) {
            std::cout << describe(r.status) << "\n";
        } else {
            std::cout << "'" << lib.getBook(b)->title << "' borrowed by " << lib.getMember(a)->name
                      << " till " << formatDate(*r.value) << ".\n";
        }
    } else if (choice == "6") {
        if (!readNonEmpty("Enter Member ID: ", a) || !readNonEmpty("Enter Book ID: ", b)) return false;
        const Status s = lib.returnBook(a, b);
        if (s == Status::OK) std::cout << "'" << lib.getBook(b)->title << "' returned successfully.\n";
        else                 std::cout << describe(s) << "\n";
    } else if (choice == "7") {
        if (!readNonEmpty("Enter keyword: ", a)) return false;
        std::cout << "\nSearch results for '" << a << "':\n";
        for (auto& book : lib.searchBooks(a)) {
            std::cout << book.id << " - " << book.title << " by " << book.author
                      << " (Available: " << book.availableCopies() << ")\n";
        }
    } else if (choice == "8") {
        if (!readNonEmpty("Enter Book ID to remove: ", a)) return false;
        std::cout << (lib.removeBook(a) ? "Book removed successfully.\n" : "Book not found!\n");
    } else if (choice == "9") {
        if (!readNonEmpty("Enter Member ID: ", a)) return false;
        auto loans = lib.memberLoans(a);
        if (!loans) {
            std::cout << "Member not found.\n";
        } else {
            std::cout << "\nBooks borrowed by " << lib.getMember(a)->name << ":\n";
            if (loans->empty()) std::cout << "No books borrowed.\n";
            for (auto& e : *loans) {
                std::cout << "BookID: " << e.bookId << " | Borrowed: " << formatDate(e.borrowDate)
                          << " | Due: " << formatDate(e.dueDate) << "\n";
            }
        }
    } else if (choice == "10") {
        std::cout << "\nBorrow Summary (Member wise):\n";
        printSummary(lib.borrowSummary());
    } else if (choice == "11") {
        lib.save();
        std::cout << "Data saved successfully.\n";
    } else if (choice == "12") {
        return false;
    } else {
        std::cout << "Invalid option.\n";
    }
    return true;
}

int main(int argc, char** argv) {
    LibraryConfig config;
    bool quiet = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--loan-days" && i + 1 < argc) {
            try { config.loanDays = std::stoi(argv[++i]); }
            catch (const std::exception&) { std::cerr << "Invalid --loan-days value\n"; return 2; }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Usage: " << argv[0] << " [data-dir] [--loan-days N] [--quiet]\n";
            return 2;
        } else {
            config.booksFile   = std::filesystem::path(arg) / "books.json";
            config.membersFile = std::filesystem::path(arg) / "members.json";
        }
    }

    ConsoleActivityLog consoleLog;
    NullActivityLog nullLog;
    ActivityLog& log = quiet ? static_cast<ActivityLog&>(nullLog) : consoleLog;

    FileJsonStorage storage(config.booksFile, config.membersFile);
    std::unique_ptr<Library> lib;
    try {
        lib = std::make_unique<Library>(storage, log, config);
    } catch (const StorageError& e) {
        std::cerr << "Cannot load library data: " << e.what() << "\n";
        return 1;
    }

    try {
        std::string choice;
        for (;;) {
            printMenu();
            if (!readLine("Enter choice: ", choice)) break;
            if (!runChoice(*lib, choice)) break;
        }
        lib->save();
    } catch (const StorageError& e) {
        std::cerr << "Cannot save library data: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Goodbye!\n";
    return 0;
}
