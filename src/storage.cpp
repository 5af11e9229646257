#include "storage.hpp"
#include <fstream>
#include <utility>

namespace booklend {

using nlohmann::json;

namespace {

Date dateField(const json& j, const char* key) {
    const std::string text = j.at(key).get<std::string>();
    auto parsed = parseDate(text);
    if (!parsed) {
        throw StorageError("MALFORMED_STORAGE: bad date '" + text + "' in field " + key);
    }
    return *parsed;
}

} // namespace

// ----- Loan -----
void to_json(json& j, const Loan& loan) {
    j = json{{"member_id", loan.memberId},
             {"borrow_date", formatDate(loan.borrowDate)},
             {"due_date", formatDate(loan.dueDate)}};
}

void from_json(const json& j, Loan& loan) {
    j.at("member_id").get_to(loan.memberId);
    loan.borrowDate = dateField(j, "borrow_date");
    loan.dueDate    = dateField(j, "due_date");
}

// ----- Book -----
void to_json(json& j, const Book& book) {
    j = json{{"book_id", book.id},
             {"title", book.title},
             {"author", book.author},
             {"total_copies", book.totalCopies},
             {"borrowed_records", book.activeLoans}};
}

void from_json(const json& j, Book& book) {
    j.at("book_id").get_to(book.id);
    j.at("title").get_to(book.title);
    j.at("author").get_to(book.author);
    j.at("total_copies").get_to(book.totalCopies);
    book.activeLoans.clear();
    if (j.contains("borrowed_records")) {
        j.at("borrowed_records").get_to(book.activeLoans);
    }
}

// ----- BorrowedBook -----
void to_json(json& j, const BorrowedBook& entry) {
    j = json{{"book_id", entry.bookId},
             {"borrow_date", formatDate(entry.borrowDate)},
             {"due_date", formatDate(entry.dueDate)}};
}

void from_json(const json& j, BorrowedBook& entry) {
    j.at("book_id").get_to(entry.bookId);
    entry.borrowDate = dateField(j, "borrow_date");
    entry.dueDate    = dateField(j, "due_date");
}

// ----- Member -----
void to_json(json& j, const Member& member) {
    j = json{{"member_id", member.id},
             {"name", member.name},
             {"contact", member.contact},
             {"borrowed_books", member.borrowedBooks}};
}

void from_json(const json& j, Member& member) {
    j.at("member_id").get_to(member.id);
    j.at("name").get_to(member.name);
    member.contact = j.value("contact", std::string());
    member.borrowedBooks.clear();
    if (j.contains("borrowed_books")) {
        j.at("borrowed_books").get_to(member.borrowedBooks);
    }
}

// ----- FileJsonStorage -----
FileJsonStorage::FileJsonStorage(std::filesystem::path booksPath, std::filesystem::path membersPath)
    : booksPath_(std::move(booksPath)), membersPath_(std::move(membersPath)) {}

json FileJsonStorage::loadBooks() { return readArray(booksPath_); }
json FileJsonStorage::loadMembers() { return readArray(membersPath_); }
void FileJsonStorage::saveBooks(const json& books) { writeArray(booksPath_, books); }
void FileJsonStorage::saveMembers(const json& members) { writeArray(membersPath_, members); }

json FileJsonStorage::readArray(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return json::array();
    std::ifstream in(path);
    if (!in) throw StorageError("STORAGE_UNREADABLE: " + path.string());
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw StorageError("MALFORMED_STORAGE: " + path.string() + ": " + e.what());
    }
}

void FileJsonStorage::writeArray(const std::filesystem::path& path, const json& j) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw StorageError("STORAGE_UNWRITABLE: " + path.string());
    out << j.dump(2) << "\n";
    if (!out) throw StorageError("STORAGE_UNWRITABLE: " + path.string());
}

// ----- Snapshot -----
Snapshot loadSnapshot(IStorage& storage) {
    const json books = storage.loadBooks();
    const json members = storage.loadMembers();
    if (!books.is_array())   throw StorageError("MALFORMED_STORAGE: books collection is not an array");
    if (!members.is_array()) throw StorageError("MALFORMED_STORAGE: members collection is not an array");

    Snapshot snap;
    try {
        books.get_to(snap.books);
        members.get_to(snap.members);
    } catch (const json::exception& e) {
        throw StorageError(std::string("MALFORMED_STORAGE: ") + e.what());
    }
    return snap;
}

void saveSnapshot(IStorage& storage, const std::vector<Book>& books, const std::vector<Member>& members) {
    storage.saveBooks(json(books));
    storage.saveMembers(json(members));
}

} // namespace booklend
