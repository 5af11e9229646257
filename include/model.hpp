#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>
#include <utility>

namespace booklend {

using Date = std::chrono::sys_days;

inline constexpr int DEFAULT_LOAN_DAYS = 14;

// --- Dates ---
Date today_utc();
Date addDays(Date base, int d);
Date makeDate(int y, unsigned m, unsigned d);

// YYYY-MM-DD, nothing else
std::string formatDate(Date day);
std::optional<Date> parseDate(const std::string& text);

// --- Outcomes ---
enum class Status { OK, NOT_FOUND, NO_COPIES_AVAILABLE, INVALID_ARGUMENT };

const char* statusName(Status s);

template <typename T>
struct Result {
    Status status{Status::OK};
    std::optional<T> value;

    bool ok() const { return status == Status::OK; }

    static Result success(T v) { return Result{Status::OK, std::move(v)}; }
    static Result failure(Status s) { return Result{s, std::nullopt}; }
};

// --- Entities ---
struct Loan {
    std::string memberId;
    Date borrowDate;
    Date dueDate;
};

struct Book {
    std::string id;
    std::string title;
    std::string author;
    int totalCopies{1};
    std::vector<Loan> activeLoans; // borrow order

    int availableCopies() const;
};

// mirror of a Loan on the member side
struct BorrowedBook {
    std::string bookId;
    Date borrowDate;
    Date dueDate;
};

struct Member {
    std::string id;
    std::string name;
    std::string contact;
    std::vector<BorrowedBook> borrowedBooks;

    std::size_t borrowedCount() const { return borrowedBooks.size(); }
};

bool operator==(const Loan& a, const Loan& b);
bool operator==(const BorrowedBook& a, const BorrowedBook& b);

} // namespace booklend
