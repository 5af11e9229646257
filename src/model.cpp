#include "model.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace booklend {

// ----- Dates -----
Date today_utc() {
    using namespace std::chrono;
    const auto now = floor<days>(system_clock::now());
    return time_point_cast<days>(now);
}

Date addDays(Date base, int d) {
    return base + std::chrono::days(d);
}

Date makeDate(int y, unsigned m, unsigned d) {
    using namespace std::chrono;
    return sys_days{year{y}/month{m}/day{d}};
}

std::string formatDate(Date day) {
    using namespace std::chrono;
    const year_month_day ymd(day);
    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << int(ymd.year()) << "-"
        << std::setw(2) << unsigned(ymd.month()) << "-"
        << std::setw(2) << unsigned(ymd.day());
    return out.str();
}

std::optional<Date> parseDate(const std::string& text) {
    using namespace std::chrono;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }
    const int y = std::stoi(text.substr(0, 4));
    const unsigned m = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    const unsigned d = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    const year_month_day ymd{year{y}, month{m}, day{d}};
    if (!ymd.ok()) return std::nullopt;
    return sys_days{ymd};
}

// ----- Status -----
const char* statusName(Status s) {
    switch (s) {
        case Status::OK:                  return "OK";
        case Status::NOT_FOUND:           return "NOT_FOUND";
        case Status::NO_COPIES_AVAILABLE: return "NO_COPIES_AVAILABLE";
        case Status::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

// ----- Entities -----
int Book::availableCopies() const {
    return totalCopies - static_cast<int>(activeLoans.size());
}

bool operator==(const Loan& a, const Loan& b) {
    return a.memberId == b.memberId && a.borrowDate == b.borrowDate && a.dueDate == b.dueDate;
}

bool operator==(const BorrowedBook& a, const BorrowedBook& b) {
    return a.bookId == b.bookId && a.borrowDate == b.borrowDate && a.dueDate == b.dueDate;
}

} // namespace booklend
