#include "fileserve/core/http_date.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace fileserve::http_date {

namespace {

constexpr std::array<std::string_view, 7> kDays = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

constexpr std::array<std::string_view, 7> kLongDays = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

constexpr std::array<std::string_view, 12> kMonths = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Consumes fixed tokens and digit runs from the front of a string_view
class Cursor {
    std::string_view s_;

public:
    explicit Cursor(std::string_view s) : s_(s) {}

    bool done() const noexcept { return s_.empty(); }

    bool literal(std::string_view lit) {
        if (s_.substr(0, lit.size()) != lit) return false;
        s_.remove_prefix(lit.size());
        return true;
    }

    // Exactly n digits
    std::optional<int> digits(size_t n) {
        if (s_.size() < n) return std::nullopt;
        int value = 0;
        for (size_t i = 0; i < n; ++i) {
            char c = s_[i];
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + (c - '0');
        }
        s_.remove_prefix(n);
        return value;
    }

    // Index of the first table entry that prefixes the input
    template<size_t N>
    std::optional<int> one_of(const std::array<std::string_view, N>& table) {
        for (size_t i = 0; i < N; ++i) {
            if (literal(table[i])) return static_cast<int>(i);
        }
        return std::nullopt;
    }

    // "HH:MM:SS"
    std::optional<std::chrono::seconds> time_of_day() {
        auto h = digits(2);
        if (!h || !literal(":")) return std::nullopt;
        auto m = digits(2);
        if (!m || !literal(":")) return std::nullopt;
        auto s = digits(2);
        if (!s) return std::nullopt;
        if (*h > 23 || *m > 59 || *s > 60) return std::nullopt;
        return std::chrono::hours(*h) + std::chrono::minutes(*m) + std::chrono::seconds(*s);
    }
};

std::optional<FileTime> make_time(int year, int month_index, int day, std::chrono::seconds tod) {
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year},
                       std::chrono::month{static_cast<unsigned>(month_index + 1)},
                       std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return FileTime(sys_days(ymd).time_since_epoch() + tod);
}

// Sun, 06 Nov 1994 08:49:37 GMT
std::optional<FileTime> parse_imf_fixdate(std::string_view text) {
    Cursor c(text);
    if (!c.one_of(kDays) || !c.literal(", ")) return std::nullopt;
    auto day = c.digits(2);
    if (!day || !c.literal(" ")) return std::nullopt;
    auto month = c.one_of(kMonths);
    if (!month || !c.literal(" ")) return std::nullopt;
    auto year = c.digits(4);
    if (!year || !c.literal(" ")) return std::nullopt;
    auto tod = c.time_of_day();
    if (!tod || !c.literal(" GMT") || !c.done()) return std::nullopt;
    return make_time(*year, *month, *day, *tod);
}

// Sunday, 06-Nov-94 08:49:37 GMT
std::optional<FileTime> parse_rfc850(std::string_view text) {
    Cursor c(text);
    if (!c.one_of(kLongDays) || !c.literal(", ")) return std::nullopt;
    auto day = c.digits(2);
    if (!day || !c.literal("-")) return std::nullopt;
    auto month = c.one_of(kMonths);
    if (!month || !c.literal("-")) return std::nullopt;
    auto yy = c.digits(2);
    if (!yy || !c.literal(" ")) return std::nullopt;
    auto tod = c.time_of_day();
    if (!tod || !c.literal(" GMT") || !c.done()) return std::nullopt;
    // Two-digit years pivot at 70, matching what UNIX-era clients emit
    int year = *yy < 70 ? 2000 + *yy : 1900 + *yy;
    return make_time(year, *month, *day, *tod);
}

// Sun Nov  6 08:49:37 1994
std::optional<FileTime> parse_asctime(std::string_view text) {
    Cursor c(text);
    if (!c.one_of(kDays) || !c.literal(" ")) return std::nullopt;
    auto month = c.one_of(kMonths);
    if (!month || !c.literal(" ")) return std::nullopt;
    std::optional<int> day;
    if (c.literal(" ")) {
        day = c.digits(1);
    } else {
        day = c.digits(2);
    }
    if (!day || !c.literal(" ")) return std::nullopt;
    auto tod = c.time_of_day();
    if (!tod || !c.literal(" ")) return std::nullopt;
    auto year = c.digits(4);
    if (!year || !c.done()) return std::nullopt;
    return make_time(*year, *month, *day, *tod);
}

} // anonymous namespace

std::string format(FileTime time) {
    auto time_t_val = static_cast<std::time_t>(time.time_since_epoch().count());
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm_val, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

std::optional<FileTime> parse(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }

    if (text.size() > 3 && text[3] == ',') {
        return parse_imf_fixdate(text);
    }
    if (text.find(',') != std::string_view::npos) {
        return parse_rfc850(text);
    }
    return parse_asctime(text);
}

} // namespace fileserve::http_date
