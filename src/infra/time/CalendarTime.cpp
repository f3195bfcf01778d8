#include "CalendarTime.hpp"

#include <fmt/format.h>

#include <cctype>
#include <stdexcept>

namespace voxbridge {

namespace {

constexpr int MINUTES_PER_DAY = 24 * 60;

// Reads exactly `digits` decimal digits at `pos`.
int read_number(std::string_view s, size_t pos, size_t digits, std::string_view what) {
    if (pos + digits > s.size()) {
        throw std::invalid_argument(fmt::format("Truncated {}: '{}'", what, s));
    }
    int value = 0;
    for (size_t i = pos; i < pos + digits; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, s));
        }
        value = value * 10 + (s[i] - '0');
    }
    return value;
}

void expect(std::string_view s, size_t pos, char c, std::string_view what) {
    if (pos >= s.size() || s[pos] != c) {
        throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, s));
    }
}

int clock_at(std::string_view s, size_t pos, std::string_view what) {
    const int h = read_number(s, pos, 2, what);
    expect(s, pos + 2, ':', what);
    const int m = read_number(s, pos + 3, 2, what);
    if (h > 23 || m > 59) {
        throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, s));
    }
    return h * 60 + m;
}

std::chrono::year_month_day date_at(std::string_view s, std::string_view what) {
    const int y = read_number(s, 0, 4, what);
    expect(s, 4, '-', what);
    const int mo = read_number(s, 5, 2, what);
    expect(s, 7, '-', what);
    const int d = read_number(s, 8, 2, what);

    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
                                    std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, s));
    }
    return ymd;
}

}  // namespace

int ParseClock(std::string_view hhmm) {
    if (hhmm.size() != 5) {
        throw std::invalid_argument(fmt::format("Invalid time of day: '{}'", hhmm));
    }
    return clock_at(hhmm, 0, "time of day");
}

std::string FormatClock(int minute_of_day) {
    return fmt::format("{:02}:{:02}", minute_of_day / 60, minute_of_day % 60);
}

int ParseUtcOffset(std::string_view offset) {
    if (offset == "Z" || offset == "z") return 0;
    if (offset.size() != 6 || (offset[0] != '+' && offset[0] != '-')) {
        throw std::invalid_argument(fmt::format("Invalid UTC offset: '{}'", offset));
    }
    const int minutes = clock_at(offset, 1, "UTC offset");
    return offset[0] == '-' ? -minutes : minutes;
}

std::chrono::year_month_day ParseDate(std::string_view date) {
    if (date.size() != 10) {
        throw std::invalid_argument(fmt::format("Invalid date: '{}'", date));
    }
    return date_at(date, "date");
}

std::string FormatDate(const std::chrono::year_month_day& date) {
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
}

std::string LocalDateTime::ToString() const {
    return fmt::format("{}T{}:00", FormatDate(date), FormatClock(minute_of_day));
}

LocalDateTime ParseLocalDateTime(std::string_view iso) {
    constexpr std::string_view what = "date-time";
    if (iso.size() < 16) {
        throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, iso));
    }

    LocalDateTime out;
    out.date = date_at(iso, what);
    if (iso[10] != 'T' && iso[10] != 't' && iso[10] != ' ') {
        throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, iso));
    }
    out.minute_of_day = clock_at(iso, 11, what);

    size_t pos = 16;
    if (pos < iso.size() && iso[pos] == ':') {
        const int seconds = read_number(iso, pos + 1, 2, what);
        if (seconds > 60) {
            throw std::invalid_argument(fmt::format("Invalid {}: '{}'", what, iso));
        }
        pos += 3;
        if (pos < iso.size() && iso[pos] == '.') {
            ++pos;
            while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) ++pos;
        }
    }

    if (pos < iso.size()) {
        out.offset_minutes = ParseUtcOffset(iso.substr(pos));
    }
    return out;
}

LocalDateTime AddMinutes(const LocalDateTime& t, int minutes) {
    int total = t.minute_of_day + minutes;
    int day_shift = total / MINUTES_PER_DAY;
    total %= MINUTES_PER_DAY;
    if (total < 0) {
        total += MINUTES_PER_DAY;
        --day_shift;
    }

    LocalDateTime out = t;
    out.date = std::chrono::year_month_day{std::chrono::sys_days{t.date} + std::chrono::days{day_shift}};
    out.minute_of_day = total;
    return out;
}

long long MinutesFromMidnight(const std::chrono::year_month_day& day, const LocalDateTime& t) {
    const long long days = (std::chrono::sys_days{t.date} - std::chrono::sys_days{day}).count();
    return days * MINUTES_PER_DAY + t.minute_of_day;
}

SlotPartition PartitionSlots(int open, int close, int slot_minutes, const std::vector<Interval>& busy) {
    if (slot_minutes <= 0) {
        throw std::invalid_argument("Slot length must be positive");
    }

    SlotPartition out;
    for (int start = open; start + slot_minutes <= close; start += slot_minutes) {
        const int end = start + slot_minutes;
        bool taken = false;
        for (const auto& interval : busy) {
            if (interval.start < end && start < interval.end) {
                taken = true;
                break;
            }
        }
        (taken ? out.busy : out.free).push_back(FormatClock(start));
    }
    return out;
}

}  // namespace voxbridge
