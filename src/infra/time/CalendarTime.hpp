#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxbridge {

// Minutes since local midnight: "09:30" -> 570.
int ParseClock(std::string_view hhmm);
std::string FormatClock(int minute_of_day);

// "+02:00" / "-05:30" / "Z" -> signed minutes east of UTC.
int ParseUtcOffset(std::string_view offset);

// Strict YYYY-MM-DD.
std::chrono::year_month_day ParseDate(std::string_view date);
std::string FormatDate(const std::chrono::year_month_day& date);

/**
 * @brief A wall-clock time as it appears in an ISO 8601 string.
 * @details `offset_minutes` is set only when the string carried one ("Z" counts).
 * Seconds and fractions are accepted on input and dropped.
 */
struct LocalDateTime {
    std::chrono::year_month_day date{};
    int minute_of_day = 0;
    std::optional<int> offset_minutes;

    // "YYYY-MM-DDTHH:MM:SS", without an offset
    std::string ToString() const;
};

/**
 * @throws std::invalid_argument if the text is not "YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM]".
 */
LocalDateTime ParseLocalDateTime(std::string_view iso);

// Moves the wall-clock time, rolling over into the next or previous day.
LocalDateTime AddMinutes(const LocalDateTime& t, int minutes);

// Wall-clock minutes from `day`'s midnight to `t`. The offset is not applied;
// negative before `day`, past 1440 after it.
long long MinutesFromMidnight(const std::chrono::year_month_day& day, const LocalDateTime& t);

// [start, end) in minutes relative to a day's local midnight.
struct Interval {
    int start = 0;
    int end = 0;
};

struct SlotPartition {
    std::vector<std::string> busy;  // "HH:MM"
    std::vector<std::string> free;  // "HH:MM"
};

/**
 * @brief Splits [open, close) into slots of `slot_minutes` and sorts each slot
 * into busy (overlaps any interval) or free. A trailing slot that would run past
 * `close` is not offered.
 */
SlotPartition PartitionSlots(int open, int close, int slot_minutes, const std::vector<Interval>& busy);

}  // namespace voxbridge
