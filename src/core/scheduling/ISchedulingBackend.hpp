#pragma once
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace voxbridge {

struct AvailabilityResult {
    std::vector<std::string> busy_slots;  // "HH:MM" start times already taken
    std::vector<std::string> free_slots;  // "HH:MM" bookable start times
    std::string message;
};

struct BookingRequest {
    std::string start_time;          // ISO 8601, offset optional
    unsigned int duration_minutes = 0;  // 0 = backend default
    std::string resource;
    std::string summary;
    std::string description;
};

struct BookingResult {
    bool success = false;
    std::string message;
    std::string error;
};

/**
 * @brief The scheduling system the AI books against.
 * @details
 * The backend owns all business rules (working hours, slot size, resource ->
 * calendar mapping). Implementations are shared by every call session and must be
 * safe to use from several io_context threads at once.
 * Failures (unknown resource, backend unreachable, rejected booking) are thrown as
 * exceptions derived from std::exception.
 */
struct ISchedulingBackend {
    virtual ~ISchedulingBackend() = default;

    virtual boost::asio::awaitable<AvailabilityResult> CheckAvailability(std::string date,
                                                                         std::string resource) = 0;

    virtual boost::asio::awaitable<BookingResult> CreateBooking(BookingRequest request) = 0;

    // Resource names the AI may choose from.
    virtual std::vector<std::string> Resources() const = 0;
};

}  // namespace voxbridge
