#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/json.hpp>

#include "CalendarTime.hpp"
#include "ISchedulingBackend.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace voxbridge {

/**
 * @brief Scheduling backend on top of the Google Calendar v3 REST API.
 * @details
 * **Auth:** OAuth2 refresh-token grant. The access token is cached (guarded by a
 * mutex, since every call session shares this client) until shortly before it
 * expires.
 * **Requests:** one short-lived HTTPS connection per request, run on whichever
 * io_context the calling coroutine lives on.
 * **Time:** events are listed with `timeZone` set to the configured zone, so
 * their dateTime values are already local wall-clock times. The business day
 * ([opening_time, closing_time)) is cut into `slot_minutes` slots; events
 * overlapping a slot make it busy.
 */
class GoogleCalendarClient : public ISchedulingBackend {
   public:
    GoogleCalendarClient(std::shared_ptr<ssl::context> tls, CalendarConfig cfg);

    asio::awaitable<AvailabilityResult> CheckAvailability(std::string date, std::string resource) override;
    asio::awaitable<BookingResult> CreateBooking(BookingRequest request) override;
    std::vector<std::string> Resources() const override;

    // Busy intervals of an events.list response listed in the calendar's time
    // zone, in wall-clock minutes from `day`'s midnight, clipped to that day.
    static std::vector<Interval> BusyIntervals(const boost::json::object& events_list,
                                               const std::chrono::year_month_day& day);

    // events.insert body for a booking that starts at `start`.
    static boost::json::object BuildEvent(const BookingRequest& request, const LocalDateTime& start,
                                          unsigned int duration_minutes, const std::string& time_zone);

   private:
    const std::string& calendar_id(const std::string& resource) const;

    asio::awaitable<std::string> access_token();

    asio::awaitable<boost::json::value> call_api(http::verb method, std::string target, std::string body);

    std::shared_ptr<ssl::context> tls_;
    CalendarConfig cfg_;
    int opening_ = 0;
    int closing_ = 0;

    std::mutex token_mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point token_expiry_{};
};

}  // namespace voxbridge
