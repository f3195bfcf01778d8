#include "GoogleCalendarClient.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/url.hpp>
#include <stdexcept>

#include "Errors.hpp"
#include "HttpsRequest.hpp"

namespace urls = boost::urls;

namespace voxbridge {

namespace {

constexpr int MINUTES_PER_DAY = 24 * 60;

// Refresh this long before Google says the token expires.
constexpr auto TOKEN_EXPIRY_MARGIN = std::chrono::seconds(60);

std::string format_offset(int minutes) {
    const char sign = minutes < 0 ? '-' : '+';
    const int abs = minutes < 0 ? -minutes : minutes;
    return fmt::format("{}{:02}:{:02}", sign, abs / 60, abs % 60);
}

std::string form_encode(std::initializer_list<std::pair<std::string_view, std::string_view>> fields) {
    urls::url u;
    auto params = u.params();
    for (const auto& [key, value] : fields) {
        params.append({key, value});
    }
    return std::string(u.encoded_query());
}

// Reads event.start / event.end, which hold either dateTime or (all-day) date,
// as wall-clock minutes from `day`'s midnight.
std::optional<long long> event_bound(const json::object& event, const char* key,
                                     const std::chrono::year_month_day& day) {
    const auto* bound = event.if_contains(key);
    if (bound == nullptr || !bound->is_object()) return std::nullopt;
    const auto& obj = bound->as_object();

    if (const auto* dt = obj.if_contains("dateTime"); dt != nullptr && dt->is_string()) {
        return MinutesFromMidnight(day, ParseLocalDateTime(dt->as_string()));
    }
    if (const auto* d = obj.if_contains("date"); d != nullptr && d->is_string()) {
        LocalDateTime midnight;
        midnight.date = ParseDate(d->as_string());
        return MinutesFromMidnight(day, midnight);
    }
    return std::nullopt;
}

}  // namespace

GoogleCalendarClient::GoogleCalendarClient(std::shared_ptr<ssl::context> tls, CalendarConfig cfg)
    : tls_(std::move(tls)), cfg_(std::move(cfg)) {
    try {
        opening_ = ParseClock(cfg_.opening_time);
        closing_ = ParseClock(cfg_.closing_time);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("calendar: ") + e.what());
    }
    if (opening_ >= closing_) {
        throw ConfigError("calendar: opening_time must be before closing_time");
    }
    if (cfg_.refresh_token.empty()) {
        spdlog::warn("[Calendar] No refresh token configured; scheduling tools will fail");
    }
}

std::vector<std::string> GoogleCalendarClient::Resources() const {
    std::vector<std::string> names;
    names.reserve(cfg_.resources.size());
    for (const auto& r : cfg_.resources) {
        names.push_back(r.name);
    }
    return names;
}

const std::string& GoogleCalendarClient::calendar_id(const std::string& resource) const {
    auto it = std::find_if(cfg_.resources.begin(), cfg_.resources.end(),
                           [&](const CalendarResource& r) { return r.name == resource; });
    if (it == cfg_.resources.end()) {
        throw SchedulingError(fmt::format("Resource \"{}\" not found.", resource));
    }
    return it->calendar_id;
}

// =========================================================
//  Auth
// =========================================================

asio::awaitable<std::string> GoogleCalendarClient::access_token() {
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        if (!token_.empty() && std::chrono::steady_clock::now() < token_expiry_) {
            co_return token_;
        }
    }

    if (cfg_.refresh_token.empty() || cfg_.client_id.empty()) {
        throw SchedulingError("Calendar credentials are not configured");
    }

    http::request<http::string_body> req{http::verb::post, "/token", 11};
    req.set(http::field::content_type, "application/x-www-form-urlencoded");
    req.body() = form_encode({{"grant_type", "refresh_token"},
                              {"client_id", cfg_.client_id},
                              {"client_secret", cfg_.client_secret},
                              {"refresh_token", cfg_.refresh_token}});

    auto res = co_await HttpsRequest(*tls_, cfg_.token_host, cfg_.port, std::move(req));
    if (res.result() != http::status::ok) {
        spdlog::error("[Calendar] Token refresh failed [{}]: {}", res.result_int(), res.body());
        throw SchedulingError(fmt::format("Token refresh failed ({})", res.result_int()));
    }

    boost::system::error_code ec;
    auto body = json::parse(res.body(), ec);
    if (ec || !body.is_object() || !body.as_object().contains("access_token")) {
        throw SchedulingError("Token endpoint returned an unexpected body");
    }
    const auto& obj = body.as_object();
    std::string token(obj.at("access_token").as_string());

    std::chrono::seconds lifetime{3600};
    if (const auto* exp = obj.if_contains("expires_in"); exp != nullptr && exp->is_int64()) {
        lifetime = std::chrono::seconds(exp->as_int64());
    }

    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        token_ = token;
        token_expiry_ = std::chrono::steady_clock::now() + lifetime - TOKEN_EXPIRY_MARGIN;
    }
    spdlog::debug("[Calendar] Access token refreshed, valid for {}s", lifetime.count());
    co_return token;
}

asio::awaitable<json::value> GoogleCalendarClient::call_api(http::verb method, std::string target,
                                                            std::string body) {
    const auto token = co_await access_token();

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::authorization, "Bearer " + token);
    req.set(http::field::accept, "application/json");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = std::move(body);
    }

    auto res = co_await HttpsRequest(*tls_, cfg_.api_host, cfg_.port, std::move(req));
    if (res.result_int() == 401) {
        // Revoked early; the next call refreshes.
        std::lock_guard<std::mutex> lock(token_mutex_);
        token_.clear();
    }
    if (res.result_int() < 200 || res.result_int() >= 300) {
        spdlog::error("[Calendar] {} failed [{}]: {}", target.substr(0, target.find('?')), res.result_int(),
                      res.body());
        throw SchedulingError(fmt::format("Calendar API error ({})", res.result_int()));
    }

    boost::system::error_code ec;
    auto parsed = json::parse(res.body(), ec);
    if (ec) {
        throw SchedulingError("Calendar API returned invalid JSON");
    }
    co_return parsed;
}

// =========================================================
//  Availability
// =========================================================

std::vector<Interval> GoogleCalendarClient::BusyIntervals(const json::object& events_list,
                                                          const std::chrono::year_month_day& day) {
    std::vector<Interval> out;
    const auto* items = events_list.if_contains("items");
    if (items == nullptr || !items->is_array()) return out;

    for (const auto& item : items->as_array()) {
        if (!item.is_object()) continue;
        const auto& event = item.as_object();

        if (const auto* status = event.if_contains("status");
            status != nullptr && status->is_string() && status->as_string() == "cancelled") {
            continue;
        }
        if (const auto* transp = event.if_contains("transparency");
            transp != nullptr && transp->is_string() && transp->as_string() == "transparent") {
            continue;
        }

        std::optional<long long> start;
        std::optional<long long> end;
        try {
            start = event_bound(event, "start", day);
            end = event_bound(event, "end", day);
        } catch (const std::invalid_argument& e) {
            spdlog::warn("[Calendar] Skipping event with unreadable times: {}", e.what());
            continue;
        }
        if (!start || !end || *end <= *start) continue;

        const long long rel_start = std::max<long long>(*start, 0);
        const long long rel_end = std::min<long long>(*end, MINUTES_PER_DAY);
        if (rel_start >= rel_end) continue;

        out.push_back({static_cast<int>(rel_start), static_cast<int>(rel_end)});
    }
    return out;
}

asio::awaitable<AvailabilityResult> GoogleCalendarClient::CheckAvailability(std::string date,
                                                                            std::string resource) {
    std::chrono::year_month_day day;
    try {
        day = ParseDate(date);
    } catch (const std::invalid_argument&) {
        throw SchedulingError(fmt::format("Invalid date \"{}\", expected YYYY-MM-DD", date));
    }
    const auto& id = calendar_id(resource);

    // The zone's UTC offset for `day` is unknown here (it moves with DST), so
    // ask for a window wide enough for any offset and let Google render the
    // times in `time_zone`; BusyIntervals clips to the local day.
    const std::chrono::sys_days midnight{day};
    const auto time_min = fmt::format("{}T12:00:00Z", FormatDate(midnight - std::chrono::days{1}));
    const auto time_max = fmt::format("{}T12:00:00Z", FormatDate(midnight + std::chrono::days{1}));

    urls::url target("/calendar/v3/calendars");
    target.segments().push_back(id);
    target.segments().push_back("events");
    target.params().append({"timeMin", time_min});
    target.params().append({"timeMax", time_max});
    target.params().append({"singleEvents", "true"});
    target.params().append({"orderBy", "startTime"});
    target.params().append({"timeZone", cfg_.time_zone});

    spdlog::info("[Calendar] Availability of {} on {}", resource, date);
    auto listing = co_await call_api(http::verb::get, std::string(target.buffer()), {});
    if (!listing.is_object()) {
        throw SchedulingError("Calendar API returned an unexpected listing");
    }

    const auto busy = BusyIntervals(listing.as_object(), day);
    auto slots = PartitionSlots(opening_, closing_, static_cast<int>(cfg_.slot_minutes), busy);

    AvailabilityResult result;
    result.busy_slots = std::move(slots.busy);
    result.free_slots = std::move(slots.free);
    result.message = result.free_slots.empty()
                         ? fmt::format("Fully booked. Open {}-{}.", cfg_.opening_time, cfg_.closing_time)
                         : fmt::format("Open {}-{}.", cfg_.opening_time, cfg_.closing_time);
    co_return result;
}

// =========================================================
//  Booking
// =========================================================

json::object GoogleCalendarClient::BuildEvent(const BookingRequest& request, const LocalDateTime& start,
                                              unsigned int duration_minutes, const std::string& time_zone) {
    const auto end = AddMinutes(start, static_cast<int>(duration_minutes));
    const auto suffix = start.offset_minutes ? format_offset(*start.offset_minutes) : std::string{};

    json::object start_obj;
    start_obj["dateTime"] = start.ToString() + suffix;
    start_obj["timeZone"] = time_zone;

    json::object end_obj;
    end_obj["dateTime"] = end.ToString() + suffix;
    end_obj["timeZone"] = time_zone;

    json::object event;
    event["summary"] = request.summary;
    event["description"] = request.description;
    event["start"] = std::move(start_obj);
    event["end"] = std::move(end_obj);
    return event;
}

asio::awaitable<BookingResult> GoogleCalendarClient::CreateBooking(BookingRequest request) {
    LocalDateTime start;
    try {
        start = ParseLocalDateTime(request.start_time);
    } catch (const std::invalid_argument&) {
        throw SchedulingError(fmt::format("Invalid start time \"{}\"", request.start_time));
    }
    const auto& id = calendar_id(request.resource);
    const unsigned int duration = request.duration_minutes > 0 ? request.duration_minutes : cfg_.booking_minutes;

    urls::url target("/calendar/v3/calendars");
    target.segments().push_back(id);
    target.segments().push_back("events");

    const auto event = BuildEvent(request, start, duration, cfg_.time_zone);
    spdlog::info("[Calendar] Booking {} with {} at {}", request.summary, request.resource, start.ToString());
    auto created = co_await call_api(http::verb::post, std::string(target.buffer()), json::serialize(event));

    BookingResult result;
    result.success = true;
    result.message = fmt::format("Appointment booked with {} on {} at {}.", request.resource,
                                 FormatDate(start.date), FormatClock(start.minute_of_day));
    if (created.is_object()) {
        if (const auto* link = created.as_object().if_contains("htmlLink"); link != nullptr && link->is_string()) {
            spdlog::debug("[Calendar] Created {}", std::string(link->as_string()));
        }
    }
    co_return result;
}

}  // namespace voxbridge
