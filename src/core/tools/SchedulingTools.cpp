#include "SchedulingTools.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace json = boost::json;

namespace voxbridge {

namespace {

// --- JSON Helpers ---

template <class T>
T require(const json::object& obj, const char* key) {
    if (!obj.contains(key)) {
        throw std::runtime_error(std::string("Missing required argument: ") + key);
    }
    try {
        return json::value_to<T>(obj.at(key));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse argument '") + key + "': " + e.what());
    }
}

// The model sends numbers as int or double depending on its mood.
unsigned int get_minutes_or(const json::object& obj, const char* key, unsigned int default_val) {
    const auto* v = obj.if_contains(key);
    if (v == nullptr || v->is_null()) return default_val;
    if (v->is_int64() && v->as_int64() > 0) return static_cast<unsigned int>(v->as_int64());
    if (v->is_uint64()) return static_cast<unsigned int>(v->as_uint64());
    if (v->is_double() && v->as_double() > 0) return static_cast<unsigned int>(v->as_double());
    return default_val;
}

json::array to_array(const std::vector<std::string>& values) {
    json::array out;
    for (const auto& v : values) {
        out.emplace_back(v);
    }
    return out;
}

// --- Handlers ---

boost::asio::awaitable<json::object> CheckAvailability(std::shared_ptr<ISchedulingBackend> backend,
                                                       json::object args) {
    auto date = require<std::string>(args, "date");
    auto resource = require<std::string>(args, "resource");

    AvailabilityResult availability = co_await backend->CheckAvailability(date, resource);

    json::object result;
    result["status"] = "success";
    result["date"] = date;
    result["resource"] = resource;
    result["busy_slots"] = to_array(availability.busy_slots);
    result["free_slots"] = to_array(availability.free_slots);
    if (!availability.message.empty()) {
        result["message"] = availability.message;
    }
    co_return result;
}

boost::asio::awaitable<json::object> CreateBooking(std::shared_ptr<ISchedulingBackend> backend,
                                                   json::object args) {
    BookingRequest request;
    request.start_time = require<std::string>(args, "startTime");
    request.resource = require<std::string>(args, "resource");
    const auto service = require<std::string>(args, "service");
    const auto client_name = require<std::string>(args, "clientName");
    request.duration_minutes = get_minutes_or(args, "durationMinutes", 0);
    request.summary = service + " - " + client_name;
    request.description = "Booked by phone assistant. Client: " + client_name;

    BookingResult booking = co_await backend->CreateBooking(std::move(request));

    json::object result;
    result["success"] = booking.success;
    if (booking.success) {
        result["message"] = booking.message;
    } else {
        result["error"] = booking.error.empty() ? std::string{"Booking rejected"} : booking.error;
    }
    co_return result;
}

// --- Declarations ---

ToolParameter resource_parameter(const std::vector<std::string>& resources) {
    ToolParameter p;
    p.name = "resource";
    p.description = "Who the appointment is with.";
    if (!resources.empty()) {
        p.type = ParamType::Enum;
        p.enum_values = resources;
    }
    return p;
}

ToolDeclaration check_availability_declaration(const std::vector<std::string>& resources) {
    ToolDeclaration d;
    d.name = CHECK_AVAILABILITY_TOOL;
    d.description =
        "Checks which appointment slots are free for a resource on a given date. "
        "Use this before booking.";
    d.parameters.push_back({"date", ParamType::String, "The date to check in YYYY-MM-DD format."});
    d.parameters.push_back(resource_parameter(resources));
    return d;
}

ToolDeclaration create_booking_declaration(const std::vector<std::string>& resources) {
    ToolDeclaration d;
    d.name = CREATE_BOOKING_TOOL;
    d.description = "Books an appointment. Check availability for the slot first.";
    d.mutates_schedule = true;
    d.parameters.push_back({"startTime", ParamType::String,
                            "Start of the appointment in ISO 8601 format, e.g. 2024-07-28T14:30:00."});
    d.parameters.push_back(resource_parameter(resources));
    d.parameters.push_back({"service", ParamType::String, "The requested service, e.g. haircut."});
    d.parameters.push_back({"clientName", ParamType::String, "The client's full name."});

    ToolParameter duration{"durationMinutes", ParamType::Number,
                           "Length of the appointment in minutes, if the client asked for one."};
    duration.required = false;
    d.parameters.push_back(std::move(duration));
    return d;
}

}  // namespace

void RegisterSchedulingTools(ToolDispatcher& dispatcher, std::shared_ptr<ISchedulingBackend> backend) {
    if (!backend) {
        throw std::invalid_argument("RegisterSchedulingTools: backend is null");
    }

    const auto resources = backend->Resources();

    // Plain lambdas forwarding to coroutine functions: the backend pointer is
    // copied into each coroutine frame instead of living in the closure.
    dispatcher.Register(check_availability_declaration(resources), [backend](json::object args) {
        return CheckAvailability(backend, std::move(args));
    });
    dispatcher.Register(create_booking_declaration(resources), [backend](json::object args) {
        return CreateBooking(backend, std::move(args));
    });

    spdlog::info("Scheduling tools registered ({} resources)", resources.size());
}

}  // namespace voxbridge
