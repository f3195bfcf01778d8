#pragma once

#include <memory>

#include "ISchedulingBackend.hpp"
#include "ToolDispatcher.hpp"

namespace voxbridge {

inline constexpr const char* CHECK_AVAILABILITY_TOOL = "CheckAvailability";
inline constexpr const char* CREATE_BOOKING_TOOL = "CreateBooking";

/**
 * @brief Registers CheckAvailability and CreateBooking against the given backend.
 * Must be called at application startup, before any session is created.
 */
void RegisterSchedulingTools(ToolDispatcher& dispatcher, std::shared_ptr<ISchedulingBackend> backend);

}  // namespace voxbridge
