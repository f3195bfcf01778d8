#pragma once
#include <stdexcept>

namespace voxbridge {

// A single telephony or AI message that cannot be used. The session drops it and
// carries on.
struct MalformedFrameError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The configuration file or environment holds a value the service cannot use.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The scheduling backend could not answer (network, auth, unknown resource...).
struct SchedulingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}  // namespace voxbridge
