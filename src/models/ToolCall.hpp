#pragma once
#include <string>

#include <boost/json.hpp>

namespace voxbridge::models {

// A function call requested by the AI session.
struct ToolCall {
    std::string id;
    std::string name;
    boost::json::object args;
};

// Result sent back for exactly one ToolCall, matched by id.
struct ToolResponse {
    std::string id;
    std::string name;
    boost::json::object result;
    // Set when a schedule-mutating tool reports success.
    bool schedule_changed = false;
};

}  // namespace voxbridge::models
