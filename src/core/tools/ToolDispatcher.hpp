#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>

#include "ToolCall.hpp"

namespace voxbridge {

enum class ParamType { String, Number, Enum };

struct ToolParameter {
    std::string name;
    ParamType type = ParamType::String;
    std::string description;
    std::vector<std::string> enum_values;  // only for ParamType::Enum
    bool required = true;
};

/**
 * @brief What the AI is told about a callable function (name, purpose, argument
 * schema). Serialized into the session setup message.
 */
struct ToolDeclaration {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    // Successful calls change the schedule (observers are told about it).
    bool mutates_schedule = false;

    boost::json::object ToJson() const;
};

// Handlers take the call arguments and return the result payload. They report
// failure by throwing.
using ToolHandler = std::function<boost::asio::awaitable<boost::json::object>(boost::json::object)>;

/**
 * @brief Registry of callable tools and the single entry point for running them.
 * @details
 * **Contract:** `Dispatch` always produces a response carrying the call's id and
 * name. Unknown names and handler exceptions become `{"error": "..."}` results;
 * nothing escapes to the caller.
 * **Thread Safety:** register everything at startup; afterwards the dispatcher is
 * read-only and shared by all call sessions.
 */
class ToolDispatcher {
   public:
    void Register(ToolDeclaration declaration, ToolHandler handler);

    bool Contains(const std::string& name) const;

    // functionDeclarations array for the setup message
    boost::json::array Declarations() const;

    boost::asio::awaitable<models::ToolResponse> Dispatch(models::ToolCall call) const;

   private:
    struct Entry {
        ToolDeclaration declaration;
        ToolHandler handler;
    };

    // Ordered so the declaration list is stable between runs.
    std::map<std::string, Entry> tools_;
};

}  // namespace voxbridge
