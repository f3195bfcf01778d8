#include "ToolDispatcher.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace json = boost::json;

namespace voxbridge {

namespace {

const char* schema_type(ParamType type) {
    switch (type) {
        case ParamType::Number:
            return "NUMBER";
        case ParamType::String:
        case ParamType::Enum:
            return "STRING";
    }
    return "STRING";
}

json::object error_result(const std::string& message) {
    json::object result;
    result["error"] = message;
    return result;
}

}  // namespace

json::object ToolDeclaration::ToJson() const {
    json::object properties;
    json::array required;

    for (const auto& param : parameters) {
        json::object prop;
        prop["type"] = schema_type(param.type);
        if (!param.description.empty()) {
            prop["description"] = param.description;
        }
        if (param.type == ParamType::Enum && !param.enum_values.empty()) {
            json::array values;
            for (const auto& v : param.enum_values) {
                values.emplace_back(v);
            }
            prop["enum"] = std::move(values);
        }
        properties[param.name] = std::move(prop);

        if (param.required) {
            required.emplace_back(param.name);
        }
    }

    json::object schema;
    schema["type"] = "OBJECT";
    schema["properties"] = std::move(properties);
    schema["required"] = std::move(required);

    json::object j;
    j["name"] = name;
    j["description"] = description;
    j["parameters"] = std::move(schema);
    return j;
}

void ToolDispatcher::Register(ToolDeclaration declaration, ToolHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Tool handler for '" + declaration.name + "' is empty");
    }
    auto name = declaration.name;
    tools_[name] = Entry{std::move(declaration), std::move(handler)};
    spdlog::debug("Registered tool: {}", name);
}

bool ToolDispatcher::Contains(const std::string& name) const {
    return tools_.contains(name);
}

json::array ToolDispatcher::Declarations() const {
    json::array out;
    for (const auto& [name, entry] : tools_) {
        out.push_back(entry.declaration.ToJson());
    }
    return out;
}

boost::asio::awaitable<models::ToolResponse> ToolDispatcher::Dispatch(models::ToolCall call) const {
    models::ToolResponse response;
    response.id = call.id;
    response.name = call.name;

    auto it = tools_.find(call.name);
    if (it == tools_.end()) {
        spdlog::warn("Tool call {} asked for unknown function '{}'", call.id, call.name);
        response.result = error_result("Unknown function: " + call.name);
        co_return response;
    }

    const Entry& entry = it->second;
    try {
        response.result = co_await entry.handler(std::move(call.args));

        if (entry.declaration.mutates_schedule) {
            const auto* success = response.result.if_contains("success");
            response.schedule_changed = success != nullptr && success->is_bool() && success->as_bool();
        }
    } catch (const std::exception& e) {
        spdlog::warn("Tool {} ({}) failed: {}", call.name, call.id, e.what());
        response.result = error_result(e.what());
    }

    co_return response;
}

}  // namespace voxbridge
