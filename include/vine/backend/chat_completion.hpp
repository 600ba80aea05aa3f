#pragma once

#include "ILanguageModel.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace vine {
namespace backend {

// ============================================================================
// Request encoding
// ============================================================================

inline nlohmann::json message_to_json(const Message& message) {
    nlohmann::json j;
    j["role"] = role_to_string(message.role);
    j["content"] = message.content;

    if (message.requests_tools()) {
        nlohmann::json calls = nlohmann::json::array();
        for (const auto& call : message.tool_calls) {
            calls.push_back({
                {"id", call.id},
                {"type", "function"},
                {"function", {
                    {"name", call.name},
                    {"arguments", call.arguments}
                }}
            });
        }
        j["tool_calls"] = std::move(calls);
    }
    if (message.role == Role::ToolResult && message.tool_call_id.has_value()) {
        j["tool_call_id"] = *message.tool_call_id;
    }
    return j;
}

/**
 * @brief Build the /chat/completions body
 *
 * "tools" and "tool_choice" are only present when tools are offered.
 */
inline nlohmann::json build_chat_request(const LanguageModelConfig& config, const ModelRequest& request) {
    nlohmann::json body;
    body["model"] = config.model;
    body["max_tokens"] = config.sampling.max_tokens;
    body["temperature"] = config.sampling.temperature;

    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : request.messages) {
        messages.push_back(message_to_json(message));
    }
    body["messages"] = std::move(messages);

    if (request.tools.is_array() && !request.tools.empty()) {
        body["tools"] = request.tools;
        if (request.tool_choice.has_value()) {
            body["tool_choice"] = *request.tool_choice;
        }
    }
    return body;
}

/// Serialized request body; invalid UTF-8 in any text is replaced with U+FFFD.
inline std::string encode_chat_request(const LanguageModelConfig& config, const ModelRequest& request) {
    return build_chat_request(config, request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// Response decoding
// ============================================================================

namespace detail {

inline Error format_error(std::string message, std::optional<std::string> context = std::nullopt) {
    return Error{ErrorCode::LanguageModelFormatError, std::move(message), std::move(context)};
}

inline int count_field(const nlohmann::json& object, const char* key) {
    if (object.contains(key) && object[key].is_number_integer()) {
        return object[key].get<int>();
    }
    return 0;
}

} // namespace detail

/**
 * @brief Parse a /chat/completions body into a ModelReply
 *
 * Uses choices[0].message. A null content is empty text. Tool-call
 * arguments given as an object are re-serialized; a missing id is
 * replaced with "call_<index>".
 */
inline Expected<ModelReply> parse_chat_response(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(detail::format_error("Model response is not valid JSON", e.what()));
    }

    if (!j.is_object()) {
        return tl::unexpected(detail::format_error("Model response must be a JSON object"));
    }
    if (j.contains("error") && !j["error"].is_null()) {
        const auto& err = j["error"];
        std::string reason = err.is_object() && err.contains("message") && err["message"].is_string()
            ? err["message"].get<std::string>()
            : err.dump();
        return tl::unexpected(detail::format_error("Model endpoint returned an error object", reason));
    }
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return tl::unexpected(detail::format_error("Model response has no choices"));
    }

    const auto& choice = j["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return tl::unexpected(detail::format_error("Model response choice has no message"));
    }
    const auto& message = choice["message"];

    ModelReply reply;
    if (message.contains("content") && message["content"].is_string()) {
        reply.text = message["content"].get<std::string>();
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        reply.finish_reason = choice["finish_reason"].get<std::string>();
    }

    if (message.contains("tool_calls") && !message["tool_calls"].is_null()) {
        const auto& calls = message["tool_calls"];
        if (!calls.is_array()) {
            return tl::unexpected(detail::format_error("tool_calls must be an array"));
        }
        for (size_t i = 0; i < calls.size(); ++i) {
            const auto& call = calls[i];
            if (!call.is_object() || !call.contains("function") || !call["function"].is_object()) {
                return tl::unexpected(detail::format_error("Tool call entry has no function object", call.dump()));
            }
            const auto& function = call["function"];
            if (!function.contains("name") || !function["name"].is_string()) {
                return tl::unexpected(detail::format_error("Tool call function has no name", call.dump()));
            }

            ToolInvocation invocation;
            invocation.name = function["name"].get<std::string>();
            invocation.id = call.contains("id") && call["id"].is_string()
                ? call["id"].get<std::string>()
                : "call_" + std::to_string(i);
            if (function.contains("arguments")) {
                const auto& args = function["arguments"];
                invocation.arguments = args.is_string() ? args.get<std::string>()
                                     : args.is_null() ? std::string()
                                     : args.dump();
            }
            reply.tool_calls.push_back(std::move(invocation));
        }
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        const auto& usage = j["usage"];
        reply.usage.prompt_tokens = detail::count_field(usage, "prompt_tokens");
        reply.usage.completion_tokens = detail::count_field(usage, "completion_tokens");
        reply.usage.total_tokens = detail::count_field(usage, "total_tokens");
    }

    return reply;
}

} // namespace backend
} // namespace vine
