#pragma once

#include "history_manager.hpp"
#include "tool_catalog.hpp"
#include "../backend/ILanguageModel.hpp"
#include "../cancellation.hpp"
#include "../log.hpp"
#include "../protocol/protocol_client.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace vine {
namespace engine {

/// Instruction prepended to every model request unless overridden.
inline const char* default_system_instruction() {
    return "You are a developer tooling assistant that answers questions about software "
           "packages, their documentation and their versions.\n\n"
           "Capability categories available through tools:\n"
           "- documentation and package search\n"
           "- package version lookup\n"
           "- API reference retrieval\n"
           "- documentation indexing\n\n"
           "Pick the tools that fit the user's question, call them with arguments matching "
           "their schemas, and base your answer on their results.";
}

/**
 * @brief Parse serialized tool arguments into a JSON object
 *
 * Empty or whitespace-only text means no arguments ({}). Anything that is
 * not a JSON object is an ArgumentParseError.
 */
inline Expected<nlohmann::json> parse_tool_arguments(const std::string& arguments) {
    if (arguments.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json::object();
    }
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(arguments);
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::ArgumentParseError, "Tool arguments are not valid JSON", e.what()});
    }
    if (!parsed.is_object()) {
        return tl::unexpected(Error{
            ErrorCode::ArgumentParseError, "Tool arguments must be a JSON object", parsed.type_name()
        });
    }
    return parsed;
}

/**
 * @brief Error marker recorded as a tool result:
 *        {"error":{"code":"ToolNotFound","message":"...","context":"..."}}
 */
inline std::string format_tool_error(const Error& error) {
    nlohmann::json detail = {
        {"code", error_code_to_string(error.code)},
        {"message", error.message}
    };
    if (error.context.has_value()) {
        detail["context"] = *error.context;
    }
    return nlohmann::json{{"error", detail}}.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/**
 * @brief Runs one user turn with at most two language-model calls
 *
 * 1. Append the user message.
 * 2. Call the model with the system instruction, the history and the
 *    catalog's tool descriptors.
 * 3. Plain text: append it and finish.
 * 4. Tool requests: append them, dispatch each one in order through
 *    tools/call and append one tool-result message per invocation.
 *    Unknown tools, unparseable arguments and server errors become
 *    error-marker results; they never abort the turn.
 * 5. Call the model once more without tools and append its text.
 *
 * A third model call is never made. A model failure aborts the turn,
 * leaving an assistant error message in history so the next turn starts
 * from a valid sequence.
 *
 * Runs on the client's worker thread; turns are never concurrent.
 */
class Orchestrator {
public:
    struct Options {
        std::string system_instruction = default_system_instruction();
        std::string tool_choice = "auto";
    };

    Orchestrator(std::shared_ptr<backend::ILanguageModel> model,
                 std::shared_ptr<ToolCatalog> catalog,
                 std::shared_ptr<protocol::ProtocolClient> client,
                 std::shared_ptr<HistoryManager> history,
                 Options options = {})
        : model_(std::move(model))
        , catalog_(std::move(catalog))
        , client_(std::move(client))
        , history_(std::move(history))
        , options_(std::move(options)) {}

    Expected<TurnResult> run_turn(const std::string& user_text, const CancellationToken* cancel = nullptr) {
        auto is_cancelled = [cancel]() { return cancel != nullptr && cancel->is_cancelled(); };

        if (is_cancelled()) {
            return tl::unexpected(Error{ErrorCode::RequestCancelled, "Turn cancelled before it started"});
        }

        const auto start_time = std::chrono::steady_clock::now();
        TurnResult result;

        if (auto added = history_->add_message(Message::user(user_text)); !added) {
            return tl::unexpected(added.error());
        }

        // First call: tools offered.
        backend::ModelRequest first;
        first.messages = compose_messages();
        first.tools = catalog_->describe_for_model();
        if (!first.tools.empty()) {
            first.tool_choice = options_.tool_choice;
        }

        ++result.llm_calls;
        auto reply = model_->complete(first, cancel);
        if (!reply) {
            return abort_turn(reply.error());
        }
        result.usage += reply->usage;

        if (!reply->requests_tools()) {
            return finish_turn(std::move(result), reply->text, start_time);
        }

        if (auto added = history_->add_message(Message::assistant_with_tools(reply->text, reply->tool_calls)); !added) {
            return tl::unexpected(added.error());
        }

        for (const auto& invocation : reply->tool_calls) {
            Message tool_message = Message::tool_result(dispatch(invocation), invocation.id);
            if (auto added = history_->add_message(tool_message); !added) {
                return tl::unexpected(added.error());
            }
            result.tool_results.push_back(std::move(tool_message));
        }

        if (is_cancelled()) {
            return abort_turn(Error{ErrorCode::RequestCancelled, "Turn cancelled after tool dispatch"});
        }

        // Second and final call: no tools offered.
        backend::ModelRequest second;
        second.messages = compose_messages();

        ++result.llm_calls;
        auto final_reply = model_->complete(second, cancel);
        if (!final_reply) {
            return abort_turn(final_reply.error());
        }
        result.usage += final_reply->usage;

        std::string text = final_reply->text;
        if (final_reply->requests_tools()) {
            LOG4CPLUS_WARN(log::engine_logger(),
                "Ignoring " << final_reply->tool_calls.size()
                << " tool request(s) from the final model call");
            if (text.empty()) {
                text = "The model asked for more tool calls after receiving tool results; "
                       "only one round of tool calls is made per turn.";
            }
        }
        return finish_turn(std::move(result), text, start_time);
    }

    const Options& options() const { return options_; }

private:
    std::vector<Message> compose_messages() const {
        std::vector<Message> messages;
        messages.push_back(Message::system(options_.system_instruction));
        auto history = history_->get_messages();
        messages.insert(messages.end(),
                        std::make_move_iterator(history.begin()),
                        std::make_move_iterator(history.end()));
        return messages;
    }

    /// Resolve, parse and execute one invocation. Always yields result text.
    std::string dispatch(const ToolInvocation& invocation) {
        auto tool = catalog_->lookup(invocation.name);
        if (!tool) {
            LOG4CPLUS_WARN(log::engine_logger(), "Model requested unknown tool '" << invocation.name << "'");
            return format_tool_error(tool.error());
        }

        auto arguments = parse_tool_arguments(invocation.arguments);
        if (!arguments) {
            LOG4CPLUS_WARN(log::engine_logger(),
                "Bad arguments for '" << invocation.name << "': " << arguments.error().to_string());
            return format_tool_error(arguments.error());
        }

        LOG4CPLUS_DEBUG(log::engine_logger(), "Calling tool '" << invocation.name << "' with " << arguments->dump());
        auto output = client_->call_tool(invocation.name, *arguments);
        if (!output) {
            LOG4CPLUS_WARN(log::engine_logger(),
                "Tool '" << invocation.name << "' failed: " << output.error().to_string());
            return format_tool_error(output.error());
        }
        return output->dump();
    }

    Expected<TurnResult> finish_turn(TurnResult result, const std::string& text,
                                     std::chrono::steady_clock::time_point start_time) {
        if (auto added = history_->add_message(Message::assistant(text)); !added) {
            return tl::unexpected(added.error());
        }
        result.text = text;
        result.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    }

    Expected<TurnResult> abort_turn(const Error& error) {
        LOG4CPLUS_WARN(log::engine_logger(), "Turn aborted: " << error.to_string());
        if (auto added = history_->add_message(Message::assistant("Error: " + error.to_string())); !added) {
            LOG4CPLUS_ERROR(log::engine_logger(), "Could not record turn failure: " << added.error().to_string());
        }
        return tl::unexpected(error);
    }

    std::shared_ptr<backend::ILanguageModel> model_;
    std::shared_ptr<ToolCatalog> catalog_;
    std::shared_ptr<protocol::ProtocolClient> client_;
    std::shared_ptr<HistoryManager> history_;
    Options options_;
};

} // namespace engine
} // namespace vine
