#pragma once

#include "../types.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace vine {
namespace engine {

/**
 * @brief Ordered conversation history with role-sequence validation
 *
 * The system instruction is not stored here; it is composed into every
 * model request by the Orchestrator.
 *
 * Sequence rules enforced by add_message():
 * - no System messages
 * - the first message cannot be a tool result
 * - a tool result must follow an assistant message that requested tools,
 *   or another tool result, and must answer one of those invocations
 * - no consecutive messages with the same role, except tool results
 * - a user message cannot follow unanswered tool requests
 *
 * Thread Safety: Internally synchronized via mutex
 */
class HistoryManager {
public:
    HistoryManager() = default;

    /**
     * @brief Append a message after validating the role sequence
     *
     * @return InvalidMessageSequence if the message may not follow the
     *         current tail
     */
    Expected<void> add_message(Message message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto err = validate_sequence(message); !err) {
            return tl::unexpected(err.error());
        }

        messages_.push_back(std::move(message));
        return {};
    }

    /**
     * @brief Get a copy of all messages
     *
     * Returns by value so the caller holds an independent snapshot.
     */
    std::vector<Message> get_messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Message> messages_;

    // NOTE: Must be called with mutex_ already held.
    Expected<void> validate_sequence(const Message& message) const {
        if (message.role == Role::System) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessageSequence,
                "System instructions are composed per request and not stored in history"
            });
        }

        if (messages_.empty()) {
            if (message.role == Role::ToolResult) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidMessageSequence,
                    "First message cannot be a tool result"
                });
            }
            return {};
        }

        const Message& last = messages_.back();

        if (message.role == Role::ToolResult) {
            const Message* request = pending_tool_request();
            if (request == nullptr) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidMessageSequence,
                    "Tool result must follow an assistant message that requested tools"
                });
            }
            const std::string id = message.tool_call_id.value_or("");
            for (const auto& call : request->tool_calls) {
                if (call.id == id) {
                    return {};
                }
            }
            return tl::unexpected(Error{
                ErrorCode::InvalidMessageSequence,
                "Tool result does not answer any requested invocation",
                id
            });
        }

        if (message.role == last.role) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessageSequence,
                "Cannot have consecutive messages with the same role (except tool results)"
            });
        }

        if (message.role == Role::User && last.requests_tools()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessageSequence,
                "Tool requests must be answered before the next user message"
            });
        }

        return {};
    }

    // The assistant message whose invocations the trailing tool results answer.
    const Message* pending_tool_request() const {
        for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
            if (it->role == Role::ToolResult) {
                continue;
            }
            return it->requests_tools() ? &*it : nullptr;
        }
        return nullptr;
    }
};

} // namespace engine
} // namespace vine
