#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <functional>
#include <atomic>
#include <memory>
#include <future>
#include <cstdint>
#include <tl/expected.hpp>

namespace vine {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by category:
 * - 100-199: Configuration errors
 * - 200-299: Child process / pipe errors
 * - 300-399: Wire protocol errors
 * - 400-499: Tool dispatch errors
 * - 500-599: Language model errors
 * - 600-699: Runtime/request errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    MissingServerCommand = 101,
    InvalidTimeout = 102,

    // Process errors (200-299)
    ProcessLaunchError = 200,
    ProcessExitedPrematurely = 201,
    WriteFailure = 202,
    ReadTimeout = 203,
    SessionNotReady = 204,
    Interrupted = 205,

    // Protocol errors (300-399)
    ParseError = 300,
    ProtocolError = 301,

    // Tool errors (400-499)
    ToolNotFound = 400,
    ArgumentParseError = 401,

    // Language model errors (500-599)
    LanguageModelTransportError = 500,
    LanguageModelFormatError = 501,

    // Runtime errors (600-699)
    ClientNotRunning = 600,
    RequestCancelled = 601,
    QueueFull = 602,
    InvalidMessageSequence = 603,

    // Unknown
    Unknown = 999
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::MissingServerCommand: return "MissingServerCommand";
        case ErrorCode::InvalidTimeout: return "InvalidTimeout";
        case ErrorCode::ProcessLaunchError: return "ProcessLaunchError";
        case ErrorCode::ProcessExitedPrematurely: return "ProcessExitedPrematurely";
        case ErrorCode::WriteFailure: return "WriteFailure";
        case ErrorCode::ReadTimeout: return "ReadTimeout";
        case ErrorCode::SessionNotReady: return "SessionNotReady";
        case ErrorCode::Interrupted: return "Interrupted";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::ToolNotFound: return "ToolNotFound";
        case ErrorCode::ArgumentParseError: return "ArgumentParseError";
        case ErrorCode::LanguageModelTransportError: return "LanguageModelTransportError";
        case ErrorCode::LanguageModelFormatError: return "LanguageModelFormatError";
        case ErrorCode::ClientNotRunning: return "ClientNotRunning";
        case ErrorCode::RequestCancelled: return "RequestCancelled";
        case ErrorCode::QueueFull: return "QueueFull";
        case ErrorCode::InvalidMessageSequence: return "InvalidMessageSequence";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (method name, server detail, exit status)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    /// Renders as "[200 ProcessLaunchError] message | Context: ...".
    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + " " +
                             error_code_to_string(code) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in conversation flow
 */
enum class Role {
    System,     ///< Fixed instruction composed into every model request
    User,       ///< Input from the end user
    Assistant,  ///< Model-generated response or tool request
    ToolResult  ///< Output of one tool invocation
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::ToolResult: return "tool";
    }
    return "unknown";
}

/**
 * @brief One tool invocation requested by the language model
 *
 * Arguments are kept as the serialized JSON text the model produced;
 * they are parsed only when the invocation is dispatched.
 */
struct ToolInvocation {
    std::string id;         ///< Model-assigned correlation id
    std::string name;       ///< Tool name as requested
    std::string arguments;  ///< Serialized argument object

    bool operator==(const ToolInvocation& other) const {
        return id == other.id && name == other.name && arguments == other.arguments;
    }

    bool operator!=(const ToolInvocation& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Single message in conversation history
 *
 * Assistant messages may carry the tool invocations the model requested;
 * tool-result messages carry the id of the invocation they answer.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;                                 ///< Message role
    std::string content;                       ///< Text content of the message
    std::vector<ToolInvocation> tool_calls;    ///< Requested invocations (assistant only)
    std::optional<std::string> tool_call_id;   ///< Invocation id answered (tool results only)

    // Factory methods
    static Message system(std::string content) {
        return Message{Role::System, std::move(content), {}, std::nullopt};
    }

    static Message user(std::string content) {
        return Message{Role::User, std::move(content), {}, std::nullopt};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content), {}, std::nullopt};
    }

    static Message assistant_with_tools(std::string content, std::vector<ToolInvocation> calls) {
        return Message{Role::Assistant, std::move(content), std::move(calls), std::nullopt};
    }

    static Message tool_result(std::string content, std::string tool_call_id) {
        return Message{Role::ToolResult, std::move(content), {}, std::move(tool_call_id)};
    }

    bool requests_tools() const {
        return role == Role::Assistant && !tool_calls.empty();
    }

    // Equality for testing
    bool operator==(const Message& other) const {
        return role == other.role &&
               content == other.content &&
               tool_calls == other.tool_calls &&
               tool_call_id == other.tool_call_id;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Sampling Configuration
// ============================================================================

/**
 * @brief Sampling parameters forwarded to the hosted model
 */
struct SamplingParams {
    float temperature = 0.7f;   ///< Sampling temperature
    int max_tokens = 1024;      ///< Completion length limit (> 0)

    bool operator==(const SamplingParams& other) const {
        return temperature == other.temperature && max_tokens == other.max_tokens;
    }

    bool operator!=(const SamplingParams& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Turn Types
// ============================================================================

/**
 * @brief Token usage reported by the model endpoint, summed over a turn
 */
struct TokenUsage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;

    TokenUsage& operator+=(const TokenUsage& other) {
        prompt_tokens += other.prompt_tokens;
        completion_tokens += other.completion_tokens;
        total_tokens += other.total_tokens;
        return *this;
    }

    bool operator==(const TokenUsage& other) const {
        return prompt_tokens == other.prompt_tokens &&
               completion_tokens == other.completion_tokens &&
               total_tokens == other.total_tokens;
    }

    bool operator!=(const TokenUsage& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Outcome of one user turn
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct TurnResult {
    std::string text;                       ///< Final assistant text
    std::vector<Message> tool_results;      ///< Tool-result messages recorded during the turn
    int llm_calls = 0;                      ///< Number of model calls made (1 or 2)
    TokenUsage usage;                       ///< Summed usage over the model calls
    std::chrono::milliseconds latency_ms{0};

    bool used_tools() const { return !tool_results.empty(); }
};

/// Unique identifier for a submitted turn.
using RequestId = uint64_t;

/**
 * @brief Handle returned from Client::chat()
 */
struct TurnHandle {
    RequestId id;                               ///< Unique turn identifier
    std::future<Expected<TurnResult>> future;   ///< Resolves when the turn completes

    // Move-only (std::future is not copyable)
    TurnHandle() : id(0) {}
    TurnHandle(RequestId id, std::future<Expected<TurnResult>> future)
        : id(id), future(std::move(future)) {}
    TurnHandle(TurnHandle&&) = default;
    TurnHandle& operator=(TurnHandle&&) = default;
    TurnHandle(const TurnHandle&) = delete;
    TurnHandle& operator=(const TurnHandle&) = delete;
};

/**
 * @brief Queued user turn awaiting the worker thread
 *
 * @note Internal to the client; not part of the public API
 */
struct TurnRequest {
    std::string text;                                              ///< User input
    std::shared_ptr<std::promise<Expected<TurnResult>>> promise;   ///< Result delivery
    RequestId id = 0;

    explicit TurnRequest(std::string text)
        : text(std::move(text))
        , promise(std::make_shared<std::promise<Expected<TurnResult>>>())
    {}
};

} // namespace vine
