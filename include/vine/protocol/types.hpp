#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vine {
namespace protocol {

constexpr const char* kProtocolMarker = "2.0";
constexpr const char* kProtocolVersion = "2025-03-26";

// ============================================================================
// Wire Types
// ============================================================================

/**
 * @brief Outbound request, encoded as one JSON object per line.
 *
 * Identifiers are strings (UUIDs) generated fresh for every call.
 */
struct Request {
    std::string jsonrpc = kProtocolMarker;
    std::string version = kProtocolVersion;
    std::string id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const Request& other) const {
        return jsonrpc == other.jsonrpc && version == other.version &&
               id == other.id && method == other.method && params == other.params;
    }

    bool operator!=(const Request& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Error descriptor reported by the server.
 */
struct RpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message && data == other.data;
    }
};

/**
 * @brief Inbound response. Exactly one of result/error is meaningful.
 *
 * The id is kept as raw JSON so that a server echoing a numeric or null
 * id is reported as a mismatch rather than a parse failure.
 */
struct Response {
    std::optional<std::string> jsonrpc;
    std::optional<std::string> version;
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    bool is_error() const { return error.has_value(); }

    bool operator==(const Response& other) const {
        return jsonrpc == other.jsonrpc && version == other.version && id == other.id &&
               result == other.result && error == other.error;
    }
};

// ============================================================================
// Tool Types
// ============================================================================

/**
 * @brief Tool as advertised by the server in tools/list.
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }

    bool operator!=(const ToolDescriptor& other) const {
        return !(*this == other);
    }
};

} // namespace protocol
} // namespace vine
