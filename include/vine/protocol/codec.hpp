#pragma once

#include "types.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace vine {
namespace protocol {

/**
 * @brief Line codec for requests and responses.
 *
 * Every encoded message is a single line: nlohmann::json::dump() without
 * indentation escapes control characters inside strings, so the output
 * never contains a raw '\n'. Invalid UTF-8 in strings is replaced with
 * U+FFFD instead of throwing. All methods are static and stateless.
 */
class Codec {
public:
    // ========================================================================
    // Encoding
    // ========================================================================

    static std::string encode_request(const Request& request) {
        nlohmann::json j;
        j["jsonrpc"] = request.jsonrpc;
        j["version"] = request.version;
        j["id"] = request.id;
        j["method"] = request.method;
        j["params"] = request.params.is_null() ? nlohmann::json::object() : request.params;
        return dump_line(j);
    }

    static std::string encode_response(const Response& response) {
        nlohmann::json j;
        if (response.jsonrpc.has_value()) {
            j["jsonrpc"] = *response.jsonrpc;
        }
        if (response.version.has_value()) {
            j["version"] = *response.version;
        }
        j["id"] = response.id;
        if (response.result.has_value()) {
            j["result"] = *response.result;
        }
        if (response.error.has_value()) {
            nlohmann::json err;
            err["code"] = response.error->code;
            err["message"] = response.error->message;
            if (response.error->data.has_value()) {
                err["data"] = *response.error->data;
            }
            j["error"] = err;
        }
        return dump_line(j);
    }

    static std::string dump_line(const nlohmann::json& j) {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    // ========================================================================
    // Decoding
    // ========================================================================

    /// Parse one line as a JSON object.
    static Expected<nlohmann::json> parse_line(const std::string& line) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::ParseError, "Malformed JSON on response line", e.what()});
        }
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::ParseError, "Message must be a JSON object", j.type_name()});
        }
        return j;
    }

    /// A server-initiated message carrying a method and no id.
    static bool is_notification(const nlohmann::json& message) {
        return message.contains("method") && !message.contains("id");
    }

    static Expected<Response> decode_response(const std::string& line) {
        auto parsed = parse_line(line);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        return response_from_json(*parsed);
    }

    /**
     * @brief Build a Response from a parsed object
     *
     * The protocol marker and version are optional on input. A null
     * "error" is treated as absent; an error given as a bare string
     * becomes its message. Missing both result and error is a ParseError.
     */
    static Expected<Response> response_from_json(const nlohmann::json& j) {
        Response resp;

        if (j.contains("jsonrpc") && j["jsonrpc"].is_string()) {
            resp.jsonrpc = j["jsonrpc"].get<std::string>();
        }
        if (j.contains("version") && j["version"].is_string()) {
            resp.version = j["version"].get<std::string>();
        }
        if (j.contains("id")) {
            resp.id = j["id"];
        }
        if (j.contains("result")) {
            resp.result = j["result"];
        }
        if (j.contains("error") && !j["error"].is_null()) {
            resp.error = decode_error(j["error"]);
        }

        if (!resp.result.has_value() && !resp.error.has_value()) {
            return tl::unexpected(Error{ErrorCode::ParseError, "Response has neither result nor error"});
        }
        return resp;
    }

    static Expected<Request> decode_request(const std::string& line) {
        auto parsed = parse_line(line);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        const auto& j = *parsed;

        if (!j.contains("method") || !j["method"].is_string()) {
            return tl::unexpected(Error{ErrorCode::ParseError, "Request is missing a string method"});
        }
        if (!j.contains("id") || !j["id"].is_string()) {
            return tl::unexpected(Error{ErrorCode::ParseError, "Request is missing a string id"});
        }

        Request req;
        req.jsonrpc = j.value("jsonrpc", std::string(kProtocolMarker));
        req.version = j.value("version", std::string(kProtocolVersion));
        req.id = j["id"].get<std::string>();
        req.method = j["method"].get<std::string>();
        if (j.contains("params") && !j["params"].is_null()) {
            req.params = j["params"];
        }
        return req;
    }

private:
    static RpcError decode_error(const nlohmann::json& err) {
        RpcError rpc_error;
        if (err.is_object()) {
            if (err.contains("code") && err["code"].is_number_integer()) {
                rpc_error.code = err["code"].get<int>();
            }
            if (err.contains("message")) {
                rpc_error.message = err["message"].is_string()
                    ? err["message"].get<std::string>()
                    : err["message"].dump();
            }
            if (err.contains("data")) {
                rpc_error.data = err["data"];
            }
        } else if (err.is_string()) {
            rpc_error.message = err.get<std::string>();
        } else {
            rpc_error.message = err.dump();
        }
        return rpc_error;
    }
};

} // namespace protocol
} // namespace vine
