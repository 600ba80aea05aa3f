#pragma once

#include "codec.hpp"
#include "types.hpp"
#include "../log.hpp"
#include "../process/line_channel.hpp"
#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace vine {
namespace protocol {

/// Random UUID v4 string.
inline std::string generate_uuid() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen);
    uint64_t b = dis(gen);
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

/**
 * @brief Request/response client over a line channel.
 *
 * Exactly one request is in flight at a time: call() holds a mutex from
 * write to matching response, so responses are consumed in issue order
 * and correlation only ever compares against the id just sent.
 *
 * Lines left over from an earlier call that timed out are discarded
 * before the next request is written. Server notifications (a method
 * and no id) arriving while waiting are skipped within the same deadline.
 *
 * Threading: call() is thread-safe; concurrent callers are serialized.
 */
class ProtocolClient {
public:
    using IdGenerator = std::function<std::string()>;

    struct Config {
        std::string client_name = "vine-client";
        std::string client_version = "0.1.0";
        std::vector<std::string> capabilities = {"documentSearch", "versionInfo"};
        std::string protocol_version = kProtocolVersion;
        std::chrono::milliseconds request_timeout{10000};

        Expected<void> validate() const {
            if (client_name.empty()) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "client_name cannot be empty"});
            }
            if (request_timeout.count() <= 0) {
                return tl::unexpected(Error{ErrorCode::InvalidTimeout, "request_timeout must be positive"});
            }
            return {};
        }

        bool operator==(const Config& other) const {
            return client_name == other.client_name &&
                   client_version == other.client_version &&
                   capabilities == other.capabilities &&
                   protocol_version == other.protocol_version &&
                   request_timeout == other.request_timeout;
        }

        bool operator!=(const Config& other) const {
            return !(*this == other);
        }
    };

    explicit ProtocolClient(std::shared_ptr<process::ILineChannel> channel,
                            Config config = {},
                            IdGenerator id_generator = generate_uuid)
        : channel_(std::move(channel))
        , config_(std::move(config))
        , id_generator_(std::move(id_generator)) {}

    // Non-copyable, non-movable (holds a mutex)
    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /**
     * @brief Send one request and wait for its response
     *
     * @param timeout Overrides Config::request_timeout for this call
     * @return The response's result value. Errors:
     *   - ReadTimeout: no matching response before the deadline
     *   - ParseError: malformed JSON, or neither result nor error
     *   - ProtocolError: id mismatch, or server-reported error
     *   - ProcessExitedPrematurely / WriteFailure / Interrupted from the channel
     */
    Expected<nlohmann::json> call(const std::string& method,
                                  nlohmann::json params = nlohmann::json::object(),
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        std::lock_guard<std::mutex> lock(call_mutex_);

        Request request;
        request.version = config_.protocol_version;
        request.id = id_generator_();
        request.method = method;
        request.params = std::move(params);

        size_t stale = channel_->discard_pending();
        if (stale > 0) {
            LOG4CPLUS_DEBUG(log::protocol_logger(), "Discarded " << stale << " stale line(s) before '" << method << "'");
        }

        const std::string line_out = Codec::encode_request(request);
        LOG4CPLUS_DEBUG(log::protocol_logger(), "--> " << line_out);
        auto written = channel_->write_line(line_out);
        if (!written) {
            return tl::unexpected(with_method(written.error(), method));
        }

        const auto limit = timeout.value_or(config_.request_timeout);
        const auto deadline = std::chrono::steady_clock::now() + limit;

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return tl::unexpected(Error{
                    ErrorCode::ReadTimeout,
                    "No response within " + std::to_string(limit.count()) + " ms",
                    method
                });
            }

            auto line = channel_->read_line(remaining);
            if (!line) {
                return tl::unexpected(with_method(line.error(), method));
            }
            LOG4CPLUS_DEBUG(log::protocol_logger(), "<-- " << *line);

            auto message = Codec::parse_line(*line);
            if (!message) {
                LOG4CPLUS_WARN(log::protocol_logger(), "Unparseable response to '" << method << "': " << *line);
                return tl::unexpected(with_method(message.error(), method));
            }

            if (Codec::is_notification(*message)) {
                LOG4CPLUS_DEBUG(log::protocol_logger(), "Skipping server notification: " << *line);
                continue;
            }

            nlohmann::json received_id = message->contains("id") ? (*message)["id"] : nlohmann::json();
            if (!received_id.is_string() || received_id.get<std::string>() != request.id) {
                LOG4CPLUS_WARN(log::protocol_logger(),
                    "Response id " << received_id.dump() << " does not match request id " << request.id);
                return tl::unexpected(Error{
                    ErrorCode::ProtocolError,
                    "Response id does not match the outstanding request",
                    "expected " + request.id + ", got " + received_id.dump()
                });
            }

            auto response = Codec::response_from_json(*message);
            if (!response) {
                return tl::unexpected(with_method(response.error(), method));
            }

            if (response->is_error()) {
                const auto& err = *response->error;
                std::string context = "code " + std::to_string(err.code);
                if (err.data.has_value()) {
                    context += ", data " + err.data->dump();
                }
                return tl::unexpected(Error{
                    ErrorCode::ProtocolError,
                    "Server error for '" + method + "': " + err.message,
                    context
                });
            }

            return *response->result;
        }
    }

    /**
     * @brief Announce the client to the server
     *
     * @return The server's acknowledgement, stored and also returned.
     */
    Expected<nlohmann::json> initialize() {
        nlohmann::json params = {
            {"client_name", config_.client_name},
            {"client_version", config_.client_version},
            {"capabilities", config_.capabilities}
        };

        auto result = call("initialize", params);
        if (!result) {
            return result;
        }

        std::lock_guard<std::mutex> lock(info_mutex_);
        server_ack_ = *result;
        return result;
    }

    /// tools/call; the result is returned exactly as received.
    Expected<nlohmann::json> call_tool(const std::string& name, const nlohmann::json& arguments) {
        return call("tools/call", {{"name", name}, {"arguments", arguments}});
    }

    bool is_initialized() const {
        std::lock_guard<std::mutex> lock(info_mutex_);
        return server_ack_.has_value();
    }

    std::optional<nlohmann::json> server_acknowledgement() const {
        std::lock_guard<std::mutex> lock(info_mutex_);
        return server_ack_;
    }

    const Config& config() const { return config_; }

    const std::shared_ptr<process::ILineChannel>& channel() const { return channel_; }

private:
    static Error with_method(Error error, const std::string& method) {
        if (!error.context.has_value()) {
            error.context = method;
        }
        return error;
    }

    std::shared_ptr<process::ILineChannel> channel_;
    Config config_;
    IdGenerator id_generator_;
    std::mutex call_mutex_;

    mutable std::mutex info_mutex_;
    std::optional<nlohmann::json> server_ack_;
};

} // namespace protocol
} // namespace vine
