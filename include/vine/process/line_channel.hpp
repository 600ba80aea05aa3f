#pragma once

#include "../types.hpp"
#include <chrono>
#include <string>

namespace vine {
namespace process {

/**
 * @brief Lifecycle of a line channel
 *
 * Idle -> Starting -> Ready -> Closed, with Starting/Ready -> Failed when
 * the peer process dies. Closed and Failed are terminal.
 */
enum class SessionState {
    Idle,      ///< Constructed, nothing launched
    Starting,  ///< Process spawned, grace period running
    Ready,     ///< Usable for request/response traffic
    Closed,    ///< Stopped on request
    Failed     ///< Peer exited or pipes broke; every call fails fast
};

[[nodiscard]] inline const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Starting: return "Starting";
        case SessionState::Ready: return "Ready";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Abstract newline-delimited text channel to a peer.
 *
 * ProcessSession implements this over a child's stdin/stdout; tests
 * substitute a scripted channel.
 *
 * Threading model:
 * - write_line()/read_line() are called by one caller at a time
 *   (ProtocolClient serializes them)
 * - close() may be called from any thread and wakes a blocked read_line()
 */
class ILineChannel {
public:
    virtual ~ILineChannel() = default;

    /// Write @p line followed by a single '\n'. The line must not contain '\n'.
    virtual Expected<void> write_line(const std::string& line) = 0;

    /// Block for the next complete line (terminator stripped) or until @p timeout.
    virtual Expected<std::string> read_line(std::chrono::milliseconds timeout) = 0;

    /// Drop lines that arrived but were never read. Returns the number dropped.
    virtual size_t discard_pending() = 0;

    virtual void close() = 0;

    virtual SessionState state() const = 0;
};

} // namespace process
} // namespace vine
