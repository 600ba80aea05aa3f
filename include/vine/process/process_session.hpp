#pragma once

#include "line_channel.hpp"
#include "../cancellation.hpp"
#include "../log.hpp"
#include "../types.hpp"

#include "subprocess.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace vine {
namespace process {

/**
 * @brief Supervises one child process speaking newline-delimited text
 *        over its stdin/stdout.
 *
 * The child is spawned with subprocess.h. A single I/O worker thread
 * polls the child's stdout and stderr together with a wake-up pipe:
 * complete stdout lines are queued for read_line(), stderr lines are
 * forwarded to the process logger. Writes happen on the caller's thread
 * through a non-blocking stdin descriptor, bounded by Options::write_timeout
 * and woken by stop().
 *
 * If a CancellationToken is supplied, cancelling it stops the session,
 * which wakes any blocked read_line() with ErrorCode::Interrupted.
 *
 * Threading model:
 * - start() is called once, from the owning thread
 * - write_line()/read_line() are called by one caller at a time
 * - stop() is idempotent and may be called from any thread
 */
class ProcessSession : public ILineChannel {
public:
    struct Options {
        std::chrono::milliseconds startup_grace{2000};      ///< Wait before the post-launch liveness check
        std::chrono::milliseconds shutdown_timeout{5000};   ///< Wait after SIGTERM before force-kill
        std::chrono::milliseconds write_timeout{10000};     ///< Bound on writing one line to stdin

        Expected<void> validate() const {
            if (startup_grace.count() < 0) {
                return tl::unexpected(Error{ErrorCode::InvalidTimeout, "startup_grace must not be negative"});
            }
            if (shutdown_timeout.count() <= 0) {
                return tl::unexpected(Error{ErrorCode::InvalidTimeout, "shutdown_timeout must be positive"});
            }
            if (write_timeout.count() <= 0) {
                return tl::unexpected(Error{ErrorCode::InvalidTimeout, "write_timeout must be positive"});
            }
            return {};
        }

        bool operator==(const Options& other) const {
            return startup_grace == other.startup_grace && shutdown_timeout == other.shutdown_timeout &&
                   write_timeout == other.write_timeout;
        }

        bool operator!=(const Options& other) const {
            return !(*this == other);
        }
    };

    explicit ProcessSession(Options options = {}, std::shared_ptr<CancellationToken> cancel = nullptr)
        : options_(options)
        , cancel_(std::move(cancel)) {
        std::memset(&process_, 0, sizeof(process_));
        if (cancel_) {
            cancel_callback_ = cancel_->on_cancel([this]() { stop(); });
        }
    }

    ~ProcessSession() override {
        if (cancel_ && cancel_callback_ != 0) {
            cancel_->remove_callback(cancel_callback_);
        }
        stop();
    }

    // Non-copyable, non-movable
    ProcessSession(const ProcessSession&) = delete;
    ProcessSession& operator=(const ProcessSession&) = delete;
    ProcessSession(ProcessSession&&) = delete;
    ProcessSession& operator=(ProcessSession&&) = delete;

    /**
     * @brief Launch the child and verify it survives the grace period
     *
     * @return Success only if the child is still running after
     *         Options::startup_grace; ProcessLaunchError otherwise. The
     *         wait ends early if the child closes its stdout.
     */
    Expected<void> start(const std::string& command, const std::vector<std::string>& args = {}) {
        if (command.empty()) {
            return tl::unexpected(Error{ErrorCode::MissingServerCommand, "Server command cannot be empty"});
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Idle) {
                return tl::unexpected(Error{
                    ErrorCode::SessionNotReady,
                    "Session can only be started once",
                    session_state_to_string(state_)
                });
            }
            state_ = SessionState::Starting;
        }

        ignore_sigpipe();

        if (auto launched = launch(command, args); !launched) {
            set_state(SessionState::Failed);
            return tl::unexpected(launched.error());
        }

        LOG4CPLUS_INFO(log::process_logger(), "Spawned '" << command << "' (pid " << process_.child << ")");

        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            lines_cv_.wait_for(lock, options_.startup_grace, [this]() {
                return stdout_eof_ || state_ != SessionState::Starting;
            });
            if (state_ == SessionState::Closed) {
                return tl::unexpected(Error{ErrorCode::Interrupted, "Session stopped during startup"});
            }
        }

        bool output_closed = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            output_closed = stdout_eof_;
        }

        if (output_closed || !child_alive()) {
            teardown();
            set_state(SessionState::Failed);
            return tl::unexpected(Error{
                ErrorCode::ProcessLaunchError,
                "Server process exited during the startup grace period",
                command + " (" + exit_description() + ")"
            });
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Starting) {
            return tl::unexpected(Error{ErrorCode::Interrupted, "Session stopped during startup"});
        }
        state_ = SessionState::Ready;
        return {};
    }

    /**
     * The stdin pipe may be full while the server is not reading. The wait
     * for room is bounded by Options::write_timeout; on expiry the line is
     * left partially written and the session becomes Failed. stop() wakes a
     * waiting writer with ErrorCode::Interrupted.
     */
    Expected<void> write_line(const std::string& line) override {
        if (line.find('\n') != std::string::npos) {
            return tl::unexpected(Error{ErrorCode::WriteFailure, "Line contains an embedded newline"});
        }
        if (auto ready = require_ready(); !ready) {
            return ready;
        }

        std::string payload = line;
        payload.push_back('\n');

        std::string failure;
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (stdin_fd_ < 0) {
                return tl::unexpected(Error{ErrorCode::WriteFailure, "Server stdin is closed"});
            }

            const auto deadline = std::chrono::steady_clock::now() + options_.write_timeout;
            size_t offset = 0;
            while (offset < payload.size()) {
                ssize_t n = ::write(stdin_fd_, payload.data() + offset, payload.size() - offset);
                if (n >= 0) {
                    offset += static_cast<size_t>(n);
                    continue;
                }
                if (errno == EINTR) {
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    failure = std::strerror(errno);
                    break;
                }

                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    failure = "timed out after " + std::to_string(options_.write_timeout.count()) + " ms with " +
                              std::to_string(offset) + " of " + std::to_string(payload.size()) + " bytes written";
                    break;
                }

                // POLLERR on stdin surfaces as EPIPE from the next write.
                struct pollfd fds[2] = {
                    {stdin_fd_, POLLOUT, 0},
                    {wakeup_pipe_[0], POLLIN, 0}
                };
                int ret = ::poll(fds, 2, static_cast<int>(remaining.count()));
                if (ret < 0 && errno != EINTR) {
                    failure = std::strerror(errno);
                    break;
                }
                if (ret > 0 && fds[1].revents != 0) {
                    return tl::unexpected(Error{ErrorCode::Interrupted, "Session was stopped during a write"});
                }
            }
        }

        if (!failure.empty()) {
            LOG4CPLUS_WARN(log::process_logger(), "Write to server stdin failed: " << failure);
            mark_failed();
            return tl::unexpected(Error{ErrorCode::WriteFailure, "Failed to write to server stdin", failure});
        }
        return {};
    }

    /**
     * Lines that were fully received before the child exited are still
     * delivered; once the queue is drained a dead child yields
     * ProcessExitedPrematurely. A timeout leaves the state unchanged.
     */
    Expected<std::string> read_line(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Idle || state_ == SessionState::Starting) {
            return tl::unexpected(Error{
                ErrorCode::SessionNotReady, "Session is not ready", session_state_to_string(state_)
            });
        }

        bool woke = lines_cv_.wait_for(lock, timeout, [this]() {
            return !lines_.empty() ||
                   state_ == SessionState::Closed ||
                   state_ == SessionState::Failed;
        });

        if (!woke) {
            return tl::unexpected(Error{
                ErrorCode::ReadTimeout,
                "No response line within " + std::to_string(timeout.count()) + " ms"
            });
        }
        if (state_ == SessionState::Closed) {
            return tl::unexpected(Error{ErrorCode::Interrupted, "Session was stopped while waiting for a line"});
        }
        if (!lines_.empty()) {
            std::string line = std::move(lines_.front());
            lines_.pop_front();
            return line;
        }

        lock.unlock();
        return tl::unexpected(Error{
            ErrorCode::ProcessExitedPrematurely,
            "Server process exited while waiting for a response",
            exit_description()
        });
    }

    size_t discard_pending() override {
        std::lock_guard<std::mutex> lock(state_mutex_);
        size_t dropped = lines_.size();
        lines_.clear();
        return dropped;
    }

    void close() override {
        stop();
    }

    /**
     * @brief Terminate the child: close stdin, SIGTERM, wait up to
     *        Options::shutdown_timeout, then SIGKILL; release all pipes.
     *
     * Idempotent. A Failed session stays Failed; otherwise the state
     * becomes Closed.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != SessionState::Failed) {
                state_ = SessionState::Closed;
            }
        }
        lines_cv_.notify_all();
        teardown();
    }

    SessionState state() const override {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    bool is_ready() const {
        return state() == SessionState::Ready;
    }

    /// Exit status once the child has been reaped.
    std::optional<int> exit_status() const {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return exit_status_;
    }

    const Options& options() const { return options_; }

private:
    static void ignore_sigpipe() {
        // A write to a dead child must fail with EPIPE instead of killing us.
        static std::once_flag once;
        std::call_once(once, []() {
            struct sigaction current;
            if (sigaction(SIGPIPE, nullptr, &current) == 0 && current.sa_handler == SIG_DFL) {
                std::signal(SIGPIPE, SIG_IGN);
            }
        });
    }

    Expected<void> launch(const std::string& command, const std::vector<std::string>& args) {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

        if (::pipe(wakeup_pipe_) != 0) {
            return tl::unexpected(Error{
                ErrorCode::ProcessLaunchError, "Failed to create wakeup pipe", std::strerror(errno)
            });
        }
        int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
        fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

        // subprocess_create expects a null-terminated array of C strings.
        std::vector<const char*> cmd_parts;
        cmd_parts.reserve(args.size() + 2);
        cmd_parts.push_back(command.c_str());
        for (const auto& arg : args) {
            cmd_parts.push_back(arg.c_str());
        }
        cmd_parts.push_back(nullptr);

        int options = subprocess_option_inherit_environment |
                      subprocess_option_search_user_path;

        int result = subprocess_create(cmd_parts.data(), options, &process_);
        if (result != 0) {
            std::string reason = std::strerror(errno);
            close_wakeup_pipe();
            return tl::unexpected(Error{
                ErrorCode::ProcessLaunchError,
                "Failed to spawn server process: " + command,
                reason
            });
        }
        process_created_ = true;

        auto abandon = [this](std::string message) -> Expected<void> {
            if (process_.child != 0) {
                subprocess_terminate(&process_);
            }
            subprocess_join(&process_, nullptr);
            subprocess_destroy(&process_);
            process_created_ = false;
            if (stdin_fd_ >= 0) {
                ::close(stdin_fd_);
                stdin_fd_ = -1;
            }
            close_wakeup_pipe();
            return tl::unexpected(Error{ErrorCode::ProcessLaunchError, std::move(message)});
        };

        // Writes go through a non-blocking duplicate so a full pipe can be
        // waited on with poll() instead of blocking inside write().
        stdin_fd_ = process_.stdin_file ? ::dup(fileno(process_.stdin_file)) : -1;
        if (stdin_fd_ < 0) {
            return abandon(std::string("Failed to open server stdin: ") + std::strerror(errno));
        }
        int in_flags = fcntl(stdin_fd_, F_GETFL, 0);
        fcntl(stdin_fd_, F_SETFL, in_flags | O_NONBLOCK);

        try {
            io_thread_ = std::thread([this]() { io_loop(); });
        } catch (const std::system_error& e) {
            return abandon(std::string("Failed to start I/O thread: ") + e.what());
        }
        return {};
    }

    void io_loop() {
        int out_fd = process_.stdout_file ? fileno(process_.stdout_file) : -1;
        int err_fd = process_.stderr_file ? fileno(process_.stderr_file) : -1;
        std::string out_buffer;
        std::string err_buffer;
        char chunk[4096];

        while (out_fd >= 0 || err_fd >= 0) {
            struct pollfd fds[3];
            nfds_t count = 0;
            fds[count++] = {wakeup_pipe_[0], POLLIN, 0};
            int out_slot = -1;
            int err_slot = -1;
            if (out_fd >= 0) {
                out_slot = static_cast<int>(count);
                fds[count++] = {out_fd, POLLIN, 0};
            }
            if (err_fd >= 0) {
                err_slot = static_cast<int>(count);
                fds[count++] = {err_fd, POLLIN, 0};
            }

            int ret = ::poll(fds, count, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG4CPLUS_ERROR(log::process_logger(), "poll() failed: " << std::strerror(errno));
                break;
            }

            // Wakeup pipe has data: teardown is in progress.
            if (fds[0].revents != 0) {
                return;
            }

            if (out_slot >= 0 && fds[out_slot].revents != 0) {
                if (!drain(out_fd, chunk, sizeof(chunk), out_buffer, true)) {
                    out_fd = -1;
                    on_stdout_closed();
                }
            }
            if (err_slot >= 0 && fds[err_slot].revents != 0) {
                if (!drain(err_fd, chunk, sizeof(chunk), err_buffer, false)) {
                    err_fd = -1;
                }
            }
        }
    }

    /// Read once from @p fd and dispatch complete lines. Returns false at EOF.
    bool drain(int fd, char* chunk, size_t size, std::string& buffer, bool is_stdout) {
        ssize_t n = ::read(fd, chunk, size);
        if (n < 0) {
            return errno == EINTR || errno == EAGAIN;
        }
        if (n == 0) {
            if (!buffer.empty()) {
                LOG4CPLUS_DEBUG(log::process_logger(),
                    "Dropping unterminated trailing output (" << buffer.size() << " bytes)");
            }
            return false;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);

            // Strip trailing \r (Windows-style line endings)
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }

            if (is_stdout) {
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    lines_.push_back(std::move(line));
                }
                lines_cv_.notify_all();
            } else {
                LOG4CPLUS_DEBUG(log::process_logger(), "[server stderr] " << line);
            }
        }
        return true;
    }

    void on_stdout_closed() {
        bool was_ready = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            stdout_eof_ = true;
            if (state_ == SessionState::Ready) {
                state_ = SessionState::Failed;
                was_ready = true;
            }
        }
        lines_cv_.notify_all();
        if (was_ready) {
            LOG4CPLUS_WARN(log::process_logger(), "Server process closed its stdout");
        }
    }

    Expected<void> require_ready() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        switch (state_) {
            case SessionState::Ready:
                return {};
            case SessionState::Failed:
                return tl::unexpected(Error{
                    ErrorCode::ProcessExitedPrematurely, "Server process is no longer running"
                });
            default:
                return tl::unexpected(Error{
                    ErrorCode::SessionNotReady, "Session is not ready", session_state_to_string(state_)
                });
        }
    }

    void set_state(SessionState state) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = state;
        }
        lines_cv_.notify_all();
    }

    void mark_failed() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == SessionState::Ready || state_ == SessionState::Starting) {
                state_ = SessionState::Failed;
            }
        }
        lines_cv_.notify_all();
    }

    bool child_alive() {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return child_alive_locked();
    }

    // Caller holds io_mutex_. subprocess_alive() reaps an exited child and
    // may close its stdin FILE.
    bool child_alive_locked() {
        if (!process_created_ || process_.child == 0) {
            return false;
        }
        int alive = subprocess_alive(&process_);
        if (alive == 0 && process_.child == 0) {
            exit_status_ = process_.return_status;
        }
        return alive > 0;
    }

    std::string exit_description() {
        std::lock_guard<std::mutex> lock(io_mutex_);
        child_alive_locked();
        if (exit_status_.has_value()) {
            return "exit status " + std::to_string(*exit_status_);
        }
        return "exit status unknown";
    }

    void teardown() {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (!process_created_) {
            return;
        }

        // Wake the I/O worker and any writer waiting for pipe space; a
        // grandchild may still hold the pipes open.
        if (wakeup_pipe_[1] >= 0) {
            char b = 1;
            ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
            (void)ignored;
        }

        // Closing stdin is the polite request to exit.
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (stdin_fd_ >= 0) {
                ::close(stdin_fd_);
                stdin_fd_ = -1;
            }
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (process_.stdin_file) {
                fclose(process_.stdin_file);
                process_.stdin_file = nullptr;
            }
            if (process_.child != 0) {
                ::kill(process_.child, SIGTERM);
            }
        }

        auto deadline = std::chrono::steady_clock::now() + options_.shutdown_timeout;
        bool exited = !child_alive();
        while (!exited && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            exited = !child_alive();
        }

        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!exited && process_.child != 0) {
                LOG4CPLUS_WARN(log::process_logger(),
                    "Server did not exit within " << options_.shutdown_timeout.count()
                    << " ms of SIGTERM, killing pid " << process_.child);
                subprocess_terminate(&process_);
            }
            int status = 0;
            if (subprocess_join(&process_, &status) == 0 && !exit_status_.has_value()) {
                exit_status_ = status;
            }
        }

        if (io_thread_.joinable()) {
            io_thread_.join();
        }

        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            subprocess_destroy(&process_);
            process_created_ = false;
        }
        close_wakeup_pipe();

        LOG4CPLUS_INFO(log::process_logger(), "Server process stopped (" << exit_description() << ")");
    }

    void close_wakeup_pipe() {
        for (int& fd : wakeup_pipe_) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }
    }

    Options options_;
    std::shared_ptr<CancellationToken> cancel_;
    CancellationToken::CallbackId cancel_callback_ = 0;

    struct subprocess_s process_;
    bool process_created_ = false;          // guarded by lifecycle_mutex_ (and io_mutex_ on change)
    std::optional<int> exit_status_;        // guarded by io_mutex_
    mutable std::mutex io_mutex_;           // stdin FILE and child reaping
    std::mutex write_mutex_;                // stdin_fd_ and writers
    std::mutex lifecycle_mutex_;            // launch/teardown
    int stdin_fd_ = -1;
    std::thread io_thread_;
    int wakeup_pipe_[2] = {-1, -1};

    mutable std::mutex state_mutex_;
    std::condition_variable lines_cv_;
    SessionState state_ = SessionState::Idle;
    std::deque<std::string> lines_;
    bool stdout_eof_ = false;
};

} // namespace process
} // namespace vine
