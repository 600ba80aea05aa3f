#pragma once

#include "vine/backend/ILanguageModel.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vine {
namespace testing {

/**
 * @brief Mock language model for unit testing
 *
 * Replies are served from a queue in order; once it is empty every call
 * returns default_response as plain text. Every request is captured.
 */
class MockLanguageModel : public backend::ILanguageModel {
public:
    // Configuration
    bool should_fail_initialize = false;
    std::string error_message = "Mock error";
    std::string default_response = "This is a test response.";
    int completion_delay_ms = 0;    ///< Artificial delay, honoring cancellation

    // State tracking
    bool initialized = false;
    backend::LanguageModelConfig last_config;

    Expected<void> initialize(const backend::LanguageModelConfig& config) override {
        if (should_fail_initialize) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, error_message});
        }
        initialized = true;
        last_config = config;
        return {};
    }

    Expected<backend::ModelReply> complete(const backend::ModelRequest& request,
                                           const CancellationToken* cancel = nullptr) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(completion_delay_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel != nullptr && cancel->is_cancelled()) {
                return tl::unexpected(Error{ErrorCode::RequestCancelled, "Model call cancelled"});
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (cancel != nullptr && cancel->is_cancelled()) {
            return tl::unexpected(Error{ErrorCode::RequestCancelled, "Model call cancelled"});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (replies_.empty()) {
            backend::ModelReply reply;
            reply.text = default_response;
            return reply;
        }
        auto reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    // ========================================================================
    // Test helpers
    // ========================================================================

    void enqueue_text(const std::string& text) {
        backend::ModelReply reply;
        reply.text = text;
        enqueue(std::move(reply));
    }

    void enqueue_tool_calls(std::vector<ToolInvocation> calls, const std::string& text = "") {
        backend::ModelReply reply;
        reply.text = text;
        reply.tool_calls = std::move(calls);
        enqueue(std::move(reply));
    }

    void enqueue_error(ErrorCode code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(tl::unexpected(Error{code, message}));
    }

    void enqueue(backend::ModelReply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(std::move(reply));
    }

    std::vector<backend::ModelRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Expected<backend::ModelReply>> replies_;
    std::vector<backend::ModelRequest> requests_;
};

} // namespace testing
} // namespace vine
