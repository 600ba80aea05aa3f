#pragma once

#include "../cancellation.hpp"
#include "../types.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vine {
namespace backend {

/**
 * @brief Connection settings for an OpenAI-compatible chat endpoint
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct LanguageModelConfig {
    std::string base_url = "https://integrate.api.nvidia.com/v1";   ///< Endpoint root; "/chat/completions" is appended
    std::string api_key;                                            ///< Bearer token (required)
    std::string model = "nvidia/llama-3.1-nemotron-70b-instruct";   ///< Model name sent with every request
    SamplingParams sampling;                                        ///< Temperature and completion limit
    std::chrono::milliseconds request_timeout{30000};               ///< Whole-transfer bound per call

    /**
     * @brief Read LLM_API_BASE_URL, LLM_API_KEY and LLM_MODEL_NAME
     *
     * Unset variables keep the defaults above.
     */
    static LanguageModelConfig from_environment() {
        LanguageModelConfig config;
        if (const char* url = std::getenv("LLM_API_BASE_URL"); url != nullptr && *url != '\0') {
            config.base_url = url;
        }
        if (const char* key = std::getenv("LLM_API_KEY"); key != nullptr) {
            config.api_key = key;
        }
        if (const char* model = std::getenv("LLM_MODEL_NAME"); model != nullptr && *model != '\0') {
            config.model = model;
        }
        return config;
    }

    Expected<void> validate() const {
        if (base_url.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Language model base_url cannot be empty"});
        }
        if (api_key.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Language model API key is not set", "LLM_API_KEY"});
        }
        if (model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Language model name cannot be empty"});
        }
        if (sampling.max_tokens <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_tokens must be positive"});
        }
        if (request_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidTimeout, "Language model request_timeout must be positive"});
        }
        return {};
    }

    bool operator==(const LanguageModelConfig& other) const {
        return base_url == other.base_url &&
               api_key == other.api_key &&
               model == other.model &&
               sampling == other.sampling &&
               request_timeout == other.request_timeout;
    }

    bool operator!=(const LanguageModelConfig& other) const {
        return !(*this == other);
    }
};

/**
 * @brief One chat-completion request
 *
 * An empty tools array means the model is offered no tools.
 */
struct ModelRequest {
    std::vector<Message> messages;                       ///< System instruction first, then history
    nlohmann::json tools = nlohmann::json::array();      ///< Function descriptors
    std::optional<std::string> tool_choice;              ///< e.g. "auto"; omitted when unset
};

/**
 * @brief Parsed model reply: either plain text or tool requests (or both)
 */
struct ModelReply {
    std::string text;
    std::vector<ToolInvocation> tool_calls;
    TokenUsage usage;
    std::string finish_reason;

    bool requests_tools() const { return !tool_calls.empty(); }
};

/**
 * @brief Abstract interface for the hosted language model
 *
 * Enables dependency injection for testing. Called from the client's
 * worker thread only.
 */
class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;

    /**
     * @brief Validate and store connection settings
     *
     * Called once during Client::create().
     */
    virtual Expected<void> initialize(const LanguageModelConfig& config) = 0;

    /**
     * @brief Perform one blocking completion
     *
     * @param cancel Optional token; cancelling it aborts the call promptly
     * @return LanguageModelTransportError on network/HTTP failure,
     *         RequestCancelled when @p cancel fires, LanguageModelFormatError
     *         on an unusable body
     */
    virtual Expected<ModelReply> complete(const ModelRequest& request,
                                          const CancellationToken* cancel = nullptr) = 0;
};

/**
 * @brief Factory function for the production HTTP implementation
 *
 * For testing, inject a mock directly.
 */
std::unique_ptr<ILanguageModel> create_language_model();

} // namespace backend
} // namespace vine
