#pragma once

#include "ILanguageModel.hpp"
#include "../types.hpp"

#include <string>

namespace vine {
namespace backend {

/**
 * @brief ILanguageModel over HTTPS using libcurl
 *
 * POSTs to <base_url>/chat/completions with bearer authentication. The
 * transfer is bounded by LanguageModelConfig::request_timeout and is
 * aborted from the progress callback once the cancellation token fires.
 */
class HttpLanguageModel : public ILanguageModel {
public:
    HttpLanguageModel();
    ~HttpLanguageModel() override;

    // Non-copyable, non-movable
    HttpLanguageModel(const HttpLanguageModel&) = delete;
    HttpLanguageModel& operator=(const HttpLanguageModel&) = delete;

    Expected<void> initialize(const LanguageModelConfig& config) override;

    Expected<ModelReply> complete(const ModelRequest& request,
                                  const CancellationToken* cancel = nullptr) override;

    const LanguageModelConfig& config() const { return config_; }

private:
    std::string endpoint() const;

    LanguageModelConfig config_;
    bool initialized_ = false;
};

} // namespace backend
} // namespace vine
