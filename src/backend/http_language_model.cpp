#include "vine/backend/http_language_model.hpp"
#include "vine/backend/chat_completion.hpp"
#include "vine/log.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace vine {
namespace backend {

namespace {

std::once_flag g_curl_init_flag;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return (cancel != nullptr && cancel->is_cancelled()) ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

std::unique_ptr<ILanguageModel> create_language_model() {
    return std::make_unique<HttpLanguageModel>();
}

HttpLanguageModel::HttpLanguageModel() {
    std::call_once(g_curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

HttpLanguageModel::~HttpLanguageModel() = default;

Expected<void> HttpLanguageModel::initialize(const LanguageModelConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    config_ = config;
    initialized_ = true;
    return {};
}

std::string HttpLanguageModel::endpoint() const {
    std::string url = config_.base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/chat/completions";
}

Expected<ModelReply> HttpLanguageModel::complete(const ModelRequest& request, const CancellationToken* cancel) {
    if (!initialized_) {
        return tl::unexpected(Error{ErrorCode::LanguageModelTransportError, "Language model is not initialized"});
    }
    if (cancel != nullptr && cancel->is_cancelled()) {
        return tl::unexpected(Error{ErrorCode::RequestCancelled, "Model call cancelled before it started"});
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return tl::unexpected(Error{ErrorCode::LanguageModelTransportError, "Failed to initialize CURL"});
    }

    const std::string url = endpoint();
    const std::string request_body = encode_chat_request(config_, request);
    std::string response_body;

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + config_.api_key).c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.request_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));

    LOG4CPLUS_DEBUG(log::backend_logger(),
        "POST " << url << " (" << request.messages.size() << " messages, "
        << (request.tools.is_array() ? request.tools.size() : 0) << " tools)");

    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return tl::unexpected(Error{ErrorCode::RequestCancelled, "Model call cancelled"});
    }
    if (res != CURLE_OK) {
        LOG4CPLUS_WARN(log::backend_logger(), "CURL error: " << curl_easy_strerror(res));
        return tl::unexpected(Error{
            ErrorCode::LanguageModelTransportError,
            std::string("CURL error: ") + curl_easy_strerror(res),
            url
        });
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        LOG4CPLUS_WARN(log::backend_logger(), "Model endpoint returned HTTP " << http_code);
        return tl::unexpected(Error{
            ErrorCode::LanguageModelTransportError,
            "Model endpoint returned HTTP " + std::to_string(http_code),
            response_body.substr(0, 500)
        });
    }

    auto reply = parse_chat_response(response_body);
    if (!reply) {
        LOG4CPLUS_WARN(log::backend_logger(),
            "Unusable model response: " << reply.error().to_string() << " | " << response_body.substr(0, 500));
    }
    return reply;
}

} // namespace backend
} // namespace vine
