#include <gtest/gtest.h>
#include "vine/backend/http_language_model.hpp"
#include "mocks/canned_http_server.hpp"
#include "fixtures/sample_completions.hpp"

#include <cstdlib>
#include <thread>

using namespace vine;
using namespace vine::backend;
using namespace vine::testing;

/**
 * Every request goes to 127.0.0.1: either a closed port or a one-shot
 * local server, so no network access is needed.
 */
class HttpLanguageModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("no_proxy", "127.0.0.1", 1);
        config.api_key = "test-key";
        config.model = "test-model";
        config.request_timeout = std::chrono::milliseconds(5000);
        request.messages = {Message::user("latest serde?")};
    }

    Expected<ModelReply> complete_against(const std::string& base_url,
                                          const CancellationToken* cancel = nullptr) {
        config.base_url = base_url;
        auto initialized = model.initialize(config);
        EXPECT_TRUE(initialized.has_value()) << initialized.error().to_string();
        return model.complete(request, cancel);
    }

    LanguageModelConfig config;
    ModelRequest request;
    HttpLanguageModel model;
};

TEST_F(HttpLanguageModelTest, CompleteBeforeInitializeFails) {
    auto reply = model.complete(request);
    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::LanguageModelTransportError);
}

TEST_F(HttpLanguageModelTest, InitializeRequiresApiKey) {
    config.api_key.clear();
    auto initialized = model.initialize(config);
    ASSERT_FALSE(initialized.has_value());
    EXPECT_EQ(initialized.error().code, ErrorCode::InvalidConfig);
}

TEST_F(HttpLanguageModelTest, CancelledTokenSkipsTheRequest) {
    CancellationToken cancel;
    cancel.cancel();

    auto reply = complete_against("http://127.0.0.1:1/v1", &cancel);
    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::RequestCancelled);
}

TEST_F(HttpLanguageModelTest, ConnectionRefusedIsTransportError) {
    request.messages = {Message::user("caf\xE9 version?")};

    auto reply = complete_against("http://127.0.0.1:1/v1");
    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::LanguageModelTransportError);
    EXPECT_EQ(reply.error().context, std::optional<std::string>("http://127.0.0.1:1/v1/chat/completions"));
}

TEST_F(HttpLanguageModelTest, SuccessfulReplyIsParsed) {
    CannedHttpServer server(200, completions::PLAIN_TEXT);
    ASSERT_TRUE(server.is_listening());

    auto reply = complete_against(server.base_url() + "/");
    ASSERT_TRUE(reply.has_value()) << reply.error().to_string();
    EXPECT_EQ(reply->text, "serde 1.0.0 is the latest release.");
    EXPECT_EQ(reply->usage.total_tokens, 51);

    std::string sent = server.received_request();
    EXPECT_NE(sent.find("POST /v1/chat/completions"), std::string::npos);
    EXPECT_NE(sent.find("Authorization: Bearer test-key"), std::string::npos);
    EXPECT_NE(sent.find("\"model\":\"test-model\""), std::string::npos);
}

TEST_F(HttpLanguageModelTest, NonSuccessStatusIsTransportError) {
    CannedHttpServer server(503, R"({"error":{"message":"overloaded"}})");
    ASSERT_TRUE(server.is_listening());

    auto reply = complete_against(server.base_url());
    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::LanguageModelTransportError);
    EXPECT_NE(reply.error().message.find("503"), std::string::npos);
    ASSERT_TRUE(reply.error().context.has_value());
    EXPECT_NE(reply.error().context->find("overloaded"), std::string::npos);
}

TEST_F(HttpLanguageModelTest, UnusableBodyIsFormatError) {
    CannedHttpServer server(200, completions::NO_CHOICES);
    ASSERT_TRUE(server.is_listening());

    auto reply = complete_against(server.base_url());
    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::LanguageModelFormatError);
}

TEST_F(HttpLanguageModelTest, CancellationAbortsPendingTransfer) {
    CannedHttpServer server(200, "", true);
    ASSERT_TRUE(server.is_listening());

    CancellationToken cancel;
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto reply = complete_against(server.base_url(), &cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_FALSE(reply.has_value());
    EXPECT_EQ(reply.error().code, ErrorCode::RequestCancelled);
    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
}
