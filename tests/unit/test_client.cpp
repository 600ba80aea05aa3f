#include <gtest/gtest.h>
#include "vine/client.hpp"
#include "mocks/mock_language_model.hpp"
#include "mocks/mock_line_channel.hpp"
#include "fixtures/protocol_messages.hpp"
#include "fixtures/tool_definitions.hpp"

using namespace vine;
using namespace vine::testing;
namespace fixtures = vine::testing::protocol_fixtures;

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel = std::make_shared<MockLineChannel>();
        config.protocol.request_timeout = std::chrono::milliseconds(100);
        config.language_model.api_key = "test-key";
    }

    /// Script a healthy handshake and tool listing.
    void script_startup() {
        channel->enqueue_result("initialize", fixtures::initialize_ack());
        channel->enqueue_result("tools/list", tools::tool_list());
    }

    std::unique_ptr<MockLanguageModel> make_model() {
        auto model = std::make_unique<MockLanguageModel>();
        model_ptr = model.get();
        return model;
    }

    std::unique_ptr<Client> create_client() {
        script_startup();
        auto result = Client::create(config, make_model(), channel);
        EXPECT_TRUE(result.has_value()) << result.error().to_string();
        if (!result) {
            return nullptr;
        }
        return std::move(*result);
    }

    Client::Config config;
    std::shared_ptr<MockLineChannel> channel;
    MockLanguageModel* model_ptr = nullptr;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(ClientTest, CreateHandshakesAndLoadsTools) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);

    EXPECT_TRUE(client->is_running());
    EXPECT_TRUE(model_ptr->initialized);
    EXPECT_EQ(model_ptr->last_config.api_key, "test-key");
    EXPECT_EQ(client->tools().size(), 2u);
    EXPECT_EQ(client->server_acknowledgement(), std::optional<nlohmann::json>(fixtures::initialize_ack()));

    auto requests = channel->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].method, "initialize");
    EXPECT_EQ(requests[1].method, "tools/list");
}

TEST_F(ClientTest, MissingServerCommandIsRejected) {
    auto result = Client::create(config, make_model());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MissingServerCommand);
}

TEST_F(ClientTest, ModelInitializeFailureAborts) {
    auto model = make_model();
    model->should_fail_initialize = true;

    auto result = Client::create(config, std::move(model), channel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);
    EXPECT_TRUE(channel->written_lines().empty());
}

TEST_F(ClientTest, HandshakeErrorAbortsAndClosesChannel) {
    channel->enqueue_error("initialize", -32600, "Unsupported client");

    auto result = Client::create(config, make_model(), channel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(channel->close_calls(), 1);
    EXPECT_EQ(channel->state(), process::SessionState::Closed);
}

TEST_F(ClientTest, ToolListFailureAbortsAndClosesChannel) {
    channel->enqueue_result("initialize", fixtures::initialize_ack());
    channel->enqueue_result("tools/list", {{"tools", "broken"}});

    auto result = Client::create(config, make_model(), channel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(channel->close_calls(), 1);
}

TEST_F(ClientTest, ServerLaunchFailureIsReported) {
    config.server_command = "/bin/sh";
    config.server_args = {"-c", "exit 1"};
    config.process.startup_grace = std::chrono::milliseconds(200);
    config.process.shutdown_timeout = std::chrono::milliseconds(200);

    auto result = Client::create(config, make_model());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProcessLaunchError);
}

// ============================================================================
// Turns
// ============================================================================

TEST_F(ClientTest, ChatRunsTurnOnWorker) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    model_ptr->enqueue_text("Hello from the model");

    auto handle = client->chat("hi");
    auto result = handle.future.get();
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->text, "Hello from the model");

    auto history = client->get_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].content, "hi");
}

TEST_F(ClientTest, ChatWithToolRound) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    model_ptr->enqueue_tool_calls({{"call_1", "check_version", R"({"package":"serde","language":"rust"})"}});
    model_ptr->enqueue_text("serde 1.0.0");
    channel->enqueue_result("tools/call", fixtures::check_version_result());

    auto result = client->chat("latest serde?").future.get();
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->text, "serde 1.0.0");
    ASSERT_EQ(result->tool_results.size(), 1u);
    EXPECT_EQ(result->tool_results[0].content, R"({"latest":"1.0.0"})");
}

TEST_F(ClientTest, TurnsRunInSubmissionOrder) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    model_ptr->enqueue_text("one");
    model_ptr->enqueue_text("two");

    auto first = client->chat("first");
    auto second = client->chat("second");
    EXPECT_LT(first.id, second.id);

    auto r1 = first.future.get();
    auto r2 = second.future.get();
    ASSERT_TRUE(r1.has_value());
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r1->text, "one");
    EXPECT_EQ(r2->text, "two");
}

TEST_F(ClientTest, ClearHistory) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);

    ASSERT_TRUE(client->chat("hi").future.get().has_value());
    EXPECT_FALSE(client->get_history().empty());

    client->clear_history();
    EXPECT_TRUE(client->get_history().empty());
}

TEST_F(ClientTest, DirectToolCall) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    channel->enqueue_result("tools/call", fixtures::check_version_result());

    auto result = client->call_tool("check_version", {{"package", "serde"}, {"language", "rust"}});
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(*result, fixtures::check_version_result());

    auto missing = client->call_tool("nonexistent", nlohmann::json::object());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ToolNotFound);
}

TEST_F(ClientTest, RefreshToolsReplacesCatalog) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    channel->enqueue_result("tools/list", {{"tools", nlohmann::json::array({tools::ping_tool()})}});

    auto count = client->refresh_tools();
    ASSERT_TRUE(count.has_value()) << count.error().to_string();
    EXPECT_EQ(*count, 1u);
    EXPECT_EQ(client->tools()[0].name, "ping");
}

TEST_F(ClientTest, QueueCapacityIsEnforced) {
    config.request_queue_capacity = 1;
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    model_ptr->completion_delay_ms = 200;

    auto running = client->chat("first");
    // Give the worker time to take the first turn off the queue.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto queued = client->chat("second");
    auto rejected = client->chat("third");

    auto result = rejected.future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::QueueFull);

    EXPECT_TRUE(running.future.get().has_value());
    EXPECT_TRUE(queued.future.get().has_value());
}

// ============================================================================
// Shutdown and Interrupt
// ============================================================================

TEST_F(ClientTest, StopIsIdempotentAndRejectsNewTurns) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);

    client->stop();
    client->stop();
    EXPECT_FALSE(client->is_running());
    EXPECT_EQ(channel->state(), process::SessionState::Closed);

    auto result = client->chat("hello?").future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ClientNotRunning);
}

TEST_F(ClientTest, InterruptAbortsInFlightTurn) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    model_ptr->completion_delay_ms = 5000;

    auto handle = client->chat("long question");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    client->interrupt();
    auto result = handle.future.get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_TRUE(client->is_interrupted());
    EXPECT_EQ(client->session_state(), process::SessionState::Closed);
}

TEST_F(ClientTest, InterruptReturnsAfterServerShutdown) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);

    client->interrupt();

    // Shutdown ran on this thread, so it is already complete.
    EXPECT_EQ(channel->close_calls(), 1);
    EXPECT_EQ(client->session_state(), process::SessionState::Closed);
}

TEST_F(ClientTest, InterruptWakesBlockedToolCall) {
    config.protocol.request_timeout = std::chrono::milliseconds(5000);
    auto client = create_client();
    ASSERT_NE(client, nullptr);
    Client* raw = client.get();
    model_ptr->enqueue_tool_calls({{"call_1", "check_version", R"({"package":"serde","language":"rust"})"}});
    // No tools/call script: the server never answers, but interrupt closes the channel.

    std::thread interrupter([raw]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        raw->interrupt();
    });
    auto result = client->chat("latest serde?").future.get();
    interrupter.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
    EXPECT_EQ(model_ptr->call_count(), 1u);
}

TEST_F(ClientTest, TurnsAfterInterruptAreCancelled) {
    auto client = create_client();
    ASSERT_NE(client, nullptr);

    client->interrupt();
    auto result = client->chat("anyone?").future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
    EXPECT_EQ(model_ptr->call_count(), 0u);
}
