#include <gtest/gtest.h>
#include "vine/engine/tool_catalog.hpp"
#include "mocks/mock_line_channel.hpp"
#include "fixtures/tool_definitions.hpp"

using namespace vine;
using namespace vine::engine;
using namespace vine::testing;

class ToolCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel = std::make_shared<MockLineChannel>();
        protocol::ProtocolClient::Config config;
        config.request_timeout = std::chrono::milliseconds(100);
        client = std::make_shared<protocol::ProtocolClient>(channel, config);
        catalog = std::make_unique<ToolCatalog>(client);
    }

    std::shared_ptr<MockLineChannel> channel;
    std::shared_ptr<protocol::ProtocolClient> client;
    std::unique_ptr<ToolCatalog> catalog;
};

// ============================================================================
// Refresh
// ============================================================================

TEST_F(ToolCatalogTest, RefreshCachesServerTools) {
    channel->enqueue_result("tools/list", tools::tool_list());

    auto count = catalog->refresh();
    ASSERT_TRUE(count.has_value()) << count.error().to_string();
    EXPECT_EQ(*count, 2u);
    EXPECT_EQ(catalog->size(), 2u);
    EXPECT_TRUE(catalog->contains("search_docs"));
    EXPECT_TRUE(catalog->contains("check_version"));

    auto requests = channel->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "tools/list");
}

TEST_F(ToolCatalogTest, DescriptorsKeepServerOrder) {
    channel->enqueue_result("tools/list", tools::tool_list());
    ASSERT_TRUE(catalog->refresh().has_value());

    auto cached = catalog->tools();
    ASSERT_EQ(cached.size(), 2u);
    EXPECT_EQ(cached[0].name, "search_docs");
    EXPECT_EQ(cached[1].name, "check_version");
    EXPECT_EQ(cached[1].description, "Look up the latest version of a package");
    EXPECT_EQ(cached[1].input_schema, tools::check_version_tool()["inputSchema"]);
}

TEST_F(ToolCatalogTest, DescribeForModelWrapsEachTool) {
    channel->enqueue_result("tools/list", tools::tool_list());
    ASSERT_TRUE(catalog->refresh().has_value());

    auto described = catalog->describe_for_model();
    ASSERT_TRUE(described.is_array());
    ASSERT_EQ(described.size(), 2u);
    EXPECT_EQ(described[0]["type"], "function");
    EXPECT_EQ(described[0]["function"]["name"], "search_docs");
    EXPECT_EQ(described[0]["function"]["description"], "Search package documentation");
    EXPECT_EQ(described[0]["function"]["parameters"], tools::search_docs_tool()["inputSchema"]);
}

TEST_F(ToolCatalogTest, EmptyCatalogDescribesAsEmptyArray) {
    auto described = catalog->describe_for_model();
    EXPECT_TRUE(described.is_array());
    EXPECT_TRUE(described.empty());
}

TEST_F(ToolCatalogTest, MissingToolsFieldIsEmptyList) {
    channel->enqueue_result("tools/list", nlohmann::json::object());

    auto count = catalog->refresh();
    ASSERT_TRUE(count.has_value()) << count.error().to_string();
    EXPECT_EQ(*count, 0u);
}

TEST_F(ToolCatalogTest, MissingSchemaGetsEmptyObjectSchema) {
    channel->enqueue_result("tools/list", {{"tools", nlohmann::json::array({tools::ping_tool()})}});
    ASSERT_TRUE(catalog->refresh().has_value());

    auto ping = catalog->lookup("ping");
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ(ping->input_schema["type"], "object");
    EXPECT_TRUE(ping->input_schema["properties"].empty());
}

TEST_F(ToolCatalogTest, RefreshReplacesWholeCache) {
    channel->enqueue_result("tools/list", tools::tool_list());
    ASSERT_TRUE(catalog->refresh().has_value());

    channel->enqueue_result("tools/list", {{"tools", nlohmann::json::array({tools::ping_tool()})}});
    ASSERT_TRUE(catalog->refresh().has_value());

    EXPECT_EQ(catalog->size(), 1u);
    EXPECT_FALSE(catalog->contains("search_docs"));
    EXPECT_TRUE(catalog->contains("ping"));
}

// ============================================================================
// Failed Refresh
// ============================================================================

TEST_F(ToolCatalogTest, TransportFailureKeepsPreviousCache) {
    channel->enqueue_result("tools/list", tools::tool_list());
    ASSERT_TRUE(catalog->refresh().has_value());

    // No script queued: the call times out.
    auto count = catalog->refresh();
    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code, ErrorCode::ReadTimeout);
    EXPECT_EQ(catalog->size(), 2u);
}

TEST_F(ToolCatalogTest, MalformedListKeepsPreviousCache) {
    channel->enqueue_result("tools/list", tools::tool_list());
    ASSERT_TRUE(catalog->refresh().has_value());

    channel->enqueue_result("tools/list", {{"tools", "not-an-array"}});
    auto count = catalog->refresh();
    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(catalog->size(), 2u);
}

TEST_F(ToolCatalogTest, ServerErrorIsReported) {
    channel->enqueue_error("tools/list", -32601, "Method not found");

    auto count = catalog->refresh();
    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code, ErrorCode::ProtocolError);
    EXPECT_EQ(catalog->size(), 0u);
}

TEST_F(ToolCatalogTest, ParseRejectsMalformedEntries) {
    using List = nlohmann::json;
    const List bad_lists[] = {
        List::array(),
        List{{"tools", List::array({"search_docs"})}},
        List{{"tools", List::array({{{"description", "nameless"}}})}},
        List{{"tools", List::array({{{"name", ""}}})}},
        List{{"tools", List::array({tools::ping_tool(), tools::ping_tool()})}},
        List{{"tools", List::array({{{"name", "x"}, {"inputSchema", "object"}}})}}
    };

    for (const auto& bad : bad_lists) {
        auto parsed = ToolCatalog::parse_tool_list(bad);
        ASSERT_FALSE(parsed.has_value()) << bad.dump();
        EXPECT_EQ(parsed.error().code, ErrorCode::ProtocolError) << bad.dump();
    }
}

// ============================================================================
// Lookup
// ============================================================================

TEST_F(ToolCatalogTest, LookupIsExactAndCaseSensitive) {
    channel->enqueue_result("tools/list", tools::tool_list());
    ASSERT_TRUE(catalog->refresh().has_value());

    auto found = catalog->lookup("check_version");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "check_version");

    auto upper = catalog->lookup("Check_Version");
    ASSERT_FALSE(upper.has_value());
    EXPECT_EQ(upper.error().code, ErrorCode::ToolNotFound);
    EXPECT_EQ(upper.error().message, "Tool not found: Check_Version");
}

TEST_F(ToolCatalogTest, LookupOnEmptyCatalogIsToolNotFound) {
    auto missing = catalog->lookup("search_docs");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ToolNotFound);
}
