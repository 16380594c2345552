#include <gtest/gtest.h>
#include <siri/error_types.h>
#include <siri_desktop/command_bridge.h>
#include <atomic>
#include <memory>
#include <string>

using namespace siri_desktop;

TEST(CommandRegistryTest, InvokesRegisteredHandler) {
    CommandRegistry registry;
    registry.add("echo", [](const json& args) -> json { return args.value("text", ""); });

    EXPECT_TRUE(registry.contains("echo"));
    EXPECT_EQ(registry.invoke("echo", json{{"text", "hi"}}), "hi");
}

TEST(CommandRegistryTest, UnknownCommandThrows) {
    CommandRegistry registry;
    EXPECT_FALSE(registry.contains("format_disk"));
    EXPECT_THROW(registry.invoke("format_disk", json::object()), siri::UnknownCommandException);
}

TEST(CommandRegistryTest, LaterRegistrationReplacesEarlier) {
    CommandRegistry registry;
    registry.add("app_version", [](const json&) -> json { return "1.0.0"; });
    registry.add("app_version", [](const json&) -> json { return "1.0.1"; });

    EXPECT_EQ(registry.invoke("app_version", json::object()), "1.0.1");
    EXPECT_EQ(registry.names().size(), 1u);
}

TEST(CommandRegistryTest, HandlerErrorsPropagate) {
    CommandRegistry registry;
    registry.add("print_text", [](const json&) -> json {
        throw siri::PrinterException("printer offline");
    });
    EXPECT_THROW(registry.invoke("print_text", json::object()), siri::PrinterException);
}

TEST(StatusForErrorTest, MapsErrorTypes) {
    EXPECT_EQ(status_for_error(siri::InvalidRequestException("bad")), 400);
    EXPECT_EQ(status_for_error(siri::UnknownCommandException("x")), 404);
    EXPECT_EQ(status_for_error(siri::UnsupportedOperationException("Printing", "Linux")), 501);
    EXPECT_EQ(status_for_error(siri::NetworkException("down")), 502);
    EXPECT_EQ(status_for_error(siri::PrinterException("jam")), 500);
}

class CommandBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<CommandRegistry>();
        registry->add("app_version", [](const json&) -> json { return "1.2.3"; });
        registry->add("sum", [](const json& args) -> json {
            return args.at("a").get<int>() + args.at("b").get<int>();
        });
        registry->add("list_printers", [](const json&) -> json {
            throw siri::UnsupportedOperationException("Printing", "Linux");
        });

        bridge = std::make_unique<CommandBridge>(registry, "127.0.0.1", 0, "http://localhost:1420/");
        ASSERT_TRUE(bridge->start());
        ASSERT_GT(bridge->port(), 0);

        client = std::make_unique<httplib::Client>("127.0.0.1", bridge->port());
        client->set_connection_timeout(5);
        client->set_read_timeout(5);
    }

    void TearDown() override {
        client.reset();
        bridge->stop();
    }

    httplib::Result invoke(const std::string& command, const std::string& body) {
        return client->Post(("/invoke/" + command).c_str(), body, "application/json");
    }

    std::shared_ptr<CommandRegistry> registry;
    std::unique_ptr<CommandBridge> bridge;
    std::unique_ptr<httplib::Client> client;
};

TEST_F(CommandBridgeTest, ReturnsResultEnvelope) {
    auto res = invoke("app_version", "");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["result"], "1.2.3");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(CommandBridgeTest, PassesArguments) {
    auto res = invoke("sum", R"({"a": 2, "b": 40})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["result"], 42);
}

TEST_F(CommandBridgeTest, UnknownCommandIs404) {
    auto res = invoke("format_disk", "{}");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"]["type"], siri::ErrorType::UNKNOWN_COMMAND);
}

TEST_F(CommandBridgeTest, MalformedBodyIs400) {
    auto res = invoke("sum", "{not json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"]["type"], siri::ErrorType::INVALID_REQUEST);

    auto array_body = invoke("sum", "[1, 2]");
    ASSERT_TRUE(array_body);
    EXPECT_EQ(array_body->status, 400);
}

TEST_F(CommandBridgeTest, MissingArgumentIs400) {
    auto res = invoke("sum", R"({"a": 2})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(CommandBridgeTest, UnsupportedOperationCarriesMessage) {
    auto res = invoke("list_printers", "{}");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 501);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["error"]["message"], "Printing is not supported on Linux");
}

TEST_F(CommandBridgeTest, AnswersPreflight) {
    httplib::Headers headers = {{"Origin", "http://localhost:1420"}};
    auto res = client->Options("/invoke/app_version", headers);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "http://localhost:1420");
}

TEST_F(CommandBridgeTest, ServesTheUserInterfaceOrigin) {
    httplib::Headers headers = {{"Origin", "http://localhost:1420"}};
    auto res = client->Post("/invoke/app_version", headers, std::string("{}"), "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["result"], "1.2.3");
}

TEST_F(CommandBridgeTest, RejectsForeignOrigin) {
    std::atomic<bool> invoked{false};
    registry->add("print_text", [&invoked](const json&) -> json {
        invoked = true;
        return "Printed successfully";
    });

    httplib::Headers foreign = {{"Origin", "https://evil.example.com"}};
    auto res = client->Post("/invoke/print_text", foreign, std::string(R"({"content": "x"})"),
                            "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
    EXPECT_EQ(json::parse(res->body)["error"]["type"], siri::ErrorType::FORBIDDEN);
    EXPECT_FALSE(invoked.load());

    httplib::Headers other_port = {{"Origin", "http://localhost:1421"}};
    auto preflight = client->Options("/invoke/print_text", other_port);
    ASSERT_TRUE(preflight);
    EXPECT_EQ(preflight->status, 403);

    httplib::Headers sandboxed = {{"Origin", "null"}};
    auto opaque = client->Post("/invoke/app_version", sandboxed, std::string("{}"), "application/json");
    ASSERT_TRUE(opaque);
    EXPECT_EQ(opaque->status, 403);
}

TEST(OriginOfTest, KeepsSchemeHostAndPort) {
    EXPECT_EQ(origin_of("http://localhost:1420/billing?x=1"), "http://localhost:1420");
    EXPECT_EQ(origin_of("HTTPS://App.Example.com"), "https://app.example.com");
    EXPECT_EQ(origin_of("localhost:1420"), "");
    EXPECT_EQ(origin_of("null"), "");
    EXPECT_EQ(origin_of("http://"), "");
}

TEST_F(CommandBridgeTest, ListsCommands) {
    auto res = client->Get("/commands");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto names = json::parse(res->body)["commands"];
    EXPECT_EQ(names.size(), 3u);
}
