#include <gtest/gtest.h>

#include "command/command.hpp"
#include "command/command_base.hpp"
#include "command/command_registry.hpp"
#include "test_helpers.hpp"

#include <string>

using sidecar::Json;
using sidecar::commands::CommandDispatcher;

namespace {

class CommandDispatchTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    SidecarContext context = make_test_context(transport);

    Json run(const Json& request) {
        CommandDispatcher dispatcher(context);
        return Json::parse(dispatcher.handle_line(request.dump()));
    }

    Json run_line(const std::string& line) {
        CommandDispatcher dispatcher(context);
        return Json::parse(dispatcher.handle_line(line));
    }
};

} // namespace

TEST(CommandRegistry, EveryCommandHasAHandler) {
    const auto& registry = sidecar::commands::command_registry();
    EXPECT_TRUE(registry.missing().empty());

    for (std::size_t i = 0; i < sidecar::commands::kCommandCount; ++i) {
        auto kind = static_cast<sidecar::commands::CommandKind>(i);
        auto* handler = registry.find(kind);
        ASSERT_NE(handler, nullptr) << sidecar::commands::command_name(kind);
        EXPECT_EQ(handler->kind(), kind);
    }
}

TEST(CommandRegistry, NamesRoundTrip) {
    EXPECT_EQ(sidecar::commands::kCommandCount, 20u);
    for (std::size_t i = 0; i < sidecar::commands::kCommandCount; ++i) {
        auto kind = static_cast<sidecar::commands::CommandKind>(i);
        auto parsed = sidecar::commands::command_from_name(sidecar::commands::command_name(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(sidecar::commands::command_from_name("Health").has_value());
}

TEST_F(CommandDispatchTest, HealthReportsServerStatus) {
    transport->on("GET", "/global/health", json_response(200, {{"healthy", true}, {"version", "0.9.1"}}));

    Json response = run({{"cmd", "health"}});

    EXPECT_EQ(response["type"], "success");
    EXPECT_EQ(response["cmd"], "health");
    EXPECT_EQ(response["data"], Json::parse(R"({"healthy":true,"version":"0.9.1"})"));
}

TEST_F(CommandDispatchTest, MalformedLineIsParseError) {
    Json response = run_line("this is not json");

    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["code"], "PARSE_ERROR");
    EXPECT_FALSE(response.contains("cmd"));
    EXPECT_EQ(transport->request_count(), 0u);
}

TEST_F(CommandDispatchTest, MissingCmdIsUnknownCommand) {
    Json response = run({{"sessionPath", "ses_1"}});

    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["code"], "UNKNOWN_CMD");
    EXPECT_EQ(response["message"], "Unknown command: undefined");
    EXPECT_EQ(transport->request_count(), 0u);

    response = run({{"cmd", nullptr}});
    EXPECT_EQ(response["code"], "UNKNOWN_CMD");
    EXPECT_EQ(response["message"], "Unknown command: null");
}

TEST_F(CommandDispatchTest, UnknownCommand) {
    Json response = run({{"cmd", "bogus"}});

    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["message"], "Unknown command: bogus");
    EXPECT_EQ(response["code"], "UNKNOWN_CMD");
    EXPECT_EQ(transport->request_count(), 0u);
}

TEST_F(CommandDispatchTest, SessionCommandsRequireSessionPath) {
    for (const char* cmd : {"getSession", "prompt", "promptAsync", "listMessages", "deleteSession"}) {
        Json response = run({{"cmd", cmd}, {"message", "hi"}});
        EXPECT_EQ(response["type"], "error") << cmd;
        EXPECT_EQ(response["code"], "INVALID_ARGUMENT") << cmd;
        EXPECT_EQ(response["message"], "sessionPath is required") << cmd;
    }
    EXPECT_EQ(transport->request_count(), 0u);
}

TEST_F(CommandDispatchTest, ProviderCommandsValidateFields) {
    Json set_auth = run({{"cmd", "setAuth"}, {"provider", "openai"}});
    EXPECT_EQ(set_auth["code"], "INVALID_ARGUMENT");
    EXPECT_EQ(set_auth["message"], "provider and apiKey are required");

    Json authorize = run({{"cmd", "providerOauthAuthorize"}, {"providerID", "github"}});
    EXPECT_EQ(authorize["code"], "INVALID_ARGUMENT");
    EXPECT_EQ(authorize["message"], "providerID and method are required");

    Json callback = run({{"cmd", "providerOauthCallback"}, {"method", 0}});
    EXPECT_EQ(callback["message"], "providerID and method are required");

    Json remove = run({{"cmd", "removeAuth"}});
    EXPECT_EQ(remove["message"], "providerID is required");

    Json update = run({{"cmd", "updateConfig"}, {"config", "nope"}});
    EXPECT_EQ(update["message"], "config is required");

    EXPECT_EQ(transport->request_count(), 0u);
}

TEST_F(CommandDispatchTest, ServerInfoWithoutLaunch) {
    Json response = run({{"cmd", "serverInfo"}});

    EXPECT_EQ(response["data"]["baseUrl"], kFakeBaseUrl);
    EXPECT_TRUE(response["data"]["startedAt"].is_null());
}

TEST_F(CommandDispatchTest, ServerInfoAfterLaunch) {
    context.started_at_ms = 1700000000000;
    Json response = run({{"cmd", "serverInfo"}});

    EXPECT_EQ(response["data"]["startedAt"], 1700000000000LL);
}

TEST_F(CommandDispatchTest, PromptNormalizesPartsAndModel) {
    transport->on("POST", "/session/ses_1/message", [](const sidecar::net::HttpRequest&) {
        return json_response(200, Json::parse(R"({
            "info": {"id":"msg_2","sessionID":"ses_1","role":"assistant"},
            "parts": [{"type":"text","text":"thinking"},{"type":"text","text":"Hello!"}]
        })"));
    });

    Json response = run({{"cmd", "prompt"},
                         {"sessionPath", "ses_1"},
                         {"message", "hi"},
                         {"model", "openai/gpt-4"},
                         {"parts", Json::parse(R"([{"type":"file","url":"file:///x"}])")}});

    ASSERT_EQ(response["type"], "success") << response.dump();
    EXPECT_EQ(response["data"]["messageId"], "msg_2");
    EXPECT_EQ(response["data"]["sessionId"], "ses_1");
    EXPECT_EQ(response["data"]["response"], "Hello!");
    EXPECT_EQ(response["data"]["message"], "hi");
    EXPECT_EQ(response["data"]["model"], "openai/gpt-4");
    EXPECT_TRUE(response["data"]["timestamp"].is_string());

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    Json body = Json::parse(requests[0].body);
    EXPECT_EQ(body["model"], Json::parse(R"({"providerID":"openai","modelID":"gpt-4"})"));
    ASSERT_EQ(body["parts"].size(), 2u);
    EXPECT_EQ(body["parts"][0], Json::parse(R"({"type":"text","text":"hi"})"));
    EXPECT_EQ(body["parts"][1]["type"], "file");
}

TEST_F(CommandDispatchTest, PromptAsyncQueues) {
    transport->on("POST", "/session/ses_1/prompt_async", sidecar::net::HttpResponse{204, ""});

    Json response = run({{"cmd", "promptAsync"}, {"sessionPath", "ses_1"}, {"message", "later"}});

    EXPECT_EQ(response["data"], Json::parse(R"({"queued":true,"sessionId":"ses_1"})"));
}

TEST_F(CommandDispatchTest, CreateSessionTitleFallbacks) {
    transport->on("POST", "/session", [](const sidecar::net::HttpRequest& request) {
        Json body = Json::parse(request.body);
        return json_response(200, {{"id", "ses_9"}, {"title", body["title"]}});
    });

    Json named = run({{"cmd", "createSession"}, {"name", "Refactor"}});
    EXPECT_EQ(named["data"]["sessionPath"], "ses_9");
    EXPECT_EQ(named["data"]["session"]["name"], "Refactor");

    Json described = run({{"cmd", "createSession"}, {"description", "From description"}});
    EXPECT_EQ(described["data"]["session"]["name"], "From description");

    Json untitled = run({{"cmd", "createSession"}});
    EXPECT_EQ(untitled["data"]["session"]["name"], "Untitled Session");
}

TEST_F(CommandDispatchTest, PerRequestDirectoryIsForwarded) {
    transport->on_data("GET", "/session", Json::array());

    Json response = run({{"cmd", "listSessions"}, {"directory", "/elsewhere"}});

    EXPECT_EQ(response["data"]["sessions"], Json::array());
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(query_value(requests[0], "directory"), "/elsewhere");
}

TEST_F(CommandDispatchTest, GetProvidersFlattensCatalog) {
    transport->on_data("GET", "/config/providers", Json::parse(R"({
        "providers":[{"id":"openai","name":"OpenAI","models":{"gpt-4":{}}}],
        "default":{"openai":"gpt-4"}
    })"));

    Json response = run({{"cmd", "getProviders"}});

    EXPECT_EQ(response["data"], Json::parse(R"({
        "providers":[{"name":"OpenAI","models":["openai/gpt-4"]}],
        "defaults":{"openai":"openai/gpt-4"}
    })"));
}

TEST_F(CommandDispatchTest, ConfigCombinesConfigAndProviders) {
    transport->on_data("GET", "/config", {{"theme", "dark"}});
    transport->on_data("GET", "/config/providers", Json::parse(R"({"providers":[],"default":{}})"));

    Json response = run({{"cmd", "config"}});

    ASSERT_EQ(response["type"], "success") << response.dump();
    EXPECT_EQ(response["data"]["config"], Json({{"theme", "dark"}}));
    EXPECT_EQ(response["data"]["providers"], Json::array());
    EXPECT_EQ(response["data"]["defaults"], Json::object());
}

TEST_F(CommandDispatchTest, SetAuthSendsApiKey) {
    transport->on_data("PUT", "/auth/openai", true);

    Json response = run({{"cmd", "setAuth"}, {"provider", "openai"}, {"apiKey", "sk-test"}});

    EXPECT_EQ(response["data"], Json::parse(R"({"success":true,"provider":"openai"})"));
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(Json::parse(requests[0].body), Json::parse(R"({"type":"api","key":"sk-test"})"));
}

TEST_F(CommandDispatchTest, DownstreamErrorBecomesUnknownError) {
    transport->on("DELETE", "/session/ses_1",
                  json_response(404, {{"name", "NotFoundError"}, {"data", {{"message", "Session not found"}}}}));

    Json response = run({{"cmd", "deleteSession"}, {"sessionPath", "ses_1"}});

    EXPECT_EQ(response["type"], "error");
    EXPECT_EQ(response["message"], "Session not found");
    EXPECT_EQ(response["code"], "UNKNOWN_ERROR");
    EXPECT_EQ(transport->count("DELETE", "/session/ses_1"), 4u);
}

TEST_F(CommandDispatchTest, ListMessagesSummaries) {
    transport->on_data("GET", "/session/ses_1/message", Json::parse(R"([
        {"info":{"id":"m1","role":"assistant","time":{"created":1700000000123}},
         "parts":[{"type":"text","text":"done"}]}
    ])"));

    Json response = run({{"cmd", "listMessages"}, {"sessionPath", "ses_1"}});

    ASSERT_EQ(response["data"]["messages"].size(), 1u);
    EXPECT_EQ(response["data"]["messages"][0]["text"], "done");
    EXPECT_EQ(response["data"]["messages"][0]["timestamp"], "2023-11-14T22:13:20.123Z");
}

TEST_F(CommandDispatchTest, FindFilesTrimsQuery) {
    transport->on_data("GET", "/find/file", Json::array({"a.cpp"}));

    Json response = run({{"cmd", "findFiles"}, {"query", "  a.c  "}, {"limit", 5}});

    EXPECT_EQ(response["data"], Json::array({"a.cpp"}));
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(query_value(requests[0], "query"), "a.c");
    EXPECT_EQ(query_value(requests[0], "limit"), "5");
}
