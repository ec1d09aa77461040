#include <gtest/gtest.h>
#include "mcplite/dispatcher.hpp"
#include "mcplite/demo_tools.hpp"
#include "mcplite/error.hpp"
#include "mcplite/version.hpp"
#include <memory>
#include <stdexcept>
#include <string>

using namespace mcplite;

namespace {

Dispatcher::Options test_options() {
    Dispatcher::Options opts;
    opts.server_info = {"test-server", "1.0.0"};
    return opts;
}

std::unique_ptr<Dispatcher> make_dispatcher(Dispatcher::Options opts = test_options()) {
    ToolRegistry::Builder builder;
    register_demo_tools(builder);
    builder.add(ToolDefinition{"explode", std::string("Always throws"),
                               nlohmann::json{{"type", "object"}}},
                [](const nlohmann::json&) -> ToolResult {
                    throw std::runtime_error("tool blew up");
                });
    return std::make_unique<Dispatcher>(std::move(opts), builder.build());
}

JsonRpcRequest make_request(RequestId id, const std::string& method,
                            nlohmann::json params = nlohmann::json::object()) {
    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method;
    req.params = std::move(params);
    return req;
}

JsonRpcRequest call_tool(RequestId id, const std::string& name, nlohmann::json arguments) {
    return make_request(std::move(id), "tools/call",
                        nlohmann::json{{"name", name}, {"arguments", std::move(arguments)}});
}

const JsonRpcSuccess& expect_success(const JsonRpcResponse& resp) {
    EXPECT_TRUE(std::holds_alternative<JsonRpcSuccess>(resp))
        << "got error: " << std::get<JsonRpcFailure>(resp).error.message;
    return std::get<JsonRpcSuccess>(resp);
}

const JsonRpcFailure& expect_failure(const JsonRpcResponse& resp) {
    EXPECT_TRUE(std::holds_alternative<JsonRpcFailure>(resp));
    return std::get<JsonRpcFailure>(resp);
}

std::string first_text(const JsonRpcSuccess& ok) {
    return ok.result.at("content").at(0).at("text").get<std::string>();
}

} // namespace

// ---- Resolution ----

TEST(Dispatcher, BuiltinMethods) {
    auto d = make_dispatcher();
    for (const char* method : {"initialize", "ping", "tools/list", "tools/call",
                               "resources/list", "resources/templates/list"}) {
        EXPECT_TRUE(d->has_method(method)) << method;
    }
    EXPECT_FALSE(d->has_method("prompts/list"));
}

TEST(Dispatcher, UnknownMethod) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(make_request(1, "bogus"));
    const auto& fail = expect_failure(resp);
    EXPECT_EQ(fail.id, 1);
    EXPECT_EQ(fail.error.code, error::MethodNotFound);
    EXPECT_EQ(fail.error.message, "Method not found: bogus");
}

TEST(Dispatcher, UnknownToolIsInternalError) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(call_tool(2, "bogus", nlohmann::json::object()));
    const auto& fail = expect_failure(resp);
    EXPECT_EQ(fail.id, 2);
    EXPECT_EQ(fail.error.code, error::InternalError);
    EXPECT_NE(fail.error.code, error::MethodNotFound);
    EXPECT_EQ(fail.error.message, "Unknown tool: bogus");
}

// ---- Handshake and listings ----

TEST(Dispatcher, InitializeHandshake) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(make_request(1, "initialize",
        nlohmann::json{{"protocolVersion", "2099-01-01"}, {"capabilities", nlohmann::json::object()}}));
    const auto& ok = expect_success(resp);
    EXPECT_EQ(ok.result.at("protocolVersion"), std::string(PROTOCOL_VERSION));
    EXPECT_EQ(ok.result.at("protocolVersion"), "2024-11-05");
    EXPECT_EQ(ok.result.at("capabilities"),
              (nlohmann::json{{"tools", nlohmann::json::object()}, {"resources", nlohmann::json::object()}}));
    EXPECT_EQ(ok.result.at("serverInfo").at("name"), "test-server");
    EXPECT_EQ(ok.result.at("serverInfo").at("version"), "1.0.0");
    EXPECT_FALSE(ok.result.contains("instructions"));
}

TEST(Dispatcher, InitializeIncludesInstructionsWhenSet) {
    auto opts = test_options();
    opts.instructions = "Call echo or add.";
    auto d = make_dispatcher(std::move(opts));
    auto resp = d->dispatch(make_request(1, "initialize"));
    EXPECT_EQ(expect_success(resp).result.at("instructions"), "Call echo or add.");
}

TEST(Dispatcher, Ping) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(make_request("p", "ping"));
    EXPECT_EQ(expect_success(resp).result, nlohmann::json::object());
}

TEST(Dispatcher, ToolsList) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(make_request(1, "tools/list"));
    const auto& tools = expect_success(resp).result.at("tools");
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].at("name"), "echo");
    EXPECT_EQ(tools[0].at("description"), "Echo back the input message");
    EXPECT_TRUE(tools[0].at("inputSchema").is_object());
    EXPECT_EQ(tools[1].at("name"), "add");
    EXPECT_EQ(tools[2].at("name"), "explode");
}

TEST(Dispatcher, ResourceListingsAreEmpty) {
    auto d = make_dispatcher();
    auto resources = d->dispatch(make_request(1, "resources/list"));
    EXPECT_EQ(expect_success(resources).result,
              (nlohmann::json{{"resources", nlohmann::json::array()}}));

    auto templates = d->dispatch(make_request(2, "resources/templates/list"));
    EXPECT_EQ(expect_success(templates).result,
              (nlohmann::json{{"resourceTemplates", nlohmann::json::array()}}));
}

// ---- tools/call ----

TEST(Dispatcher, EchoDefault) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(call_tool(1, "echo", nlohmann::json::object()));
    EXPECT_EQ(first_text(expect_success(resp)), "Echo: Hello from MCP!");
}

TEST(Dispatcher, AddArithmetic) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(call_tool(1, "add", {{"a", 2}, {"b", 3}}));
    const auto& ok = expect_success(resp);
    EXPECT_EQ(first_text(ok), "The sum of 2 and 3 is 5");
    EXPECT_EQ(ok.result.at("content").at(0).at("type"), "text");
    EXPECT_FALSE(ok.result.contains("isError"));
}

TEST(Dispatcher, MissingArgumentsDefaultToEmpty) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(make_request(1, "tools/call", {{"name", "add"}}));
    EXPECT_EQ(first_text(expect_success(resp)), "The sum of 0 and 0 is 0");
}

TEST(Dispatcher, MissingToolName) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(make_request(4, "tools/call"));
    const auto& fail = expect_failure(resp);
    EXPECT_EQ(fail.id, 4);
    EXPECT_EQ(fail.error.code, error::InternalError);
}

TEST(Dispatcher, NonObjectArguments) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(make_request(1, "tools/call", {{"name", "echo"}, {"arguments", "hello"}}));
    EXPECT_EQ(expect_failure(resp).error.code, error::InternalError);
}

TEST(Dispatcher, BadArgumentsFlattenedToInternalError) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(call_tool(6, "add", {{"a", "two"}, {"b", 3}}));
    const auto& fail = expect_failure(resp);
    EXPECT_EQ(fail.id, 6);
    EXPECT_EQ(fail.error.code, error::InternalError);
    EXPECT_EQ(fail.error.message, "Invalid argument 'a': expected number");
}

TEST(Dispatcher, ThrowingToolBecomesInternalError) {
    auto d = make_dispatcher();
    auto resp = d->dispatch(call_tool("boom", "explode", nlohmann::json::object()));
    const auto& fail = expect_failure(resp);
    EXPECT_EQ(fail.id, "boom");
    EXPECT_EQ(fail.error.code, error::InternalError);
    EXPECT_EQ(fail.error.message, "tool blew up");
}

// ---- Id round-trip ----

TEST(Dispatcher, IdRoundTripOnSuccessAndFailure) {
    auto d = make_dispatcher();
    const nlohmann::json ids[] = {nlohmann::json(), 0, -17, 3.75, "", "req-42"};
    for (const auto& id : ids) {
        auto ok = d->dispatch(call_tool(id, "echo", nlohmann::json::object()));
        EXPECT_EQ(response_id(ok), id) << id.dump();
        EXPECT_TRUE(std::holds_alternative<JsonRpcSuccess>(ok));

        auto fail = d->dispatch(call_tool(id, "bogus", nlohmann::json::object()));
        EXPECT_EQ(response_id(fail), id) << id.dump();
        EXPECT_TRUE(std::holds_alternative<JsonRpcFailure>(fail));

        auto unknown = d->dispatch(make_request(id, "bogus"));
        EXPECT_EQ(response_id(unknown), id) << id.dump();
    }
}

// ---- Catalog / registry sync ----

TEST(Dispatcher, EveryListedToolIsCallable) {
    auto d = make_dispatcher();
    auto list = d->dispatch(make_request(1, "tools/list"));
    const auto& tools = expect_success(list).result.at("tools");

    for (const auto& tool : tools) {
        const std::string name = tool.at("name").get<std::string>();
        EXPECT_TRUE(d->tools().contains(name)) << name;
        auto resp = d->dispatch(call_tool(1, name, nlohmann::json::object()));
        if (auto* fail = std::get_if<JsonRpcFailure>(&resp)) {
            EXPECT_EQ(fail->error.message.rfind("Unknown tool", 0), std::string::npos) << name;
        }
    }
    EXPECT_EQ(tools.size(), d->tools().size());
}

// ---- Extra methods ----

TEST(Dispatcher, ExtraMethod) {
    auto opts = test_options();
    opts.extra_methods["math/double"] = [](const nlohmann::json& params) -> HandlerResult {
        return nlohmann::json{{"value", params.at("n").get<int>() * 2}};
    };
    auto d = make_dispatcher(std::move(opts));
    EXPECT_TRUE(d->has_method("math/double"));

    auto resp = d->dispatch(make_request(1, "math/double", {{"n", 21}}));
    EXPECT_EQ(expect_success(resp).result.at("value"), 42);
}

TEST(Dispatcher, ExtraMethodErrorsAreFlattened) {
    auto opts = test_options();
    opts.extra_methods["strict"] = [](const nlohmann::json&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "nope"};
    };
    opts.extra_methods["protocol"] = [](const nlohmann::json&) -> HandlerResult {
        throw McpProtocolError(error::InvalidParams, "bad shape");
    };
    opts.extra_methods["typed"] = [](const nlohmann::json& params) -> HandlerResult {
        // nlohmann throws type_error for a missing/mistyped field
        return nlohmann::json(params.at("n").get<int>());
    };
    auto d = make_dispatcher(std::move(opts));

    for (const char* method : {"strict", "protocol", "typed"}) {
        auto resp = d->dispatch(make_request(1, method));
        EXPECT_EQ(expect_failure(resp).error.code, error::InternalError) << method;
    }
    EXPECT_EQ(expect_failure(d->dispatch(make_request(1, "protocol"))).error.message, "bad shape");
}

TEST(Dispatcher, NonStdExceptionBecomesInternalError) {
    auto opts = test_options();
    opts.extra_methods["weird"] = [](const nlohmann::json&) -> HandlerResult {
        throw 42;
    };
    auto d = make_dispatcher(std::move(opts));

    JsonRpcResponse resp;
    EXPECT_NO_THROW(resp = d->dispatch(make_request("w", "weird")));
    const auto& fail = expect_failure(resp);
    EXPECT_EQ(fail.id, "w");
    EXPECT_EQ(fail.error.code, error::InternalError);
    EXPECT_EQ(fail.error.message, "Unknown error");
}

TEST(Dispatcher, ExtraMethodCannotShadowBuiltin) {
    auto opts = test_options();
    opts.extra_methods["tools/list"] = [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    };
    EXPECT_THROW(make_dispatcher(std::move(opts)), McpConfigError);
}
