#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/forge_errors.hpp"
#include "protocol/remote_tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::Result;
using forge::core::errors::get_error;
using forge::core::errors::is_error;
using forge::protocol::RemoteRequest;
using forge::protocol::RemoteResponse;
using forge::protocol::RemoteToolDescriptor;
using forge::protocol::RiskClass;
using forge::protocol::ToolResult;
using forge::tools::ToolContext;
using forge::tools::ToolDescriptor;
using forge::tools::ToolHandler;
using forge::tools::ToolRegistry;
using forge::tools::effective_risk;

class EchoHandler : public ToolHandler {
public:
    Result<ToolResult> invoke(const ToolContext& context, const nlohmann::json&) override {
        return ToolResult::text(context.call_id, "echo");
    }
};

class StubHost : public forge::protocol::RemoteToolHost {
public:
    const std::string& host_name() const override { return name_; }
    Result<std::vector<RemoteToolDescriptor>> initialize() override {
        return std::vector<RemoteToolDescriptor>{};
    }
    Result<RemoteResponse> call(const RemoteRequest&,
                                const forge::core::concurrency::CancelToken&) override {
        return RemoteResponse{};
    }

private:
    std::string name_ = "docs";
};

ToolDescriptor make_tool(const std::string& name, RiskClass risk = RiskClass::Safe) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = "Tool " + name;
    descriptor.risk_class = risk;
    descriptor.handler = std::make_shared<EchoHandler>();
    return descriptor;
}

TEST(ToolRegistryTest, KeepsRegistrationOrder) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(make_tool("read_file"))));
    ASSERT_FALSE(is_error(registry.register_tool(make_tool("write_file", RiskClass::Mutating))));

    const auto names = registry.names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "read_file");
    EXPECT_EQ(names[1], "write_file");
    ASSERT_NE(registry.find("write_file"), nullptr);
    EXPECT_EQ(registry.find("write_file")->risk_class, RiskClass::Mutating);
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST(ToolRegistryTest, RejectsDuplicatesAndIncompleteTools) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(make_tool("read_file"))));

    auto duplicate = registry.register_tool(make_tool("read_file"));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).category, ErrorCategory::Fatal);
    EXPECT_EQ(get_error(duplicate).code, "duplicate_tool");

    auto nameless = make_tool("");
    EXPECT_EQ(get_error(registry.register_tool(nameless)).code, "invalid_tool");
    auto no_handler = make_tool("orphan");
    no_handler.handler.reset();
    EXPECT_EQ(get_error(registry.register_tool(no_handler)).code, "invalid_tool");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistryTest, SpecsAppendUsageHint) {
    ToolRegistry registry;
    auto tool = make_tool("search_files");
    tool.usage_hint = "Prefer narrow patterns.";
    ASSERT_FALSE(is_error(registry.register_tool(tool)));
    const auto specs = registry.specs();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].description, "Tool search_files\nPrefer narrow patterns.");
}

TEST(ToolRegistryTest, MergeRemoteRegistersProxiesAndDetectsClashes) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(make_tool("read_file"))));
    auto host = std::make_shared<StubHost>();

    std::vector<RemoteToolDescriptor> advertised(1);
    advertised[0].name = "lookup_docs";
    advertised[0].description = "Search documentation";
    ASSERT_FALSE(is_error(registry.merge_remote(host, advertised, RiskClass::Network)));
    const auto* merged = registry.find("lookup_docs");
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->origin, "docs");
    EXPECT_EQ(merged->risk_class, RiskClass::Network);

    std::vector<RemoteToolDescriptor> clashing(1);
    clashing[0].name = "read_file";
    auto status = registry.merge_remote(host, clashing, RiskClass::Network);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "duplicate_tool");
}

TEST(ToolRegistryTest, ClassifierOnlyRaisesRisk) {
    auto tool = make_tool("execute_command", RiskClass::Mutating);
    tool.classifier = [](const nlohmann::json& args) {
        return args.value("command", "") == "rm -rf ." ? RiskClass::Destructive : RiskClass::Safe;
    };
    EXPECT_EQ(effective_risk(tool, {{"command", "rm -rf ."}}), RiskClass::Destructive);
    EXPECT_EQ(effective_risk(tool, {{"command", "ls"}}), RiskClass::Mutating);
    EXPECT_EQ(effective_risk(make_tool("read_file"), nlohmann::json::object()), RiskClass::Safe);
}

}  // namespace
