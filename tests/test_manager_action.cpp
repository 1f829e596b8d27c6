// =============================================================================
// FILE: tests/test_manager_action.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "manager/manager_action.h"
#include "live/originate_request.h"

using namespace asterisk_live;

TEST(ManagerAction, SerializeOrder) {
    ManagerAction a("Command");
    a.set("Command", "show version");
    EXPECT_EQ(a.serialize("12"),
              "Action: Command\r\nActionID: 12\r\nCommand: show version\r\n\r\n");
}

TEST(ManagerAction, SetReplacesExistingKey) {
    ManagerAction a("Originate");
    a.set("Timeout", "1000").set("timeout", "2000");
    ASSERT_EQ(a.fields().size(), 1u);
    EXPECT_EQ(a.get("Timeout"), "2000");
}

TEST(ManagerAction, VariablesAreSeparateLines) {
    ManagerAction a("Originate");
    a.add_variable("A", "1").add_variable("B", "2");
    std::string wire = a.serialize("");
    EXPECT_NE(wire.find("Variable: A=1\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Variable: B=2\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("ActionID"), std::string::npos);
}

TEST(ManagerAction, LoginEventsFlag) {
    EXPECT_EQ(ManagerAction::login("u", "p", true).get("Events"), "on");
    EXPECT_EQ(ManagerAction::login("u", "p", false).get("Events"), "off");
}

TEST(ManagerAction, SnapshotActionsAreEventGenerating) {
    auto status = ManagerAction::status();
    EXPECT_TRUE(status.is_event_generating());
    EXPECT_TRUE(status.is_completion_event("StatusComplete"));
    EXPECT_TRUE(status.is_completion_event("statuscomplete"));
    EXPECT_FALSE(status.is_completion_event("Status"));

    EXPECT_TRUE(ManagerAction::queue_status().is_completion_event("QueueStatusComplete"));
    EXPECT_FALSE(ManagerAction::ping().is_event_generating());
}

TEST(OriginateRequest, ExtensionTarget) {
    OriginateRequest req;
    req.channel = "SIP/1000";
    req.target = ExtensionTarget{"default", "2000", 1};
    req.timeout = Millisecs(15000);
    req.variables["ACCOUNT"] = "42";
    ASSERT_EQ(req.validate(), Result::kOk);

    auto a = req.to_action();
    EXPECT_EQ(a.name(), "Originate");
    EXPECT_EQ(a.get("Channel"), "SIP/1000");
    EXPECT_EQ(a.get("Context"), "default");
    EXPECT_EQ(a.get("Exten"), "2000");
    EXPECT_EQ(a.get("Priority"), "1");
    EXPECT_EQ(a.get("Timeout"), "15000");
    EXPECT_EQ(a.get("Async"), "true");
    EXPECT_EQ(a.get("Application"), "");
    ASSERT_EQ(a.variables().size(), 1u);
    EXPECT_TRUE(a.is_completion_event("OriginateResponse"));
    EXPECT_TRUE(a.is_completion_event("OriginateFailure"));
}

TEST(OriginateRequest, ApplicationTarget) {
    OriginateRequest req;
    req.channel = "Local/100@test";
    req.target = ApplicationTarget{"Playback", "hello-world"};
    ASSERT_EQ(req.validate(), Result::kOk);

    auto a = req.to_action();
    EXPECT_EQ(a.get("Application"), "Playback");
    EXPECT_EQ(a.get("Data"), "hello-world");
    EXPECT_EQ(a.get("Context"), "");
    EXPECT_EQ(a.get("Timeout"), "30000");
}

TEST(OriginateRequest, ValidateRejectsMissingParts) {
    OriginateRequest req;
    req.target = ExtensionTarget{"default", "2000", 1};
    EXPECT_EQ(req.validate(), Result::kInvalidArgument);

    req.channel = "SIP/1000";
    req.target = ExtensionTarget{"", "2000", 1};
    EXPECT_EQ(req.validate(), Result::kInvalidArgument);

    req.target = ApplicationTarget{"", ""};
    EXPECT_EQ(req.validate(), Result::kInvalidArgument);

    req.target = ApplicationTarget{"Playback", ""};
    req.timeout = Millisecs(0);
    EXPECT_EQ(req.validate(), Result::kInvalidArgument);
}
