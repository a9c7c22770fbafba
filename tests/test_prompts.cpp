#include <gtest/gtest.h>
#include <cli/prompts.hpp>
#include <core/constants.hpp>
#include "fake_runtime.hpp"

// ── resolve_field ───────────────────────────────────────────

TEST(Prompts, EmptyInputUsesDefault) {
    EXPECT_EQ(resolve_field("", "fallback"), "fallback");
}

TEST(Prompts, WhitespaceOnlyInputUsesDefault) {
    EXPECT_EQ(resolve_field("   ", "fallback"), "fallback");
    EXPECT_EQ(resolve_field("\t \r", "fallback"), "fallback");
}

TEST(Prompts, NonBlankInputIsVerbatim) {
    EXPECT_EQ(resolve_field("my-box", "fallback"), "my-box");
    EXPECT_EQ(resolve_field("  padded ", "fallback"), "  padded ");
}

// ── resolve_session_config ──────────────────────────────────

TEST(Prompts, AllEmptyResolvesToCompiledDefaults) {
    std::vector<std::string> events;
    ScriptedReader reader(events, {"", "", ""});

    auto session = resolve_session_config(reader, SessionDefaults{});

    EXPECT_EQ(session.container_name, DEFAULT_CONTAINER_NAME);
    EXPECT_EQ(session.image_name, DEFAULT_IMAGE_NAME);
    EXPECT_EQ(session.mount_path, DEFAULT_MOUNT_DIR);
    EXPECT_EQ(events.size(), 3u);
}

TEST(Prompts, OverridesAreAppliedPerField) {
    std::vector<std::string> events;
    ScriptedReader reader(events, {"box", "", "/data"});

    auto session = resolve_session_config(reader, SessionDefaults{});

    EXPECT_EQ(session.container_name, "box");
    EXPECT_EQ(session.image_name, DEFAULT_IMAGE_NAME);
    EXPECT_EQ(session.mount_path, "/data");
}

TEST(Prompts, EndOfInputUsesDefaults) {
    std::vector<std::string> events;
    ScriptedReader reader(events, {});

    SessionDefaults defaults;
    defaults.container_name = "cfg-box";
    auto session = resolve_session_config(reader, defaults);

    EXPECT_EQ(session.container_name, "cfg-box");
    EXPECT_EQ(session.image_name, DEFAULT_IMAGE_NAME);
    EXPECT_EQ(session.mount_path, DEFAULT_MOUNT_DIR);
}

TEST(Prompts, PromptNamesTheDefault) {
    std::vector<std::string> events;
    ScriptedReader reader(events, {""});

    prompt_field(reader, "Container name", "abc");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_NE(events[0].find("Container name"), std::string::npos);
    EXPECT_NE(events[0].find("[abc]"), std::string::npos);
}
