#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path project_dir;
    fs::path global_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "devbox_config_test";
        fs::remove_all(test_dir);
        project_dir = test_dir / "project";
        fs::create_directories(project_dir);
        fs::create_directories(test_dir / "home");
        global_path = test_dir / "home" / "config.yaml";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_global(const std::string& content) {
        std::ofstream(global_path) << content;
    }

    void write_project(const std::string& content) {
        std::ofstream(project_dir / "devbox.yaml") << content;
    }
};

TEST_F(ConfigTest, NoFilesGivesCompiledDefaults) {
    auto result = Config::load(project_dir, global_path);
    ASSERT_TRUE(result.is_ok()) << result.error;

    const auto& cfg = result.value;
    EXPECT_EQ(cfg.defaults().container_name, DEFAULT_CONTAINER_NAME);
    EXPECT_EQ(cfg.defaults().image_name, DEFAULT_IMAGE_NAME);
    EXPECT_EQ(cfg.defaults().mount_path, DEFAULT_MOUNT_DIR);
    EXPECT_EQ(cfg.launch().runtime, "docker");
    EXPECT_EQ(cfg.launch().workspace, "/workspace");
    EXPECT_EQ(cfg.launch().env_file, ".env");
    EXPECT_EQ(cfg.launch().shell, "/bin/bash");
    EXPECT_EQ(cfg.launch().gpus, "all");
    EXPECT_EQ(cfg.launch().tick_ms, MONITOR_TICK_MS);
}

TEST_F(ConfigTest, GlobalOverridesDefaults) {
    write_global("container: lab-box\nruntime: podman\n");

    auto result = Config::load(project_dir, global_path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.defaults().container_name, "lab-box");
    EXPECT_EQ(result.value.defaults().image_name, DEFAULT_IMAGE_NAME);
    EXPECT_EQ(result.value.launch().runtime, "podman");
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_global("container: lab-box\nimage: lab-image\n");
    write_project("image: project-image\nmount: /srv/data\ngpus: \"device=0\"\n");

    auto result = Config::load(project_dir, global_path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.defaults().container_name, "lab-box");
    EXPECT_EQ(result.value.defaults().image_name, "project-image");
    EXPECT_EQ(result.value.defaults().mount_path, "/srv/data");
    EXPECT_EQ(result.value.launch().gpus, "device=0");
}

TEST_F(ConfigTest, BlankValuesKeepDefaults) {
    write_project("container: \"  \"\nimage:\n");

    auto result = Config::load(project_dir, global_path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.defaults().container_name, DEFAULT_CONTAINER_NAME);
    EXPECT_EQ(result.value.defaults().image_name, DEFAULT_IMAGE_NAME);
}

TEST_F(ConfigTest, EmptyFileIsAccepted) {
    write_project("");
    auto result = Config::load(project_dir, global_path);
    EXPECT_TRUE(result.is_ok()) << result.error;
}

TEST_F(ConfigTest, MalformedYamlIsAnError) {
    write_project("container: [unterminated\n");

    auto result = Config::load(project_dir, global_path);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("devbox.yaml"), std::string::npos);
}

TEST_F(ConfigTest, NonMappingTopLevelIsAnError) {
    write_global("- a\n- b\n");
    auto result = Config::load(project_dir, global_path);
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, TickIsClamped) {
    write_project("tick_ms: 1\n");
    auto result = Config::load(project_dir, global_path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.launch().tick_ms, MIN_MONITOR_TICK_MS);
}

TEST_F(ConfigTest, LoadFileRequiresExistingFile) {
    auto result = Config::load_file(test_dir / "missing.yaml");
    EXPECT_TRUE(result.is_err());
}
