#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/temp_dir.hpp"

using namespace std;
using namespace runner;
using namespace nlohmann;

TEST(ConfigTest, Defaults) {
    runner_config config;
    EXPECT_EQ(config.docker, "docker");
    EXPECT_EQ(config.watchdog_margin, 10);
    EXPECT_EQ(config.stream_limit, 4u << 20);
    EXPECT_GE(effective_concurrency(config), 1u);
}

TEST(ConfigTest, LoadOverridesPresentKeysOnly) {
    test::temp_dir dir;
    write_file_content(dir / "config.json", R"({
        "runDir": "/srv/runs",
        "images": {"python": "pypy:3"},
        "maxConcurrentRuns": 3,
        "watchdogMargin": 2
    })");

    runner_config config;
    config.workspace_dir = "/srv/workspaces";
    load_config(dir / "config.json", config);

    EXPECT_EQ(config.run_dir.string(), "/srv/runs");
    EXPECT_EQ(config.workspace_dir.string(), "/srv/workspaces");
    EXPECT_EQ(config.docker, "docker");
    EXPECT_EQ(config.images.at("python"), "pypy:3");
    EXPECT_EQ(config.max_concurrent_runs, 3u);
    EXPECT_EQ(effective_concurrency(config), 3u);
    EXPECT_EQ(config.watchdog_margin, 2);
}

TEST(ConfigTest, MalformedConfig) {
    test::temp_dir dir;
    write_file_content(dir / "config.json", "{not json");
    runner_config config;
    EXPECT_THROW(load_config(dir / "config.json", config), json::exception);
    EXPECT_THROW(load_config(dir / "missing.json", config), system_error);
}
