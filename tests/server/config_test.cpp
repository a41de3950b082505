/**
 * @file config_test.cpp
 * @brief Device manager configuration loading and validation
 */

#include "core/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>

using namespace scanlink::core;

TEST_CASE("defaults", "[server][config]") {
    auto config = ManagerConfig::create_default();
    CHECK(config->server.port == 8000);
    CHECK(config->server.websocket_path == "/api/v1/device/ws");
    CHECK(config->liveness.device_timeout_s == 60);
    CHECK(config->liveness.sweep_interval_s == 30);
    CHECK(config->exam_manager.port == 8004);
    CHECK(config->validate());
}

TEST_CASE("sections override defaults", "[server][config]") {
    auto config = ManagerConfig::from_json({{"server", {{"port", 9100}, {"websocket_path", "/ws"}}},
                                            {"liveness", {{"device_timeout_s", 20}}},
                                            {"storage", {{"data_lake_directory", "/srv/lake"}}},
                                            {"logging", {{"level", "DEBUG"}, {"status_interval_s", 0}}}});
    CHECK(config->server.port == 9100);
    CHECK(config->server.host == "0.0.0.0");
    CHECK(config->server.websocket_path == "/ws");
    CHECK(config->liveness.device_timeout_s == 20);
    CHECK(config->liveness.sweep_interval_s == 30);
    CHECK(config->storage.data_lake_directory == "/srv/lake");
    CHECK(config->logging.status_interval_s == 0);
}

TEST_CASE("invalid configurations", "[server][config]") {
    CHECK_THROWS_AS(ManagerConfig::from_json(nlohmann::json::array()), std::invalid_argument);
    CHECK_THROWS_AS(ManagerConfig::from_json({{"server", {{"port", "eighty"}}}}), std::invalid_argument);
    CHECK_THROWS_AS(ManagerConfig::from_file("/nonexistent/device_manager.json"), std::runtime_error);

    auto config = ManagerConfig::create_default();
    config->server.websocket_path = "ws";
    CHECK_FALSE(config->validate());

    config = ManagerConfig::create_default();
    config->liveness.device_timeout_s = 0;
    CHECK_FALSE(config->validate());
}

TEST_CASE("environment overrides the data lake", "[server][config]") {
    auto config = ManagerConfig::create_default();
    config->storage.data_lake_directory = "/from/file";

    setenv("DATA_LAKE_DIRECTORY", "/from/env", 1);
    config->apply_environment();
    unsetenv("DATA_LAKE_DIRECTORY");

    CHECK(config->storage.data_lake_directory == "/from/env");
}

TEST_CASE("save and reload", "[server][config]") {
    auto path = std::filesystem::temp_directory_path() / "scanlink_manager_config.json";
    auto config = ManagerConfig::create_default();
    config->server.port = 8123;
    config->security.hash_iterations = 5000;
    config->save_to_file(path.string());

    auto loaded = ManagerConfig::from_file(path.string());
    CHECK(loaded->server.port == 8123);
    CHECK(loaded->security.hash_iterations == 5000);
    CHECK(loaded->to_json() == config->to_json());

    std::filesystem::remove(path);
}
