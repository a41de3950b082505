/**
 * @file scan_launcher_test.cpp
 * @brief Start command delivery to connected devices
 */

#include "fakes/fake_services.hpp"
#include "services/scan_launcher.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace scanlink;
using namespace scanlink::services;

namespace {

const char* kDevice = "3f2b8c1e-9a4d-4e7f-8b21-6c5d0e9f1a2b";

struct LauncherFixture {
    test::InMemoryDeviceRepository repository;
    test::FakeExamService exam;
    SessionRegistry sessions;
    ScanLauncher launcher{repository, exam, sessions};
    std::shared_ptr<test::FakeConnection> connection = std::make_shared<test::FakeConnection>();

    LauncherFixture() {
        repository.add(kDevice, protocol::DeviceStatus::ONLINE);
        sessions.register_session(kDevice, connection);
        exam.sequences["s-1"] = {{"id", "s-1"}, {"name", "flash"}};
    }

    nlohmann::json task() const {
        return {{"id", "t-1"}, {"device_id", kDevice}, {"sequence_id", "s-1"}, {"workflow_id", "w-1"}};
    }
};

}  // namespace

TEST_CASE("start command is delivered", "[server][launcher]") {
    LauncherFixture f;
    auto result = f.launcher.launch(f.task(), "tok");

    REQUIRE(result.ok());
    REQUIRE(f.connection->texts.size() == 1);

    auto message = nlohmann::json::parse(f.connection->texts[0]);
    CHECK(message["command"] == "start");
    CHECK(message["data"]["id"] == "t-1");
    CHECK(message["data"]["workflow_id"] == "w-1");
    CHECK(message["data"]["sequence"]["name"] == "flash");
    CHECK(message["data"]["access_token"] == "tok");
    CHECK(message["data"]["device_parameter"]["larmor_frequency"] == 2.0e6);
    CHECK(f.exam.last_token == "tok");
}

TEST_CASE("launch failures", "[server][launcher]") {
    LauncherFixture f;
    auto task = f.task();

    SECTION("missing device id") {
        task.erase("device_id");
        auto result = f.launcher.launch(task, "tok");
        CHECK(result.code == LaunchResult::Code::NOT_FOUND);
        CHECK(result.detail == "Missing device ID");
    }

    SECTION("missing sequence id") {
        task.erase("sequence_id");
        auto result = f.launcher.launch(task, "tok");
        CHECK(result.code == LaunchResult::Code::NOT_FOUND);
        CHECK(result.detail == "Missing sequence ID");
    }

    SECTION("unknown sequence") {
        task["sequence_id"] = "s-404";
        auto result = f.launcher.launch(task, "tok");
        CHECK(result.code == LaunchResult::Code::NOT_FOUND);
        CHECK(result.detail == "Sequence not found");
    }

    SECTION("exam manager failure") {
        f.exam.fail_get_sequence = true;
        CHECK(f.launcher.launch(task, "tok").code == LaunchResult::Code::UPSTREAM_FAILURE);
    }

    SECTION("unknown device") {
        task["device_id"] = "00000000-0000-4000-8000-000000000000";
        auto result = f.launcher.launch(task, "tok");
        CHECK(result.code == LaunchResult::Code::NOT_FOUND);
        CHECK(result.detail == "Device not found");
    }

    SECTION("device store failure") {
        f.repository.fail = true;
        CHECK(f.launcher.launch(task, "tok").code == LaunchResult::Code::UPSTREAM_FAILURE);
    }

    SECTION("device without a session") {
        f.sessions.remove(kDevice);
        auto result = f.launcher.launch(task, "tok");
        CHECK(result.code == LaunchResult::Code::DEVICE_OFFLINE);
        CHECK(result.detail == "Device offline.");
    }

    SECTION("send failure counts as offline") {
        f.connection->refuse_sends = true;
        CHECK(f.launcher.launch(task, "tok").code == LaunchResult::Code::DEVICE_OFFLINE);
    }

    CHECK(f.connection->texts.empty());
}

TEST_CASE("device id is matched case-insensitively", "[server][launcher]") {
    LauncherFixture f;
    auto task = f.task();
    task["device_id"] = "3F2B8C1E-9A4D-4E7F-8B21-6C5D0E9F1A2B";
    CHECK(f.launcher.launch(task, "tok").ok());
}

TEST_CASE("payload construction", "[server][launcher]") {
    auto payload = ScanLauncher::build_payload({{"id", "t-1"}, {"access_token", "stale"}},
                                               {{"name", "flash"}}, "fresh", nullptr);
    CHECK(payload["access_token"] == "fresh");
    CHECK(payload["sequence"]["name"] == "flash");
    CHECK(payload["device_parameter"] == nlohmann::json::object());
}
