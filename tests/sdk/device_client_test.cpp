/**
 * @file device_client_test.cpp
 * @brief Command handling, scan lifecycle and client configuration
 */

#include "core/client_config.h"
#include "core/device_client.h"
#include "fakes/fake_transport.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace scanlink;
using namespace scanlink::sdk;

namespace {

const char* kDeviceId = "3f2b8c1e-9a4d-4e7f-8b21-6c5d0e9f1a2b";

nlohmann::json config_json() {
    return nlohmann::json{
        {"server", {{"host", "scanner-hub.local"}, {"port", 8100}, {"websocket_path", "/ws"}}},
        {"device", {{"device_id", kDeviceId}, {"device_token", "secret"}}},
        {"details",
         {{"device_name", "MR-Lab-1"},
          {"serial_number", "SN-0042"},
          {"manufacturer", "Brainlink"},
          {"modality", "MRI"},
          {"site", "Berlin"},
          {"parameter", {{"larmor_frequency", 2.0e6}}}}},
        {"timing", {{"heartbeat_interval_s", 1}, {"reconnect_delay_s", 0.05}}},
        {"upload", {{"max_attempts", 3}, {"backoff_unit_ms", 1}, {"chunk_size", 8}}}};
}

std::string start_command(const std::string& task_id) {
    return nlohmann::json{{"command", "start"},
                          {"data",
                           {{"id", task_id},
                            {"device_id", kDeviceId},
                            {"access_token", "tok"},
                            {"sequence", {{"name", "flash"}}},
                            {"device_parameter", {{"larmor_frequency", 2.0e6}}}}}}
        .dump();
}

std::vector<std::string> statuses(const test::FakeTransport& transport) {
    std::vector<std::string> out;
    for (const auto& update : transport.statusUpdates()) {
        out.push_back(update["status"].get<std::string>());
    }
    return out;
}

}  // namespace

TEST_CASE("client configuration", "[sdk][config]") {
    SECTION("all sections are read") {
        auto config = ClientConfig::from_json(config_json());
        CHECK(config->endpoint.host == "scanner-hub.local");
        CHECK(config->endpoint.port == 8100);
        CHECK(config->endpoint.path == "/ws");
        CHECK(config->endpoint.device_id == kDeviceId);
        CHECK(config->details.serial_number == "SN-0042");
        CHECK(config->heartbeat_interval == std::chrono::seconds(1));
        CHECK(config->reconnect_delay == std::chrono::milliseconds(50));
        CHECK(config->upload.chunk_size == 8);
        CHECK(config->validate());
    }

    SECTION("defaults apply to optional sections") {
        auto j = config_json();
        j.erase("timing");
        j.erase("upload");
        auto config = ClientConfig::from_json(j);
        CHECK(config->heartbeat_interval == std::chrono::seconds(SCANLINK_HEARTBEAT_INTERVAL_S));
        CHECK(config->upload.max_attempts == SCANLINK_UPLOAD_MAX_ATTEMPTS);
    }

    SECTION("credentials and details are required") {
        auto no_device = config_json();
        no_device.erase("device");
        CHECK_THROWS_AS(ClientConfig::from_json(no_device), std::invalid_argument);

        auto no_details = config_json();
        no_details.erase("details");
        CHECK_THROWS_AS(ClientConfig::from_json(no_details), std::invalid_argument);

        auto bad_details = config_json();
        bad_details["details"].erase("site");
        CHECK_THROWS_AS(ClientConfig::from_json(bad_details), std::invalid_argument);
    }

    SECTION("attempt count is bounded") {
        auto j = config_json();
        j["upload"]["max_attempts"] = 64;
        CHECK_FALSE(ClientConfig::from_json(j)->validate());
        j["upload"]["max_attempts"] = SCANLINK_UPLOAD_MAX_ATTEMPTS_LIMIT;
        CHECK(ClientConfig::from_json(j)->validate());
    }

    SECTION("device id must be a uuid") {
        auto j = config_json();
        j["device"]["device_id"] = "scanner-1";
        CHECK_FALSE(ClientConfig::from_json(j)->validate());
    }

    SECTION("missing file") {
        CHECK_THROWS_AS(ClientConfig::from_file("/nonexistent/device.json"), std::runtime_error);
    }
}

TEST_CASE("connect and register", "[sdk][client]") {
    auto config = ClientConfig::from_json(config_json());
    test::FakeTransport transport;
    DeviceClient client(*config, transport);

    SECTION("first connection goes online then registers") {
        REQUIRE(client.connectAndRegister());
        auto sent = transport.sentJson();
        REQUIRE(sent.size() == 2);
        CHECK(sent[0]["command"] == "update_status");
        CHECK(sent[0]["status"] == "ONLINE");
        CHECK(sent[1]["command"] == "register");
        CHECK(sent[1]["data"]["serial_number"] == "SN-0042");
        CHECK(client.getState() == DeviceStatus::ONLINE);
    }

    SECTION("refused connection") {
        transport.refuse_connect = true;
        CHECK_FALSE(client.connectAndRegister());
        CHECK(client.getState() == DeviceStatus::OFFLINE);
    }

    SECTION("reconnect while busy resends the current state") {
        REQUIRE(client.connectAndRegister());
        client.stateMachine().transition(DeviceStatus::BUSY);
        transport.clearSent();

        REQUIRE(client.connectAndRegister());
        auto updates = transport.statusUpdates();
        REQUIRE(updates.size() == 1);
        CHECK(updates[0]["status"] == "BUSY");
        CHECK(client.getState() == DeviceStatus::BUSY);
    }
}

TEST_CASE("start command runs a scan", "[sdk][client]") {
    auto config = ClientConfig::from_json(config_json());
    test::FakeTransport transport;
    DeviceClient client(*config, transport);
    REQUIRE(client.connectAndRegister());
    transport.clearSent();

    SECTION("successful scan goes busy, reports progress and returns online") {
        std::string seen_sequence;
        client.setScanCallback([&](const protocol::AcquisitionPayload& task, CancellationToken&) {
            seen_sequence = task.sequence["name"].get<std::string>();
            client.sendScanningStatus(50, task.id, task.access_token);
        });

        client.handleMessage(start_command("t-1"));
        client.scanTasks().waitAll();

        CHECK(seen_sequence == "flash");
        CHECK(statuses(transport) == std::vector<std::string>{"BUSY", "BUSY", "ONLINE"});

        auto updates = transport.statusUpdates();
        CHECK(updates[0]["task_id"] == "t-1");
        CHECK(updates[0]["data"]["progress"] == 0);
        CHECK(updates[1]["data"]["progress"] == 50);
        CHECK(updates[1]["user_access_token"] == "tok");
        CHECK(client.getState() == DeviceStatus::ONLINE);
    }

    SECTION("failing scan reports the error and recovers") {
        client.setScanCallback([](const protocol::AcquisitionPayload&, CancellationToken&) {
            throw std::runtime_error("Gradient amplifier fault");
        });

        client.handleMessage(start_command("t-2"));
        client.scanTasks().waitAll();

        CHECK(statuses(transport) == std::vector<std::string>{"BUSY", "ERROR", "ONLINE"});
        auto error = transport.statusUpdates()[1];
        CHECK(error["task_id"] == "t-2");
        CHECK(error["data"]["error_message"] == "Gradient amplifier fault");
    }

    SECTION("cancelled scan reports an error") {
        client.setScanCallback([](const protocol::AcquisitionPayload&, CancellationToken& token) {
            while (token.waitFor(std::chrono::milliseconds(5))) {
            }
            token.throwIfCancelled();
        });

        client.handleMessage(start_command("t-3"));
        for (int i = 0; i < 200 && !client.scanTasks().isActive("t-3"); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        CHECK(client.cancelScan("t-3"));
        client.scanTasks().waitAll();

        auto updates = transport.statusUpdates();
        REQUIRE(updates.size() == 3);
        CHECK(updates[1]["status"] == "ERROR");
        CHECK(updates[1]["data"]["error_message"] == "Scan cancelled");
    }

    SECTION("no scan callback") {
        client.handleMessage(start_command("t-4"));
        auto updates = transport.statusUpdates();
        REQUIRE(updates.size() == 1);
        CHECK(updates[0]["status"] == "ONLINE");
        CHECK(updates[0]["data"]["error_message"] == "Scan callback not defined.");
    }
}

TEST_CASE("one scan at a time", "[sdk][client]") {
    auto config = ClientConfig::from_json(config_json());
    test::FakeTransport transport;
    DeviceClient client(*config, transport);
    REQUIRE(client.connectAndRegister());
    transport.clearSent();

    std::atomic<int> runs{0};
    client.setScanCallback([&](const protocol::AcquisitionPayload&, CancellationToken& token) {
        ++runs;
        while (token.waitFor(std::chrono::milliseconds(5))) {
        }
    });

    client.handleMessage(start_command("t-1"));
    REQUIRE(client.getState() == DeviceStatus::BUSY);

    client.handleMessage(start_command("t-2"));
    client.handleMessage(start_command("t-1"));

    CHECK(client.getState() == DeviceStatus::BUSY);
    CHECK(client.stateMachine().hasTask("t-1"));
    CHECK_FALSE(client.stateMachine().hasTask("t-2"));
    CHECK(client.scanTasks().activeCount() == 1);

    auto updates = transport.statusUpdates();
    REQUIRE(updates.size() == 2);
    CHECK(updates[0]["status"] == "BUSY");
    CHECK(updates[0]["task_id"] == "t-1");
    CHECK(updates[1]["status"] == "ERROR");
    CHECK(updates[1]["task_id"] == "t-2");
    CHECK(updates[1]["user_access_token"] == "tok");
    CHECK(updates[1]["data"]["error_message"] == "Device cannot start a scan while another scan is running");

    CHECK(client.cancelScan("t-1"));
    client.scanTasks().waitAll();

    CHECK(runs == 1);
    CHECK(statuses(transport) == std::vector<std::string>{"BUSY", "ERROR", "ERROR", "ONLINE"});
    CHECK(transport.statusUpdates()[2]["task_id"] == "t-1");
    CHECK(client.getState() == DeviceStatus::ONLINE);

    SECTION("the device accepts a new scan once idle") {
        client.setScanCallback([](const protocol::AcquisitionPayload&, CancellationToken&) {});
        client.handleMessage(start_command("t-3"));
        client.scanTasks().waitAll();
        CHECK(statuses(transport).back() == "ONLINE");
        CHECK(transport.statusUpdates()[4]["task_id"] == "t-3");
    }
}

TEST_CASE("stop cancels scans, reports offline, then disconnects", "[sdk][client]") {
    auto config = ClientConfig::from_json(config_json());
    test::FakeTransport transport;
    DeviceClient client(*config, transport);

    std::atomic<bool> scanning{false};
    std::atomic<size_t> sent_when_cancelled{0};
    client.setScanCallback([&](const protocol::AcquisitionPayload&, CancellationToken& token) {
        scanning = true;
        while (token.waitFor(std::chrono::milliseconds(5))) {
        }
        sent_when_cancelled = transport.sent().size();
        token.throwIfCancelled();
    });

    REQUIRE(client.start());
    transport.pushText(start_command("t-1"));
    for (int i = 0; i < 500 && !scanning; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    REQUIRE(scanning);

    client.stop();

    auto sent = transport.sent();
    auto marks = transport.disconnectMarks();
    REQUIRE(marks.size() == 1);
    CHECK(marks[0] == sent.size());

    auto updates = transport.statusUpdates();
    REQUIRE(updates.size() >= 4);
    CHECK(updates.back()["status"] == "OFFLINE");
    CHECK(updates[updates.size() - 2]["status"] == "ONLINE");
    CHECK(updates[updates.size() - 3]["status"] == "ERROR");
    CHECK(updates[updates.size() - 3]["data"]["error_message"] == "Scan cancelled");

    // Cancellation was observed before any of the shutdown updates went out
    for (size_t i = 0; i < sent_when_cancelled; ++i) {
        if (sent[i].type == FrameType::TEXT) {
            CHECK(nlohmann::json::parse(sent[i].payload).value("status", "") != "OFFLINE");
        }
    }
    CHECK(client.getState() == DeviceStatus::OFFLINE);
    CHECK_FALSE(transport.isConnected());
}

TEST_CASE("server messages reach the handlers", "[sdk][client]") {
    auto config = ClientConfig::from_json(config_json());
    test::FakeTransport transport;
    DeviceClient client(*config, transport);

    std::vector<std::string> feedback;
    std::vector<std::string> errors;
    client.setFeedbackHandler([&](const std::string& m) { feedback.push_back(m); });
    client.setErrorHandler([&](const std::string& m) { errors.push_back(m); });

    client.handleMessage(R"({"command":"feedback","message":"Device registered successfully"})");
    client.handleMessage(R"({"command":"pong"})");
    client.handleMessage(R"({"command":"reboot"})");
    client.handleMessage("garbage");

    CHECK(feedback == std::vector<std::string>{"Device registered successfully"});
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("reboot") != std::string::npos);
}

TEST_CASE("exhausted upload moves the device to error", "[sdk][client][upload]") {
    auto path = std::filesystem::temp_directory_path() / "scanlink_client_upload.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "raw-data";
    }

    auto config = ClientConfig::from_json(config_json());
    test::FakeTransport transport;
    DeviceClient client(*config, transport);
    REQUIRE(client.connectAndRegister());
    client.stateMachine().transition(DeviceStatus::BUSY);
    transport.clearSent();

    UploadJob job;
    job.file_path = path.string();
    job.task_id = "t-5";
    job.user_access_token = "tok";

    transport.fail_next_texts = 3;
    CHECK_FALSE(client.fileUploader().sendWithRetry(job));

    auto updates = transport.statusUpdates();
    REQUIRE(updates.size() == 1);
    CHECK(updates[0]["status"] == "ERROR");
    CHECK(updates[0]["task_id"] == "t-5");
    CHECK(updates[0]["data"]["error_message"] == "File upload failed after 3 attempts.");
    CHECK(client.getState() == DeviceStatus::ERROR);

    std::filesystem::remove(path);
}
