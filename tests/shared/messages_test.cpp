/**
 * @file messages_test.cpp
 * @brief Wire message decoding and encoding
 */

#include "shared/common/errors.h"
#include "shared/protocol/messages.h"

#include <catch2/catch_test_macros.hpp>

using namespace scanlink;
using namespace scanlink::protocol;

namespace {

nlohmann::json sample_details() {
    return nlohmann::json{
        {"device_name", "MR-Lab-1"},
        {"serial_number", "SN-0042"},
        {"manufacturer", "Brainlink"},
        {"modality", "MRI"},
        {"site", "Berlin"},
        {"parameter", {{"larmor_frequency", 2.0e6}}}};
}

}  // namespace

TEST_CASE("device status names", "[protocol][status]") {
    CHECK(std::string(to_string(DeviceStatus::BUSY)) == "BUSY");
    CHECK(parse_device_status("busy") == DeviceStatus::BUSY);
    CHECK(parse_device_status("Online") == DeviceStatus::ONLINE);
    CHECK_FALSE(parse_device_status("SLEEPING").has_value());
    CHECK_FALSE(parse_device_status("").has_value());
}

TEST_CASE("device details validation", "[protocol][details]") {
    SECTION("complete details parse") {
        auto details = DeviceDetails::from_json(sample_details());
        CHECK(details.device_name == "MR-Lab-1");
        CHECK(details.ip_address.empty());
        CHECK(details.parameter["larmor_frequency"] == 2.0e6);
    }

    SECTION("missing required field is rejected") {
        auto j = sample_details();
        j.erase("serial_number");
        CHECK_THROWS_AS(DeviceDetails::from_json(j), ProtocolError);
    }

    SECTION("parameter must be an object") {
        auto j = sample_details();
        j["parameter"] = "fast";
        CHECK_THROWS_AS(DeviceDetails::from_json(j), ProtocolError);
    }

    SECTION("ip address is only serialized when set") {
        auto details = DeviceDetails::from_json(sample_details());
        CHECK_FALSE(details.to_json().contains("ip_address"));
        details.ip_address = "10.0.0.7";
        CHECK(details.to_json()["ip_address"] == "10.0.0.7");
    }
}

TEST_CASE("decode device commands", "[protocol][decode]") {
    SECTION("register keeps the raw data") {
        auto message = decode_message(R"({"command":"register","data":{"device_name":"x"}})");
        REQUIRE(std::holds_alternative<RegisterMessage>(message));
        CHECK(std::get<RegisterMessage>(message).data["device_name"] == "x");
    }

    SECTION("ping") {
        CHECK(std::holds_alternative<PingMessage>(decode_message(R"({"command":"ping"})")));
    }

    SECTION("update_status lifts task fields") {
        auto message = decode_message(
            R"({"command":"update_status","status":"BUSY","data":{"progress":40},"task_id":"t-1","user_access_token":"tok"})");
        REQUIRE(std::holds_alternative<UpdateStatusMessage>(message));
        const auto& update = std::get<UpdateStatusMessage>(message);
        CHECK(update.status == "BUSY");
        CHECK(update.data["progress"] == 40);
        CHECK(update.task_id == std::optional<std::string>("t-1"));
        CHECK(update.user_access_token == std::optional<std::string>("tok"));
    }

    SECTION("update_status with null task fields") {
        auto message = decode_message(
            R"({"command":"update_status","status":"ONLINE","data":{},"task_id":null,"user_access_token":null})");
        const auto& update = std::get<UpdateStatusMessage>(message);
        CHECK_FALSE(update.task_id.has_value());
        CHECK_FALSE(update.user_access_token.has_value());
    }

    SECTION("file-transfer header defaults") {
        auto message = decode_message(
            R"({"command":"file-transfer","task_id":"t-1","user_access_token":"tok","size_bytes":12})");
        REQUIRE(std::holds_alternative<FileTransferHeader>(message));
        const auto& header = std::get<FileTransferHeader>(message);
        CHECK(header.filename == "upload.bin");
        CHECK(header.size_bytes == 12);
        CHECK(header.sha256.empty());
    }

    SECTION("file-transfer header without size is rejected") {
        try {
            decode_message(R"({"command":"file-transfer","task_id":"t-1","user_access_token":"tok"})");
            FAIL("expected ProtocolError");
        } catch (const ProtocolError& e) {
            CHECK(std::string(e.what()) == "Invalid file-transfer header.");
        }
    }

    SECTION("unknown commands are preserved") {
        auto message = decode_message(R"({"command":"reboot"})");
        REQUIRE(std::holds_alternative<UnknownMessage>(message));
        CHECK(std::get<UnknownMessage>(message).command == "reboot");
    }

    SECTION("malformed frames") {
        CHECK_THROWS_AS(decode_message("not json"), ProtocolError);
        CHECK_THROWS_AS(decode_message(R"({"data":{}})"), ProtocolError);
        CHECK_THROWS_AS(decode_message("[1,2,3]"), ProtocolError);
    }
}

TEST_CASE("encode server commands", "[protocol][encode]") {
    SECTION("feedback") {
        auto j = nlohmann::json::parse(encode_message(FeedbackMessage{"Device registered successfully"}));
        CHECK(j["command"] == "feedback");
        CHECK(j["message"] == "Device registered successfully");
    }

    SECTION("start carries unknown task fields through") {
        auto payload = AcquisitionPayload::from_json(
            {{"id", "t-9"}, {"device_id", "d-1"}, {"access_token", "tok"}, {"workflow_id", "w-3"},
             {"sequence", {{"name", "flash"}}}});
        auto j = nlohmann::json::parse(encode_message(StartMessage{payload}));
        CHECK(j["command"] == "start");
        CHECK(j["data"]["id"] == "t-9");
        CHECK(j["data"]["workflow_id"] == "w-3");
        CHECK(j["data"]["sequence"]["name"] == "flash");
        CHECK(j["data"]["device_parameter"].is_object());
    }

    SECTION("update_status sends null task fields when absent") {
        UpdateStatusMessage update;
        update.status = "ONLINE";
        auto j = nlohmann::json::parse(encode_message(update));
        CHECK(j["task_id"].is_null());
        CHECK(j["user_access_token"].is_null());
        CHECK(command_name(update) == "update_status");
    }
}
