/**
 * @file fake_services.hpp
 * @brief In-memory collaborators for device manager tests
 */

#ifndef SCANLINK_TESTS_FAKE_SERVICES_HPP
#define SCANLINK_TESTS_FAKE_SERVICES_HPP

#include "services/device_repository.hpp"
#include "services/exam_service.hpp"
#include "shared/common/errors.h"
#include "transports/device_connection.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace scanlink::test {

class InMemoryDeviceRepository : public services::DeviceRepository {
public:
    std::optional<services::DeviceRecord> get_device(const std::string& device_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            throw CollaboratorError("device store unavailable");
        }
        auto it = devices.find(device_id);
        if (it == devices.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool update_device(const std::string& device_id, const services::DeviceUpdate& update) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            throw CollaboratorError("device store unavailable");
        }
        auto it = devices.find(device_id);
        if (it == devices.end()) {
            return false;
        }
        if (update.details) {
            it->second.details = *update.details;
        }
        if (update.status) {
            it->second.status = *update.status;
        }
        ++update_count;
        return true;
    }

    void create_device(const services::DeviceRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        devices[record.id] = record;
    }

    protocol::DeviceStatus status_of(const std::string& device_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices.at(device_id).status;
    }

    void add(const std::string& device_id, protocol::DeviceStatus status = protocol::DeviceStatus::OFFLINE) {
        services::DeviceRecord record;
        record.id = device_id;
        record.status = status;
        record.details.device_name = "MR-Lab-1";
        record.details.parameter = {{"larmor_frequency", 2.0e6}};
        create_device(record);
    }

    std::map<std::string, services::DeviceRecord> devices;
    bool fail = false;
    int update_count = 0;

private:
    std::mutex mutex_;
};

class FakeExamService : public services::ExamService {
public:
    std::optional<nlohmann::json> get_task(const std::string& task_id, const std::string& token) override {
        last_token = token;
        if (fail_get_task) {
            throw CollaboratorError("exam manager unavailable", 500);
        }
        auto it = tasks.find(task_id);
        if (it == tasks.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set_task(const std::string& task_id, const nlohmann::json& task, const std::string& token) override {
        last_token = token;
        if (fail_set_task) {
            throw CollaboratorError("task rejected", 422);
        }
        tasks[task_id] = task;
        ++set_task_count;
    }

    std::string create_blank_result(const std::string& task_id, const std::string& token) override {
        last_token = token;
        std::string id = "result-" + std::to_string(++result_counter);
        results[id] = nlohmann::json{{"task_id", task_id}};
        return id;
    }

    void set_result(const std::string& result_id, const nlohmann::json& result, const std::string& token) override {
        last_token = token;
        results[result_id] = result;
    }

    std::optional<nlohmann::json> get_sequence(const std::string& sequence_id, const std::string& token) override {
        last_token = token;
        if (fail_get_sequence) {
            throw CollaboratorError("exam manager unavailable", 500);
        }
        auto it = sequences.find(sequence_id);
        if (it == sequences.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, nlohmann::json> tasks;
    std::map<std::string, nlohmann::json> results;
    std::map<std::string, nlohmann::json> sequences;
    bool fail_get_task = false;
    bool fail_set_task = false;
    bool fail_get_sequence = false;
    int set_task_count = 0;
    int result_counter = 0;
    std::string last_token;
};

class FakeConnection : public transports::DeviceConnection {
public:
    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed || refuse_sends) {
            return false;
        }
        texts.push_back(text);
        return true;
    }

    void close(uint16_t code, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed = true;
        close_code = code;
        close_reason = reason;
    }

    std::string describe() const override { return "fake-connection"; }

    /** "message" fields of every feedback frame sent so far */
    std::vector<std::string> feedback() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& text : texts) {
            auto j = nlohmann::json::parse(text);
            if (j.value("command", "") == "feedback") {
                out.push_back(j.value("message", ""));
            }
        }
        return out;
    }

    std::string last_feedback() {
        auto all = feedback();
        return all.empty() ? std::string() : all.back();
    }

    std::vector<std::string> texts;
    bool closed = false;
    bool refuse_sends = false;
    uint16_t close_code = 0;
    std::string close_reason;

private:
    std::mutex mutex_;
};

}  // namespace scanlink::test

#endif  // SCANLINK_TESTS_FAKE_SERVICES_HPP
