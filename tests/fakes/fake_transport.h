/**
 * @file fake_transport.h
 * @brief In-memory ITransport for SDK tests
 */

#ifndef SCANLINK_TESTS_FAKE_TRANSPORT_H
#define SCANLINK_TESTS_FAKE_TRANSPORT_H

#include "shared/common/errors.h"
#include "transport/transport_interface.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace scanlink::test {

/**
 * Records every frame sent by the device and lets a test push frames
 * back as if the server had sent them.
 */
class FakeTransport : public sdk::ITransport {
public:
    bool connect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++connect_calls;
        if (refuse_connect) {
            return false;
        }
        connected_ = true;
        closed_ = false;
        return true;
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect_marks_.push_back(sent_.size());
        connected_ = false;
        closed_ = true;
        cv_.notify_all();
    }

    bool isConnected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    void sendText(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_next_texts > 0) {
            --fail_next_texts;
            throw TransportError("send failed");
        }
        sent_.push_back({sdk::FrameType::TEXT, text});
    }

    void sendBinary(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_next_binaries > 0) {
            --fail_next_binaries;
            throw TransportError("send failed");
        }
        sent_.push_back({sdk::FrameType::BINARY, data});
    }

    sdk::ReceiveResult receiveFrame(sdk::Frame& frame, unsigned long timeout_ms) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !inbox_.empty() || closed_; });
        if (!inbox_.empty()) {
            frame = inbox_.front();
            inbox_.pop_front();
            return sdk::ReceiveResult::FRAME;
        }
        return closed_ ? sdk::ReceiveResult::CLOSED : sdk::ReceiveResult::TIMEOUT;
    }

    int closeCode() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return peer_close_code;
    }

    std::string getConnectionInfo() const override { return "fake://device"; }

    // Test controls

    void pushText(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbox_.push_back({sdk::FrameType::TEXT, text});
        cv_.notify_all();
    }

    void closeFromPeer(int code) {
        std::lock_guard<std::mutex> lock(mutex_);
        peer_close_code = code;
        connected_ = false;
        closed_ = true;
        cv_.notify_all();
    }

    std::vector<sdk::Frame> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    /** Decoded JSON of every text frame sent so far */
    std::vector<nlohmann::json> sentJson() const {
        std::vector<nlohmann::json> out;
        for (const auto& frame : sent()) {
            if (frame.type == sdk::FrameType::TEXT) {
                out.push_back(nlohmann::json::parse(frame.payload));
            }
        }
        return out;
    }

    /** update_status messages only, in send order */
    std::vector<nlohmann::json> statusUpdates() const {
        std::vector<nlohmann::json> out;
        for (const auto& j : sentJson()) {
            if (j.value("command", "") == "update_status") {
                out.push_back(j);
            }
        }
        return out;
    }

    /** Number of frames already sent at each disconnect() call */
    std::vector<size_t> disconnectMarks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return disconnect_marks_;
    }

    void clearSent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    int fail_next_texts = 0;
    int fail_next_binaries = 0;
    bool refuse_connect = false;
    int connect_calls = 0;
    int peer_close_code = 0;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<sdk::Frame> inbox_;
    std::vector<sdk::Frame> sent_;
    std::vector<size_t> disconnect_marks_;
    bool connected_ = false;
    bool closed_ = false;
};

}  // namespace scanlink::test

#endif  // SCANLINK_TESTS_FAKE_TRANSPORT_H
