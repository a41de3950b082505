/**
 * @file scan_task_test.cpp
 * @brief Cancellation tokens and the per-task scan registry
 */

#include "core/scan_task.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>

using namespace scanlink;
using namespace scanlink::sdk;

namespace {

protocol::AcquisitionPayload payload_for(const std::string& id) {
    protocol::AcquisitionPayload payload;
    payload.id = id;
    payload.access_token = "tok";
    return payload;
}

}  // namespace

TEST_CASE("cancellation token", "[sdk][scan]") {
    CancellationToken token;

    CHECK(token.waitFor(std::chrono::milliseconds(1)));
    CHECK_NOTHROW(token.throwIfCancelled());

    token.cancel();
    CHECK(token.isCancelled());
    CHECK_FALSE(token.waitFor(std::chrono::seconds(5)));
    CHECK_THROWS_AS(token.throwIfCancelled(), ScanCancelled);
}

TEST_CASE("scan outcomes", "[sdk][scan]") {
    CancellationToken token;
    auto payload = payload_for("t-1");

    SECTION("normal return succeeds") {
        auto outcome = runScan([](const protocol::AcquisitionPayload&, CancellationToken&) {}, payload, token);
        CHECK(outcome.result == ScanResult::SUCCEEDED);
    }

    SECTION("exception is a failure with its message") {
        auto outcome = runScan(
            [](const protocol::AcquisitionPayload&, CancellationToken&) { throw std::runtime_error("coil fault"); },
            payload, token);
        CHECK(outcome.result == ScanResult::FAILED);
        CHECK(outcome.message == "coil fault");
    }

    SECTION("returning after cancellation counts as cancelled") {
        token.cancel();
        auto outcome = runScan([](const protocol::AcquisitionPayload&, CancellationToken&) {}, payload, token);
        CHECK(outcome.result == ScanResult::CANCELLED);
        CHECK(outcome.message == "Scan cancelled");
    }

    SECTION("throwing ScanCancelled counts as cancelled") {
        token.cancel();
        auto outcome = runScan(
            [](const protocol::AcquisitionPayload&, CancellationToken& t) { t.throwIfCancelled(); }, payload, token);
        CHECK(outcome.result == ScanResult::CANCELLED);
    }
}

TEST_CASE("scan task manager", "[sdk][scan]") {
    ScanTaskManager manager;
    std::atomic<int> completions{0};

    auto blocking_body = [](const protocol::AcquisitionPayload&, CancellationToken& token) {
        while (token.waitFor(std::chrono::milliseconds(5))) {
        }
    };
    auto count_completion = [&](const protocol::AcquisitionPayload&) { ++completions; };

    SECTION("duplicate task id is refused while active") {
        REQUIRE(manager.start(payload_for("t-1"), blocking_body, count_completion));
        CHECK_FALSE(manager.start(payload_for("t-1"), blocking_body, count_completion));
        CHECK(manager.isActive("t-1"));
        CHECK(manager.activeCount() == 1);

        CHECK(manager.cancel("t-1"));
        manager.waitAll();
        CHECK_FALSE(manager.isActive("t-1"));
        CHECK(completions == 1);
    }

    SECTION("distinct tasks run concurrently") {
        REQUIRE(manager.start(payload_for("t-1"), blocking_body, count_completion));
        REQUIRE(manager.start(payload_for("t-2"), blocking_body, count_completion));
        CHECK(manager.activeCount() == 2);

        manager.cancelAll();
        manager.waitAll();
        CHECK(manager.activeCount() == 0);
        CHECK(completions == 2);
    }

    SECTION("a finished task id can be reused") {
        REQUIRE(manager.start(payload_for("t-1"), [](const protocol::AcquisitionPayload&, CancellationToken&) {},
                              count_completion));
        manager.waitAll();
        CHECK(manager.start(payload_for("t-1"), [](const protocol::AcquisitionPayload&, CancellationToken&) {},
                            count_completion));
        manager.waitAll();
        CHECK(completions == 2);
    }

    SECTION("cancelling an unknown task") {
        CHECK_FALSE(manager.cancel("missing"));
    }
}
