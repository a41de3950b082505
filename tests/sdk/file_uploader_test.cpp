/**
 * @file file_uploader_test.cpp
 * @brief Chunked upload framing and the retry policy
 */

#include "core/file_uploader.h"
#include "fakes/fake_transport.h"
#include "shared/crypto/crypto_utils.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <thread>

using namespace scanlink;
using namespace scanlink::sdk;

namespace {

class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

UploadPolicy fast_policy(size_t chunk_size = 4) {
    UploadPolicy policy;
    policy.max_attempts = 3;
    policy.backoff_unit = std::chrono::milliseconds(1);
    policy.chunk_size = chunk_size;
    return policy;
}

UploadJob job_for(const std::string& path) {
    UploadJob job;
    job.file_path = path;
    job.task_id = "t-1";
    job.user_access_token = "tok";
    job.device_parameter = {{"larmor_frequency", 2.0e6}};
    return job;
}

}  // namespace

TEST_CASE("single upload attempt framing", "[sdk][upload]") {
    TempFile file("scanlink_upload_framing.bin", "0123456789");
    test::FakeTransport transport;
    FileUploader uploader(transport, fast_policy(4));

    uploader.sendOnce(job_for(file.path()));

    auto frames = transport.sent();
    REQUIRE(frames.size() == 4);
    REQUIRE(frames[0].type == FrameType::TEXT);

    auto header = nlohmann::json::parse(frames[0].payload);
    CHECK(header["command"] == "file-transfer");
    CHECK(header["task_id"] == "t-1");
    CHECK(header["user_access_token"] == "tok");
    CHECK(header["filename"] == "scanlink_upload_framing.bin");
    CHECK(header["size_bytes"] == 10);
    CHECK(header["content_type"] == "application/octet-stream");
    CHECK(header["sha256"] == crypto::sha256_hex("0123456789"));
    CHECK(header["device_parameter"]["larmor_frequency"] == 2.0e6);

    CHECK(frames[1].type == FrameType::BINARY);
    CHECK(frames[1].payload == "0123");
    CHECK(frames[2].payload == "4567");
    CHECK(frames[3].payload == "89");
}

TEST_CASE("header naming and content type", "[sdk][upload]") {
    UploadJob job = job_for("/data/out/scan.mrd");

    SECTION("extension of the source is appended to a bare name") {
        job.name = "result";
        auto header = FileUploader::buildHeader(job, 5, "abc");
        CHECK(header.filename == "result.mrd");
        CHECK(header.content_type == SCANLINK_CONTENT_TYPE_MRD);
    }

    SECTION("explicit extension is kept") {
        job.name = "result.h5";
        CHECK(FileUploader::buildHeader(job, 5, "abc").filename == "result.h5");
    }

    SECTION("source filename when no name given") {
        CHECK(FileUploader::buildHeader(job, 5, "abc").filename == "scan.mrd");
    }

    CHECK(FileUploader::contentTypeFor("raw.dat") == SCANLINK_CONTENT_TYPE_OCTET);
}

TEST_CASE("retry policy", "[sdk][upload]") {
    TempFile file("scanlink_upload_retry.bin", "abcdef");
    test::FakeTransport transport;
    FileUploader uploader(transport, fast_policy(16));

    int exhausted_calls = 0;
    std::string exhausted_message;
    uploader.setExhaustedHandler([&](const UploadJob&, const UploadExhaustedError& e) {
        ++exhausted_calls;
        exhausted_message = e.what();
    });

    SECTION("two failures then success") {
        transport.fail_next_texts = 2;
        CHECK(uploader.sendWithRetry(job_for(file.path())));
        CHECK(exhausted_calls == 0);

        auto frames = transport.sent();
        REQUIRE(frames.size() == 2);
        CHECK(frames[1].payload == "abcdef");
    }

    SECTION("failure of a binary chunk restarts the whole file") {
        transport.fail_next_binaries = 1;
        CHECK(uploader.sendWithRetry(job_for(file.path())));

        auto frames = transport.sent();
        REQUIRE(frames.size() == 3);
        CHECK(frames[0].type == FrameType::TEXT);
        CHECK(frames[1].type == FrameType::TEXT);
        CHECK(frames[2].type == FrameType::BINARY);
    }

    SECTION("every attempt fails") {
        transport.fail_next_texts = 3;
        CHECK_FALSE(uploader.sendWithRetry(job_for(file.path())));
        CHECK(exhausted_calls == 1);
        CHECK(exhausted_message == "File upload failed after 3 attempts.");
        CHECK(transport.sent().empty());
    }

    SECTION("missing file exhausts the attempts") {
        CHECK_FALSE(uploader.sendWithRetry(job_for(file.path() + ".missing")));
        CHECK(exhausted_calls == 1);
    }
}

TEST_CASE("backoff doubles from the first failure", "[sdk][upload]") {
    UploadPolicy policy;
    policy.backoff_unit = std::chrono::milliseconds(1000);

    CHECK(FileUploader::backoffDelay(policy, 0) == std::chrono::milliseconds(2000));
    CHECK(FileUploader::backoffDelay(policy, 1) == std::chrono::milliseconds(4000));
    CHECK(FileUploader::backoffDelay(policy, 2) == std::chrono::milliseconds(8000));

    // Exponent is capped, never shifted past the width of the type
    CHECK(FileUploader::backoffDelay(policy, 200) ==
          FileUploader::backoffDelay(policy, SCANLINK_UPLOAD_MAX_ATTEMPTS_LIMIT));
}

TEST_CASE("queued uploads are drained by the worker", "[sdk][upload]") {
    TempFile file("scanlink_upload_queue.bin", "payload");
    test::FakeTransport transport;
    FileUploader uploader(transport, fast_policy(64));

    uploader.start();
    uploader.enqueue(job_for(file.path()));

    for (int i = 0; i < 200 && transport.sent().size() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    uploader.stop();

    CHECK(transport.sent().size() == 2);
    CHECK(uploader.pending() == 0);
}
