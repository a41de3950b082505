/**
 * @file acquisition_packet_test.cpp
 * @brief Acquisition packet codec and id selection parsing
 */

#include "shared/common/errors.h"
#include "shared/protocol/acquisition_packet.h"

#include <catch2/catch_test_macros.hpp>

using namespace scanlink;
using namespace scanlink::protocol;

namespace {

AcquisitionItem make_item(uint32_t id, const std::string& payload) {
    AcquisitionItem item;
    item.id = id;
    item.coil_count = 2;
    item.sample_count = static_cast<uint32_t>(payload.size() / 8);
    item.payload = payload;
    return item;
}

}  // namespace

TEST_CASE("acquisition packet layout", "[packet]") {
    auto packet = encode_acquisition_packet({make_item(7, std::string(16, '\x01')), make_item(8, "")});

    REQUIRE(packet.size() == ACQ_PACKET_HEADER_SIZE + 2 * ACQ_ITEM_HEADER_SIZE + 16);
    CHECK(packet.substr(0, 4) == "RMSI");  // magic, little-endian
    CHECK(static_cast<uint8_t>(packet[6]) == 2);

    auto items = decode_acquisition_packet(packet);
    REQUIRE(items.size() == 2);
    CHECK(items[0].id == 7);
    CHECK(items[0].coil_count == 2);
    CHECK(items[0].dtype == ACQ_DTYPE_COMPLEX_FLOAT32);
    CHECK(items[0].payload == std::string(16, '\x01'));
    CHECK(items[1].payload.empty());
}

TEST_CASE("malformed acquisition packets", "[packet]") {
    auto packet = encode_acquisition_packet({make_item(1, std::string(8, 'a'))});

    SECTION("bad magic") {
        packet[0] = 'X';
        CHECK_THROWS_AS(decode_acquisition_packet(packet), ProtocolError);
    }

    SECTION("unsupported version") {
        packet[4] = 9;
        CHECK_THROWS_AS(decode_acquisition_packet(packet), ProtocolError);
    }

    SECTION("truncated payload") {
        packet.pop_back();
        CHECK_THROWS_AS(decode_acquisition_packet(packet), ProtocolError);
    }

    SECTION("trailing bytes") {
        packet.push_back('z');
        CHECK_THROWS_AS(decode_acquisition_packet(packet), ProtocolError);
    }
}

TEST_CASE("id selection parsing", "[packet][ids]") {
    SECTION("singles, ranges and steps") {
        CHECK(parse_ids("0,1,10-13,40-46:3") == std::vector<uint32_t>{0, 1, 10, 11, 12, 13, 40, 43, 46});
    }

    SECTION("duplicates keep first occurrence order") {
        CHECK(parse_ids("5, 3-6, 1") == std::vector<uint32_t>{5, 3, 4, 6, 1});
    }

    SECTION("invalid selections") {
        CHECK_THROWS_AS(parse_ids(""), std::invalid_argument);
        CHECK_THROWS_AS(parse_ids(" , "), std::invalid_argument);
        CHECK_THROWS_AS(parse_ids("9-3"), std::invalid_argument);
        CHECK_THROWS_AS(parse_ids("1-5:0"), std::invalid_argument);
        CHECK_THROWS_AS(parse_ids("4:2"), std::invalid_argument);
        CHECK_THROWS_AS(parse_ids("a-b"), std::invalid_argument);
    }
}
