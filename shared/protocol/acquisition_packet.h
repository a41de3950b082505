#ifndef SCANLINK_ACQUISITION_PACKET_H
#define SCANLINK_ACQUISITION_PACKET_H

#include <cstdint>
#include <string>
#include <vector>

namespace scanlink {
namespace protocol {

// Packet layout, little-endian throughout:
//   [u32 magic 'ISMR'][u16 version][u16 count]
//   count x ([u32 id][u16 coil_count][u16 dtype][u32 sample_count][u32 byte_length][payload])

constexpr uint32_t ACQ_PACKET_MAGIC = 0x49534D52;
constexpr uint16_t ACQ_PACKET_VERSION = 1;
constexpr uint16_t ACQ_DTYPE_COMPLEX_FLOAT32 = 1;
constexpr size_t ACQ_PACKET_HEADER_SIZE = 8;
constexpr size_t ACQ_ITEM_HEADER_SIZE = 16;

struct AcquisitionItem
{
    uint32_t id = 0;
    uint16_t coil_count = 1;
    uint16_t dtype = ACQ_DTYPE_COMPLEX_FLOAT32;
    uint32_t sample_count = 0;
    std::string payload;
};

/**
 * @brief Serialize items into one packet
 * @throws std::invalid_argument for more than 65535 items or an oversized payload
 */
std::string encode_acquisition_packet(const std::vector<AcquisitionItem>& items);

/**
 * @brief Parse a complete packet
 * @throws ProtocolError on bad magic, unsupported version or truncated data
 */
std::vector<AcquisitionItem> decode_acquisition_packet(const std::string& packet);

/**
 * @brief Expand an id selection such as "0,1,10-20,40-50:2"
 *
 * Ranges are inclusive, ":step" is optional. Duplicates are dropped,
 * first-occurrence order is kept.
 *
 * @throws std::invalid_argument on malformed input
 */
std::vector<uint32_t> parse_ids(const std::string& selection);

} // namespace protocol
} // namespace scanlink

#endif // SCANLINK_ACQUISITION_PACKET_H
