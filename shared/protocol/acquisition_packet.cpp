#include "acquisition_packet.h"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "../common/errors.h"

namespace scanlink {
namespace protocol {

namespace {

void put_u16(std::string& out, uint16_t v)
{
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put_u32(std::string& out, uint32_t v)
{
    for (int shift = 0; shift < 32; shift += 8)
    {
        out.push_back(static_cast<char>((v >> shift) & 0xFF));
    }
}

class Reader
{
public:
    explicit Reader(const std::string& data) : data_(data) {}

    uint16_t u16()
    {
        require(2);
        uint16_t v = static_cast<uint16_t>(byte(0) | (byte(1) << 8));
        pos_ += 2;
        return v;
    }

    uint32_t u32()
    {
        require(4);
        uint32_t v = byte(0) | (byte(1) << 8) | (byte(2) << 16) | (byte(3) << 24);
        pos_ += 4;
        return v;
    }

    std::string bytes(size_t n)
    {
        require(n);
        std::string out = data_.substr(pos_, n);
        pos_ += n;
        return out;
    }

    bool at_end() const { return pos_ == data_.size(); }

private:
    uint32_t byte(size_t offset) const
    {
        return static_cast<uint8_t>(data_[pos_ + offset]);
    }

    void require(size_t n) const
    {
        if (data_.size() - pos_ < n)
        {
            throw ProtocolError("Truncated acquisition packet");
        }
    }

    const std::string& data_;
    size_t pos_ = 0;
};

uint32_t parse_number(const std::string& token)
{
    if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos)
    {
        throw std::invalid_argument("Invalid id: '" + token + "'");
    }
    unsigned long long value = std::stoull(token);
    if (value > std::numeric_limits<uint32_t>::max())
    {
        throw std::invalid_argument("Id out of range: " + token);
    }
    return static_cast<uint32_t>(value);
}

std::string trim(const std::string& s)
{
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
    {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string encode_acquisition_packet(const std::vector<AcquisitionItem>& items)
{
    if (items.size() > std::numeric_limits<uint16_t>::max())
    {
        throw std::invalid_argument("Too many acquisitions for one packet");
    }

    std::string out;
    put_u32(out, ACQ_PACKET_MAGIC);
    put_u16(out, ACQ_PACKET_VERSION);
    put_u16(out, static_cast<uint16_t>(items.size()));

    for (const auto& item : items)
    {
        if (item.payload.size() > std::numeric_limits<uint32_t>::max())
        {
            throw std::invalid_argument("Acquisition payload too large");
        }
        put_u32(out, item.id);
        put_u16(out, item.coil_count);
        put_u16(out, item.dtype);
        put_u32(out, item.sample_count);
        put_u32(out, static_cast<uint32_t>(item.payload.size()));
        out += item.payload;
    }
    return out;
}

std::vector<AcquisitionItem> decode_acquisition_packet(const std::string& packet)
{
    Reader reader(packet);
    if (reader.u32() != ACQ_PACKET_MAGIC)
    {
        throw ProtocolError("Bad acquisition packet magic");
    }
    uint16_t version = reader.u16();
    if (version != ACQ_PACKET_VERSION)
    {
        throw ProtocolError("Unsupported acquisition packet version " + std::to_string(version));
    }

    uint16_t count = reader.u16();
    std::vector<AcquisitionItem> items;
    items.reserve(count);
    for (uint16_t i = 0; i < count; ++i)
    {
        AcquisitionItem item;
        item.id = reader.u32();
        item.coil_count = reader.u16();
        item.dtype = reader.u16();
        item.sample_count = reader.u32();
        uint32_t length = reader.u32();
        item.payload = reader.bytes(length);
        items.push_back(std::move(item));
    }

    if (!reader.at_end())
    {
        throw ProtocolError("Trailing bytes after acquisition packet");
    }
    return items;
}

std::vector<uint32_t> parse_ids(const std::string& selection)
{
    std::vector<uint32_t> ids;
    std::unordered_set<uint32_t> seen;
    auto push = [&](uint32_t id) {
        if (seen.insert(id).second)
        {
            ids.push_back(id);
        }
    };

    std::stringstream ss(selection);
    std::string part;
    while (std::getline(ss, part, ','))
    {
        part = trim(part);
        if (part.empty())
        {
            continue;
        }

        uint32_t step = 1;
        size_t colon = part.find(':');
        if (colon != std::string::npos)
        {
            step = parse_number(trim(part.substr(colon + 1)));
            if (step == 0)
            {
                throw std::invalid_argument("Step must be positive: '" + part + "'");
            }
            part = trim(part.substr(0, colon));
        }

        size_t dash = part.find('-');
        if (dash == std::string::npos)
        {
            if (colon != std::string::npos)
            {
                throw std::invalid_argument("Step without range: '" + part + "'");
            }
            push(parse_number(part));
            continue;
        }

        uint32_t first = parse_number(trim(part.substr(0, dash)));
        uint32_t last = parse_number(trim(part.substr(dash + 1)));
        if (last < first)
        {
            throw std::invalid_argument("Descending range: '" + part + "'");
        }
        for (uint64_t id = first; id <= last; id += step)
        {
            push(static_cast<uint32_t>(id));
        }
    }

    if (ids.empty())
    {
        throw std::invalid_argument("Empty id selection");
    }
    return ids;
}

} // namespace protocol
} // namespace scanlink
