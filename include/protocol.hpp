#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "util.hpp"

namespace salvage {

constexpr uint64_t kSectorSize = 1ull << 22; // 4 MiB
constexpr uint64_t kSegmentSize = 64;        // Merkle leaf size

// Sector Merkle root: BLAKE2b-256 over 64-byte leaves (prefix 0x00) and
// interior nodes (prefix 0x01).
Hash256 merkle_root(const uint8_t* data, size_t len);
inline Hash256 sector_root(const std::vector<uint8_t>& sector) {
    return merkle_root(sector.data(), sector.size());
}

// Host error texts. Matched by the sector client only.
constexpr const char* kErrSectorNotFound = "could not find the desired sector";
constexpr const char* kErrNoContract = "no record of that contract";

constexpr uint32_t kMagic = 0x53564c47; // 'SLVG'
constexpr uint8_t  kVersion = 1;

enum class Direction : uint8_t { Request = 0, Response = 1 };

enum class FrameType : uint8_t {
    OPEN     = 1,
    SETTINGS = 2,
    READ     = 3,
    RESPONSE = 4,
    ERROR    = 5,
    CLOSE    = 6
};

#pragma pack(push, 1)
struct FrameHeader {
    uint32_t magic;
    uint8_t  version;
    uint8_t  type;
    uint8_t  direction;
    uint8_t  reserved;
    uint64_t session_id;
    uint64_t request_id;
    uint32_t payload_len;
    uint32_t header_crc32;
};
#pragma pack(pop)
static_assert(sizeof(FrameHeader) == 32, "FrameHeader must be 32 bytes");

constexpr uint32_t kMaxPayload = (uint32_t)kSectorSize + 4096;

struct Frame {
    FrameHeader hdr{};
    std::vector<uint8_t> payload;
};

FrameHeader make_header(FrameType type, Direction dir, uint64_t session_id,
                        uint64_t request_id, uint32_t payload_len);
bool header_valid(const FrameHeader& h);
uint32_t crc32(const uint8_t* data, size_t len);

// Price terms announced by a host. All amounts in base currency units.
struct HostSettings {
    uint64_t base_rpc_price{0};
    uint64_t sector_access_price{0};
    uint64_t download_bandwidth_price{0}; // per byte
    uint64_t max_download_batch_size{kSectorSize};
};

struct ReadSection {
    Hash256 merkle_root{};
    uint64_t offset{0};
    uint64_t length{kSectorSize};
};

uint64_t read_cost(const HostSettings& s, const ReadSection& section);

std::vector<uint8_t> encode_settings(const HostSettings& s);
bool decode_settings(const std::vector<uint8_t>& p, HostSettings& out);
std::vector<uint8_t> encode_read_request(const ReadSection& section, uint64_t cost);
bool decode_read_request(const std::vector<uint8_t>& p, ReadSection& section, uint64_t& cost);

} // namespace salvage
