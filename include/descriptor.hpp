#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "util.hpp"

namespace salvage {

constexpr size_t kHostTableEntrySize = 16 + 8 + 32 + 1;
constexpr size_t kChunkRecordSize = 4096;
constexpr size_t kChunkRecordSkip = 17;

struct SectorRef {
    Hash256 merkle_root{};
    std::string host_key; // "ed25519:<hex>"
};

struct Chunk {
    // One entry per piece slot; each lists redundant copies of that piece.
    std::vector<std::vector<SectorRef>> pieces;
};

struct Descriptor {
    uint64_t file_size{0};
    uint64_t piece_size{0};
    uint32_t encoder_type{0};
    uint32_t data_pieces{0};
    uint32_t parity_pieces{0};
    std::vector<uint8_t> master_key;
    std::string master_key_type;
    std::vector<std::string> skylinks;
    std::vector<Chunk> chunks;

    uint32_t num_pieces() const { return data_pieces + parity_pieces; }
    uint64_t chunk_size() const { return piece_size * data_pieces; }
    uint64_t expected_chunks() const;
    // Byte length of chunk idx; the final chunk is truncated to the file size.
    uint64_t chunk_length(size_t idx) const;
};

bool operator==(const SectorRef& a, const SectorRef& b);
bool operator==(const Chunk& a, const Chunk& b);
bool operator==(const Descriptor& a, const Descriptor& b);
inline bool operator!=(const Descriptor& a, const Descriptor& b) { return !(a == b); }

// Parses a binary siafile. Throws Error{MalformedDescriptor}.
Descriptor decode_descriptor(const std::vector<uint8_t>& bytes);

nlohmann::json descriptor_to_json(const Descriptor& d);
// Throws Error{MalformedDescriptor}.
Descriptor descriptor_from_json(const nlohmann::json& j);

std::vector<uint8_t> read_file(const std::string& path);
// Exported JSON for *.json paths, binary siafile otherwise.
Descriptor load_descriptor(const std::string& path);

} // namespace salvage
