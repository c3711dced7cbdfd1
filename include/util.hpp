#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace salvage {

using Hash256 = std::array<uint8_t, 32>;

struct Hash256Hasher {
    size_t operator()(const Hash256& h) const noexcept {
        size_t v;
        std::memcpy(&v, h.data(), sizeof(v));
        return v;
    }
};

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string bytes_to_hex(const uint8_t* data, size_t len);
inline std::string bytes_to_hex(const std::vector<uint8_t>& v) { return bytes_to_hex(v.data(), v.size()); }
inline std::string hash_to_hex(const Hash256& h) { return bytes_to_hex(h.data(), h.size()); }
bool hex_to_hash(const std::string& hex, Hash256& out);

std::string base64_encode(const std::vector<uint8_t>& data);
bool base64_decode(const std::string& s, std::vector<uint8_t>& out);

inline uint16_t read_le16(const uint8_t* p) { return (uint16_t)(p[0] | (p[1] << 8)); }
inline uint32_t read_le32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}
inline uint64_t read_le64(const uint8_t* p) {
    return (uint64_t)read_le32(p) | ((uint64_t)read_le32(p + 4) << 32);
}
inline uint32_t read_be32(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}
inline void put_le64(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; i++) p[i] = (uint8_t)(v >> (8 * i));
}
inline void append_le64(std::vector<uint8_t>& out, uint64_t v) {
    uint8_t b[8];
    put_le64(b, v);
    out.insert(out.end(), b, b + 8);
}

// Shared cancellation flag. Copies observe the same state.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load() || (parent_ && parent_->load()); }
    // Token that is cancelled on its own or together with this one.
    CancelToken child() const {
        CancelToken c;
        c.parent_ = flag_;
        return c;
    }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::shared_ptr<std::atomic<bool>> parent_;
};

} // namespace salvage
