
#include "protocol.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <sodium.h>
#include <utility>

namespace salvage {

namespace {

Hash256 leaf_hash(const uint8_t *data, size_t len) {
  crypto_generichash_state st;
  const uint8_t prefix = 0x00;
  Hash256 out;
  crypto_generichash_init(&st, nullptr, 0, out.size());
  crypto_generichash_update(&st, &prefix, 1);
  crypto_generichash_update(&st, data, len);
  crypto_generichash_final(&st, out.data(), out.size());
  return out;
}

Hash256 node_hash(const Hash256 &l, const Hash256 &r) {
  uint8_t buf[1 + 64];
  buf[0] = 0x01;
  std::memcpy(buf + 1, l.data(), 32);
  std::memcpy(buf + 33, r.data(), 32);
  Hash256 out;
  crypto_generichash(out.data(), out.size(), buf, sizeof(buf), nullptr, 0);
  return out;
}

uint64_t sat_add(uint64_t a, uint64_t b) {
  uint64_t r = a + b;
  return r < a ? std::numeric_limits<uint64_t>::max() : r;
}

uint64_t sat_mul(uint64_t a, uint64_t b) {
  if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a)
    return std::numeric_limits<uint64_t>::max();
  return a * b;
}

} // namespace

Hash256 merkle_root(const uint8_t *data, size_t len) {
  // stack of (height, hash); equal heights are joined as they appear
  std::vector<std::pair<int, Hash256>> stack;
  for (size_t off = 0; off < len; off += kSegmentSize) {
    size_t n = std::min<size_t>(kSegmentSize, len - off);
    Hash256 h = leaf_hash(data + off, n);
    int height = 0;
    while (!stack.empty() && stack.back().first == height) {
      h = node_hash(stack.back().second, h);
      stack.pop_back();
      height++;
    }
    stack.emplace_back(height, h);
  }
  if (stack.empty())
    return Hash256{};
  Hash256 root = stack.back().second;
  stack.pop_back();
  while (!stack.empty()) {
    root = node_hash(stack.back().second, root);
    stack.pop_back();
  }
  return root;
}

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

FrameHeader make_header(FrameType type, Direction dir, uint64_t session_id,
                        uint64_t request_id, uint32_t payload_len) {
  FrameHeader h{};
  h.magic = kMagic;
  h.version = kVersion;
  h.type = static_cast<uint8_t>(type);
  h.direction = static_cast<uint8_t>(dir);
  h.session_id = session_id;
  h.request_id = request_id;
  h.payload_len = payload_len;
  h.header_crc32 = crc32((const uint8_t *)&h, sizeof(h) - 4);
  return h;
}

bool header_valid(const FrameHeader &h) {
  return h.magic == kMagic && h.version == kVersion &&
         h.payload_len <= kMaxPayload + 64 &&
         h.header_crc32 == crc32((const uint8_t *)&h, sizeof(h) - 4);
}

uint64_t read_cost(const HostSettings &s, const ReadSection &section) {
  uint64_t cost = s.base_rpc_price;
  cost = sat_add(cost, s.sector_access_price);
  cost = sat_add(cost, sat_mul(s.download_bandwidth_price, section.length));
  return cost;
}

std::vector<uint8_t> encode_settings(const HostSettings &s) {
  std::vector<uint8_t> out;
  append_le64(out, s.base_rpc_price);
  append_le64(out, s.sector_access_price);
  append_le64(out, s.download_bandwidth_price);
  append_le64(out, s.max_download_batch_size);
  return out;
}

bool decode_settings(const std::vector<uint8_t> &p, HostSettings &out) {
  if (p.size() != 32)
    return false;
  out.base_rpc_price = read_le64(p.data());
  out.sector_access_price = read_le64(p.data() + 8);
  out.download_bandwidth_price = read_le64(p.data() + 16);
  out.max_download_batch_size = read_le64(p.data() + 24);
  return true;
}

std::vector<uint8_t> encode_read_request(const ReadSection &section,
                                         uint64_t cost) {
  std::vector<uint8_t> out(section.merkle_root.begin(),
                           section.merkle_root.end());
  append_le64(out, section.offset);
  append_le64(out, section.length);
  append_le64(out, cost);
  return out;
}

bool decode_read_request(const std::vector<uint8_t> &p, ReadSection &section,
                         uint64_t &cost) {
  if (p.size() != 32 + 24)
    return false;
  std::memcpy(section.merkle_root.data(), p.data(), 32);
  section.offset = read_le64(p.data() + 32);
  section.length = read_le64(p.data() + 40);
  cost = read_le64(p.data() + 48);
  return true;
}

} // namespace salvage
