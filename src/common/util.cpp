
#include "util.hpp"
#include <cctype>
#include <sodium.h>
#include <sstream>

namespace salvage {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  host = s.substr(0, pos);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    if (!std::isxdigit((unsigned char)hex[i]) ||
        !std::isxdigit((unsigned char)hex[i + 1]))
      return {};
    unsigned int v;
    std::stringstream ss;
    ss << std::hex << hex.substr(i, 2);
    ss >> v;
    out.push_back((uint8_t)v);
  }
  return out;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

bool hex_to_hash(const std::string &hex, Hash256 &out) {
  auto b = hex_to_bytes(hex);
  if (b.size() != out.size())
    return false;
  std::memcpy(out.data(), b.data(), out.size());
  return true;
}

std::string base64_encode(const std::vector<uint8_t> &data) {
  const int variant = sodium_base64_VARIANT_ORIGINAL;
  std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
  sodium_bin2base64(&out[0], out.size(), data.data(), data.size(), variant);
  out.resize(std::strlen(out.c_str()));
  return out;
}

bool base64_decode(const std::string &s, std::vector<uint8_t> &out) {
  out.assign(s.size() / 4 * 3 + 3, 0);
  size_t n = 0;
  if (sodium_base642bin(out.data(), out.size(), s.c_str(), s.size(), nullptr,
                        &n, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    return false;
  out.resize(n);
  return true;
}

} // namespace salvage
