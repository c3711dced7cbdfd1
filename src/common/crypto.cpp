
#include "crypto.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <cryptopp/algparam.h>
#include <cryptopp/argnames.h>
#include <cryptopp/threefish.h>
#include <cstring>
#include <sodium.h>

namespace salvage {

void crypto_init() {
  if (sodium_init() < 0)
    throw Error(ErrorCode::Config, "libsodium initialisation failed");
}

Hash256 blake2b_256(const uint8_t *data, size_t len) {
  Hash256 out;
  crypto_generichash(out.data(), out.size(), data, len, nullptr, 0);
  return out;
}

bool parse_cipher_type(const std::string &s, CipherType &out) {
  std::string v;
  for (char c : s) {
    if (c == '\0')
      break;
    v.push_back((char)std::tolower((unsigned char)c));
  }
  // specifiers are truncated to 8 bytes on disk
  if (v.rfind("plaintex", 0) == 0)
    out = CipherType::Plaintext;
  else if (v.rfind("threefis", 0) == 0)
    out = CipherType::Threefish;
  else if (v.rfind("xchacha2", 0) == 0)
    out = CipherType::XChaCha20;
  else
    return false;
  return true;
}

const char *cipher_type_name(CipherType t) {
  switch (t) {
  case CipherType::Plaintext:
    return "plaintext";
  case CipherType::Threefish:
    return "threefish";
  default:
    return "xchacha20";
  }
}

std::unique_ptr<CipherKey> PlaintextKey::derive(uint64_t, uint64_t) const {
  return std::unique_ptr<CipherKey>(new PlaintextKey());
}

namespace {

// BLAKE2b-256(LE64(len) || key || LE64(chunk) || LE64(piece))
Hash256 derive_entropy(const std::vector<uint8_t> &key, uint64_t chunk_index,
                       uint64_t piece_index) {
  std::vector<uint8_t> buf;
  buf.reserve(8 + key.size() + 16);
  append_le64(buf, key.size());
  buf.insert(buf.end(), key.begin(), key.end());
  append_le64(buf, chunk_index);
  append_le64(buf, piece_index);
  return blake2b_256(buf.data(), buf.size());
}

template <typename Cipher>
void threefish_blocks(const std::vector<uint8_t> &key,
                      std::vector<uint8_t> &inout, uint64_t block_index) {
  if (inout.size() % ThreefishKey::kBlockSize != 0)
    throw Error(ErrorCode::InconsistentPieceLength,
                "threefish data of " + std::to_string(inout.size()) +
                    " bytes is not a whole number of blocks");
  Cipher c;
  uint8_t tweak[ThreefishKey::kTweakSize]{};
  for (size_t off = 0; off < inout.size();
       off += ThreefishKey::kBlockSize, block_index++) {
    put_le64(tweak, block_index);
    c.SetKey(key.data(), key.size(),
             CryptoPP::MakeParameters(
                 CryptoPP::Name::Tweak(),
                 CryptoPP::ConstByteArrayParameter(tweak, sizeof(tweak),
                                                   false)));
    c.ProcessBlock(inout.data() + off);
  }
}

} // namespace

XChaCha20Key::XChaCha20Key(const std::vector<uint8_t> &material)
    : material_(material) {
  if (material_.size() != kKeySize + kNonceSize)
    throw Error(ErrorCode::UnsupportedCipher,
                "xchacha20 key must be 56 bytes, got " +
                    std::to_string(material_.size()));
}

std::unique_ptr<CipherKey> XChaCha20Key::derive(uint64_t chunk_index,
                                                uint64_t piece_index) const {
  // the nonce half is kept
  Hash256 entropy = derive_entropy(material_, chunk_index, piece_index);

  std::vector<uint8_t> derived(entropy.begin(), entropy.end());
  derived.insert(derived.end(), material_.begin() + kKeySize, material_.end());
  return std::unique_ptr<CipherKey>(new XChaCha20Key(derived));
}

void XChaCha20Key::encrypt(std::vector<uint8_t> &inout,
                           uint64_t block_index) const {
  if (inout.empty())
    return;
  crypto_stream_xchacha20_xor_ic(inout.data(), inout.data(), inout.size(),
                                 material_.data() + kKeySize, block_index,
                                 material_.data());
}

void XChaCha20Key::decrypt(std::vector<uint8_t> &inout,
                           uint64_t block_index) const {
  encrypt(inout, block_index);
}

ThreefishKey::ThreefishKey(const std::vector<uint8_t> &material)
    : material_(material) {
  if (material_.size() != kKeySize)
    throw Error(ErrorCode::UnsupportedCipher,
                "threefish key must be 64 bytes, got " +
                    std::to_string(material_.size()));
}

std::unique_ptr<CipherKey> ThreefishKey::derive(uint64_t chunk_index,
                                                uint64_t piece_index) const {
  // the 32-byte entropy fills both halves of the child key
  Hash256 entropy = derive_entropy(material_, chunk_index, piece_index);
  std::vector<uint8_t> derived(entropy.begin(), entropy.end());
  derived.insert(derived.end(), entropy.begin(), entropy.end());
  return std::unique_ptr<CipherKey>(new ThreefishKey(derived));
}

void ThreefishKey::encrypt(std::vector<uint8_t> &inout,
                           uint64_t block_index) const {
  threefish_blocks<CryptoPP::Threefish512::Encryption>(material_, inout,
                                                       block_index);
}

void ThreefishKey::decrypt(std::vector<uint8_t> &inout,
                           uint64_t block_index) const {
  threefish_blocks<CryptoPP::Threefish512::Decryption>(material_, inout,
                                                       block_index);
}

std::unique_ptr<CipherKey> make_cipher_key(CipherType type,
                                           const std::vector<uint8_t> &material) {
  switch (type) {
  case CipherType::Plaintext:
    return std::unique_ptr<CipherKey>(new PlaintextKey());
  case CipherType::Threefish:
    return std::unique_ptr<CipherKey>(new ThreefishKey(material));
  case CipherType::XChaCha20:
    return std::unique_ptr<CipherKey>(new XChaCha20Key(material));
  }
  throw Error(ErrorCode::UnsupportedCipher, "unknown cipher type");
}

static void
derive_nonce(uint8_t nonce[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES],
             uint64_t sid, uint64_t rid, uint8_t dir) {
  uint8_t buf[8 + 8 + 1]{};
  put_le64(buf + 0, sid);
  put_le64(buf + 8, rid);
  buf[16] = dir;
  crypto_generichash(nonce, crypto_aead_xchacha20poly1305_ietf_NPUBBYTES, buf,
                     sizeof(buf), nullptr, 0);
}

SodiumAead::SodiumAead() { crypto_init(); }

void SodiumAead::set_key(const std::vector<uint8_t> &key) {
  key_.assign(crypto_aead_xchacha20poly1305_ietf_KEYBYTES, 0);
  if (key.size() == key_.size())
    key_ = key;
  else if (!key.empty())
    crypto_generichash(key_.data(), key_.size(), key.data(), key.size(),
                       nullptr, 0);
}

bool SodiumAead::encrypt(uint64_t session_id, uint64_t request_id,
                         uint8_t direction, std::vector<uint8_t> &inout) const {
  uint8_t nonce[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
  derive_nonce(nonce, session_id, request_id, direction);
  size_t clen = inout.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES;
  std::vector<uint8_t> out(clen);
  unsigned long long outlen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_encrypt(
          out.data(), &outlen, inout.data(), inout.size(), nullptr, 0, nullptr,
          nonce, key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

bool SodiumAead::decrypt(uint64_t session_id, uint64_t request_id,
                         uint8_t direction, std::vector<uint8_t> &inout) const {
  if (inout.size() < crypto_aead_xchacha20poly1305_ietf_ABYTES)
    return false;
  uint8_t nonce[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
  derive_nonce(nonce, session_id, request_id, direction);
  std::vector<uint8_t> out(inout.size());
  unsigned long long outlen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_decrypt(
          out.data(), &outlen, nullptr, inout.data(), inout.size(), nullptr, 0,
          nonce, key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

} // namespace salvage
