#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "util.hpp"

namespace salvage {

// Initialises libsodium. Safe to call more than once; throws on failure.
void crypto_init();

Hash256 blake2b_256(const uint8_t* data, size_t len);

enum class CipherType { Plaintext, Threefish, XChaCha20 };

// Accepts the canonical names and the raw 8-byte specifiers found in siafiles.
bool parse_cipher_type(const std::string& s, CipherType& out);
const char* cipher_type_name(CipherType t);

// Key used to encrypt piece data. Derived per (chunk, piece) from the master key.
class CipherKey {
public:
    virtual ~CipherKey() = default;
    virtual CipherType type() const = 0;
    virtual std::unique_ptr<CipherKey> derive(uint64_t chunk_index, uint64_t piece_index) const = 0;
    virtual void encrypt(std::vector<uint8_t>& inout, uint64_t block_index) const = 0;
    virtual void decrypt(std::vector<uint8_t>& inout, uint64_t block_index) const = 0;
};

class PlaintextKey : public CipherKey {
public:
    CipherType type() const override { return CipherType::Plaintext; }
    std::unique_ptr<CipherKey> derive(uint64_t, uint64_t) const override;
    void encrypt(std::vector<uint8_t>&, uint64_t) const override {}
    void decrypt(std::vector<uint8_t>&, uint64_t) const override {}
};

class XChaCha20Key : public CipherKey {
public:
    static constexpr size_t kKeySize = 32;
    static constexpr size_t kNonceSize = 24;
    explicit XChaCha20Key(const std::vector<uint8_t>& material);
    CipherType type() const override { return CipherType::XChaCha20; }
    std::unique_ptr<CipherKey> derive(uint64_t chunk_index, uint64_t piece_index) const override;
    void encrypt(std::vector<uint8_t>& inout, uint64_t block_index) const override;
    void decrypt(std::vector<uint8_t>& inout, uint64_t block_index) const override;
private:
    std::vector<uint8_t> material_; // key || nonce
};

// Threefish-512 with a 64-byte key. Each 64-byte block is decrypted under a
// tweak holding its little-endian block index.
class ThreefishKey : public CipherKey {
public:
    static constexpr size_t kKeySize = 64;
    static constexpr size_t kBlockSize = 64;
    static constexpr size_t kTweakSize = 16;
    explicit ThreefishKey(const std::vector<uint8_t>& material);
    CipherType type() const override { return CipherType::Threefish; }
    std::unique_ptr<CipherKey> derive(uint64_t chunk_index, uint64_t piece_index) const override;
    // Throw Error{InconsistentPieceLength} unless the data is whole blocks.
    void encrypt(std::vector<uint8_t>& inout, uint64_t block_index) const override;
    void decrypt(std::vector<uint8_t>& inout, uint64_t block_index) const override;
private:
    std::vector<uint8_t> material_;
};

// Throws Error{UnsupportedCipher} for malformed key material.
std::unique_ptr<CipherKey> make_cipher_key(CipherType type, const std::vector<uint8_t>& material);

// Seals transport frames. Nonces are bound to (session, request, direction).
class SodiumAead {
public:
    static constexpr size_t kOverhead = 16;
    SodiumAead();
    void set_key(const std::vector<uint8_t>& key);
    bool encrypt(uint64_t session_id, uint64_t request_id, uint8_t direction,
                 std::vector<uint8_t>& inout) const;
    bool decrypt(uint64_t session_id, uint64_t request_id, uint8_t direction,
                 std::vector<uint8_t>& inout) const;
private:
    std::vector<uint8_t> key_;
};

} // namespace salvage
