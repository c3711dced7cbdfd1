#include "crypto.hpp"
#include "error.hpp"
#include "protocol.hpp"
#include "util.hpp"

#include <sodium.h>

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>
#include <vector>

using namespace salvage;

namespace {

Hash256 hash_with_prefix(uint8_t prefix, const uint8_t* data, size_t len) {
    std::vector<uint8_t> buf(1 + len);
    buf[0] = prefix;
    std::memcpy(buf.data() + 1, data, len);
    return blake2b_256(buf.data(), buf.size());
}

// Left subtree holds the largest power of two leaves below n.
Hash256 reference_root(const uint8_t* data, size_t leaves, size_t len) {
    if (leaves == 1) {
        return hash_with_prefix(0x00, data, len);
    }
    size_t left = 1;
    while (left * 2 < leaves) {
        left *= 2;
    }
    const size_t left_bytes = left * kSegmentSize;
    Hash256 l = reference_root(data, left, left_bytes);
    Hash256 r = reference_root(data + left_bytes, leaves - left, len - left_bytes);
    uint8_t joined[64];
    std::memcpy(joined, l.data(), 32);
    std::memcpy(joined + 32, r.data(), 32);
    return hash_with_prefix(0x01, joined, sizeof(joined));
}

std::vector<uint8_t> sample(size_t n) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) {
        v[i] = static_cast<uint8_t>(i * 7 + (i >> 9));
    }
    return v;
}

template <typename Fn>
bool throws_code(Fn fn, ErrorCode code) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code() == code;
    }
    return false;
}

}  // namespace

int main() {
    crypto_init();

    // Merkle roots against a recursive reference.
    for (size_t leaves : {1u, 2u, 3u, 5u, 8u, 13u, 64u}) {
        auto data = sample(leaves * kSegmentSize);
        assert(merkle_root(data.data(), data.size()) == reference_root(data.data(), leaves, data.size()));
    }
    {
        auto sector = sample(kSectorSize);
        const Hash256 root = sector_root(sector);
        assert(root == reference_root(sector.data(), kSectorSize / kSegmentSize, sector.size()));
        sector[kSectorSize - 1] ^= 1;
        assert(sector_root(sector) != root);
    }

    // Plaintext keys are the identity.
    {
        auto key = make_cipher_key(CipherType::Plaintext, {});
        auto data = sample(300);
        auto copy = data;
        key->derive(3, 4)->decrypt(copy, 0);
        assert(copy == data);
    }

    // XChaCha20 derivation and stream.
    {
        std::vector<uint8_t> material(56);
        for (size_t i = 0; i < material.size(); ++i) {
            material[i] = static_cast<uint8_t>(i + 1);
        }
        auto master = make_cipher_key(CipherType::XChaCha20, material);
        assert(master->type() == CipherType::XChaCha20);

        // entropy = BLAKE2b(LE64(56) | key | LE64(chunk) | LE64(piece)), nonce kept
        std::vector<uint8_t> buf;
        append_le64(buf, 56);
        buf.insert(buf.end(), material.begin(), material.end());
        append_le64(buf, 2);
        append_le64(buf, 9);
        Hash256 entropy = blake2b_256(buf.data(), buf.size());
        std::vector<uint8_t> expected_material(entropy.begin(), entropy.end());
        expected_material.insert(expected_material.end(), material.begin() + 32, material.end());
        XChaCha20Key expected(expected_material);

        auto derived = master->derive(2, 9);
        const auto plain = sample(1000);
        auto a = plain;
        auto b = plain;
        derived->encrypt(a, 0);
        expected.encrypt(b, 0);
        assert(a == b);
        assert(a != plain);

        // Matches libsodium's stream directly.
        std::vector<uint8_t> c(plain.size());
        crypto_stream_xchacha20_xor_ic(c.data(), plain.data(), plain.size(), expected_material.data() + 32, 0,
                                       expected_material.data());
        assert(c == a);

        derived->decrypt(a, 0);
        assert(a == plain);

        auto other = plain;
        master->derive(9, 2)->encrypt(other, 0);
        assert(other != b);
    }

    // Threefish-512 known answer: zero key, zero tweak, zero block.
    {
        const auto expected = hex_to_bytes(
            "b1a2bbc6ef6025bc40eb3822161f36e375d1bb0aee3186fbd19e47c5d479947b"
            "7bc2f8586e35f0cff7e7f03084b0b7b1f1ab3961a580a3e97eb41ea14a6d7bbe");
        auto key = make_cipher_key(CipherType::Threefish, std::vector<uint8_t>(64, 0));
        assert(key->type() == CipherType::Threefish);
        std::vector<uint8_t> block(64, 0);
        key->encrypt(block, 0);
        assert(block == expected);
        key->decrypt(block, 0);
        assert(block == std::vector<uint8_t>(64, 0));

        // The tweak advances per block, so equal blocks encrypt differently.
        std::vector<uint8_t> two(128, 0);
        key->encrypt(two, 0);
        assert(std::vector<uint8_t>(two.begin(), two.begin() + 64) == expected);
        assert(std::vector<uint8_t>(two.begin() + 64, two.end()) != expected);
        std::vector<uint8_t> second(64, 0);
        key->encrypt(second, 1);
        assert(std::vector<uint8_t>(two.begin() + 64, two.end()) == second);

        std::vector<uint8_t> ragged(100, 0);
        assert(throws_code([&] { key->decrypt(ragged, 0); }, ErrorCode::InconsistentPieceLength));
    }

    // Threefish derivation repeats the entropy across the 64-byte key.
    {
        std::vector<uint8_t> material(64);
        for (size_t i = 0; i < material.size(); ++i) {
            material[i] = static_cast<uint8_t>(0xA0 ^ i);
        }
        auto master = make_cipher_key(CipherType::Threefish, material);
        std::vector<uint8_t> buf;
        append_le64(buf, 64);
        buf.insert(buf.end(), material.begin(), material.end());
        append_le64(buf, 4);
        append_le64(buf, 1);
        Hash256 entropy = blake2b_256(buf.data(), buf.size());
        std::vector<uint8_t> expected_material(entropy.begin(), entropy.end());
        expected_material.insert(expected_material.end(), entropy.begin(), entropy.end());
        ThreefishKey expected(expected_material);

        const auto plain = sample(4096);
        auto a = plain;
        auto b = plain;
        master->derive(4, 1)->encrypt(a, 0);
        expected.encrypt(b, 0);
        assert(a == b);
        assert(a != plain);
        master->derive(4, 1)->decrypt(a, 0);
        assert(a == plain);
    }

    // Cipher type names and unsupported keys.
    {
        CipherType t;
        assert(parse_cipher_type("xchacha20", t) && t == CipherType::XChaCha20);
        assert(parse_cipher_type(std::string("plaintex", 8), t) && t == CipherType::Plaintext);
        assert(parse_cipher_type("ThreeFish", t) && t == CipherType::Threefish);
        assert(!parse_cipher_type("aes", t));
        assert(throws_code([] { make_cipher_key(CipherType::Threefish, std::vector<uint8_t>(32)); },
                           ErrorCode::UnsupportedCipher));
        assert(throws_code([] { make_cipher_key(CipherType::XChaCha20, std::vector<uint8_t>(32)); },
                           ErrorCode::UnsupportedCipher));
    }

    // Transport sealing binds session, request and direction.
    {
        SodiumAead aead;
        aead.set_key(std::vector<uint8_t>(32, 0x42));
        const auto plain = sample(77);
        auto sealed = plain;
        assert(aead.encrypt(1, 2, 0, sealed));
        assert(sealed.size() == plain.size() + SodiumAead::kOverhead);
        auto opened = sealed;
        assert(aead.decrypt(1, 2, 0, opened) && opened == plain);
        auto wrong_dir = sealed;
        assert(!aead.decrypt(1, 2, 1, wrong_dir));
        auto wrong_req = sealed;
        assert(!aead.decrypt(1, 3, 0, wrong_req));
        auto tampered = sealed;
        tampered[5] ^= 0x10;
        assert(!aead.decrypt(1, 2, 0, tampered));
    }

    // Frame headers.
    {
        FrameHeader h = make_header(FrameType::READ, Direction::Request, 11, 12, 100);
        assert(header_valid(h));
        FrameHeader bad = h;
        bad.request_id = 13;
        assert(!header_valid(bad));
        FrameHeader big = make_header(FrameType::RESPONSE, Direction::Response, 1, 1, kMaxPayload + 1000);
        assert(!header_valid(big));
    }

    // Read cost saturates instead of wrapping.
    {
        HostSettings s;
        s.base_rpc_price = 10;
        s.sector_access_price = 20;
        s.download_bandwidth_price = 3;
        ReadSection section;
        assert(read_cost(s, section) == 30 + 3 * kSectorSize);
        s.download_bandwidth_price = std::numeric_limits<uint64_t>::max() / 2;
        assert(read_cost(s, section) == std::numeric_limits<uint64_t>::max());

        HostSettings decoded;
        assert(decode_settings(encode_settings(s), decoded));
        assert(decoded.download_bandwidth_price == s.download_bandwidth_price);
        assert(!decode_settings(std::vector<uint8_t>(31), decoded));

        section.merkle_root = sector_root(sample(128));
        section.offset = 64;
        section.length = 64;
        ReadSection parsed;
        uint64_t cost = 0;
        assert(decode_read_request(encode_read_request(section, 99), parsed, cost));
        assert(parsed.merkle_root == section.merkle_root && parsed.offset == 64 && parsed.length == 64);
        assert(cost == 99);
    }

    // Encoding helpers.
    {
        std::vector<uint8_t> raw = {0, 1, 2, 250, 251, 255};
        std::vector<uint8_t> back;
        assert(base64_decode(base64_encode(raw), back) && back == raw);
        assert(base64_encode({'f', 'o', 'o'}) == "Zm9v");
        assert(!base64_decode("@@@", back));
        assert(hex_to_bytes(bytes_to_hex(raw)) == raw);
        assert(hex_to_bytes("zz").empty());
        Hash256 h;
        assert(!hex_to_hash("abcd", h));

        std::string host;
        uint16_t port = 0;
        assert(parse_host_port("[::1]:9982", host, port) && host == "::1" && port == 9982);
        assert(!parse_host_port("nohost", host, port));
    }

    // Child tokens follow their parent.
    {
        CancelToken run;
        CancelToken race = run.child();
        assert(!race.cancelled());
        race.cancel();
        assert(race.cancelled() && !run.cancelled());
        CancelToken next = run.child();
        run.cancel();
        assert(next.cancelled());
    }

    return 0;
}
