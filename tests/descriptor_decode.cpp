#include "crypto.hpp"
#include "descriptor.hpp"
#include "error.hpp"
#include "fec.hpp"
#include "util.hpp"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace salvage;

namespace {

struct Triple {
    uint32_t piece;
    uint32_t host;
    uint8_t root_seed;
};

struct Layout {
    uint64_t file_size = 10 << 20;
    uint64_t piece_size = 4 << 20;
    uint8_t ec_type = 1;
    uint32_t data = 10;
    uint32_t parity = 20;
    size_t hosts = 3;
    std::vector<std::vector<Triple>> chunks;
    size_t truncate_last_record_to = 4096;
    std::string key_type_json = "[120,99,104,97,99,104,97,50]";  // "xchacha2"
    std::string algo = "ed25519";
};

void put_le(std::vector<uint8_t>& out, uint64_t v, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

Hash256 root_of(uint8_t seed) {
    Hash256 h{};
    for (size_t i = 0; i < h.size(); ++i) {
        h[i] = static_cast<uint8_t>(seed + i);
    }
    return h;
}

std::string host_key(size_t i) {
    std::vector<uint8_t> key(32, static_cast<uint8_t>(0xA0 + i));
    return "ed25519:" + bytes_to_hex(key);
}

std::vector<uint8_t> build(const Layout& l) {
    const uint64_t table_off = 4096;
    const uint64_t chunk_off = table_off + l.hosts * kHostTableEntrySize;
    std::vector<uint8_t> master(56, 7);

    std::string header = "{\"filesize\":" + std::to_string(l.file_size) +
                         ",\"piecesize\":" + std::to_string(l.piece_size) +
                         ",\"pubkeytableoffset\":" + std::to_string(table_off) +
                         ",\"chunkoffset\":" + std::to_string(chunk_off) +
                         ",\"erasurecodetype\":[0,0,0," + std::to_string(l.ec_type) + "]" +
                         ",\"erasurecodeparams\":[" + std::to_string(l.data) + ",0,0,0," +
                         std::to_string(l.parity) + ",0,0,0]" +
                         ",\"masterkey\":\"" + base64_encode(master) + "\"" +
                         ",\"masterkeytype\":" + l.key_type_json +
                         ",\"skylinks\":[\"AAC0uO43g64ULpyrW0zO3bjEknSFbAhm8c-RFP21EQlmSQ\"]" +
                         ",\"nested\":{\"brace\":\"}\"}}";
    std::vector<uint8_t> out(header.begin(), header.end());
    assert(out.size() <= table_off);
    out.resize(table_off, 0);

    for (size_t h = 0; h < l.hosts; ++h) {
        std::vector<uint8_t> entry(16, 0);
        std::copy(l.algo.begin(), l.algo.end(), entry.begin());
        put_le(entry, 32, 8);
        std::vector<uint8_t> key(32, static_cast<uint8_t>(0xA0 + h));
        entry.insert(entry.end(), key.begin(), key.end());
        entry.push_back(1);
        assert(entry.size() == kHostTableEntrySize);
        out.insert(out.end(), entry.begin(), entry.end());
    }

    for (size_t c = 0; c < l.chunks.size(); ++c) {
        std::vector<uint8_t> record(kChunkRecordSkip, 0xEE);
        put_le(record, l.chunks[c].size(), 2);
        for (const auto& t : l.chunks[c]) {
            put_le(record, t.piece, 4);
            put_le(record, t.host, 4);
            Hash256 r = root_of(t.root_seed);
            record.insert(record.end(), r.begin(), r.end());
        }
        record.resize(kChunkRecordSize, 0);
        if (c + 1 == l.chunks.size()) {
            record.resize(l.truncate_last_record_to);
        }
        out.insert(out.end(), record.begin(), record.end());
    }
    return out;
}

ErrorCode decode_error(const std::vector<uint8_t>& bytes) {
    try {
        decode_descriptor(bytes);
    } catch (const Error& e) {
        return e.code();
    }
    assert(false && "expected a decode error");
    return ErrorCode::Config;
}

ErrorCode import_error(const nlohmann::json& j) {
    try {
        descriptor_from_json(j);
    } catch (const Error& e) {
        return e.code();
    }
    assert(false && "expected an import error");
    return ErrorCode::Config;
}

}  // namespace

int main() {
    Layout base;
    base.chunks = {{{0, 0, 1}, {0, 1, 1}, {5, 2, 2}, {29, 1, 3}}};

    // Basic decode.
    const auto bytes = build(base);
    const Descriptor d = decode_descriptor(bytes);
    assert(d.file_size == 10u << 20);
    assert(d.piece_size == 4u << 20);
    assert(d.encoder_type == EC_REED_SOLOMON);
    assert(d.data_pieces == 10 && d.parity_pieces == 20);
    assert(d.num_pieces() == 30);
    assert(d.master_key == std::vector<uint8_t>(56, 7));
    assert(d.master_key_type == "xchacha20");
    assert(d.skylinks.size() == 1);
    assert(d.chunks.size() == 1);
    assert(d.chunks[0].pieces.size() == 30);
    assert(d.chunks[0].pieces[0].size() == 2);
    assert(d.chunks[0].pieces[0][0].host_key == host_key(0));
    assert(d.chunks[0].pieces[0][1].host_key == host_key(1));
    assert(d.chunks[0].pieces[0][1].merkle_root == root_of(1));
    assert(d.chunks[0].pieces[5][0].merkle_root == root_of(2));
    assert(d.chunks[0].pieces[29][0].host_key == host_key(1));
    assert(d.chunks[0].pieces[1].empty());
    assert(d.chunk_length(0) == 10u << 20);

    // Deterministic.
    assert(decode_descriptor(bytes) == d);

    // Exported JSON round trip.
    const auto j = descriptor_to_json(d);
    assert(j.at("fileSize").get<uint64_t>() == d.file_size);
    assert(j.at("masterKeyType").get<std::string>() == "xchacha20");
    assert(j.at("chunks")[0].at("pieces")[0][0].at("merkleRoot").get<std::string>() ==
           hash_to_hex(root_of(1)));
    const Descriptor back = descriptor_from_json(j);
    assert(back == d);
    assert(descriptor_from_json(nlohmann::json::parse(j.dump())) == d);

    // load_descriptor picks the format from the extension.
    {
        const std::string bin_path = "descriptor_decode_test.sia";
        const std::string json_path = "descriptor_decode_test.json";
        std::ofstream(bin_path, std::ios::binary).write(reinterpret_cast<const char*>(bytes.data()),
                                                        static_cast<std::streamsize>(bytes.size()));
        std::ofstream(json_path) << j.dump(2);
        assert(load_descriptor(bin_path) == d);
        assert(load_descriptor(json_path) == d);
        std::remove(bin_path.c_str());
        std::remove(json_path.c_str());
    }

    // Multiple chunks, final record short on disk, string key type.
    {
        Layout l = base;
        l.file_size = (40u << 20) * 2 + 5;
        l.chunks = {{{0, 0, 1}}, {{1, 1, 2}}, {{2, 2, 3}}};
        l.truncate_last_record_to = kChunkRecordSkip + 2 + 40;
        l.key_type_json = "\"plaintext\"";
        const Descriptor m = decode_descriptor(build(l));
        assert(m.chunks.size() == 3);
        assert(m.master_key_type == "plaintext");
        assert(m.chunks[2].pieces[2][0].host_key == host_key(2));
        assert(m.chunk_length(2) == 5);
        assert(m.chunk_length(0) + m.chunk_length(1) + m.chunk_length(2) == m.file_size);
        assert(descriptor_from_json(descriptor_to_json(m)) == m);
    }

    // Sub-code type tag.
    {
        Layout l = base;
        l.ec_type = 2;
        assert(decode_descriptor(build(l)).encoder_type == EC_REED_SOLOMON_SUB);
    }

    // Malformed inputs.
    {
        Layout l = base;
        l.chunks = {{{30, 0, 1}}};
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        Layout l = base;
        l.chunks = {{{0, 3, 1}}};
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        Layout l = base;
        l.file_size = (40u << 20) + 1;  // two chunks declared, one present
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        Layout l = base;
        l.ec_type = 7;
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        Layout l = base;
        l.data = 0;
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        Layout l = base;
        std::vector<Triple> many;
        for (uint32_t i = 0; i < 110; ++i) {
            many.push_back({i % 30, 0, 1});
        }
        l.chunks = {many};
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        std::string junk = "not a descriptor";
        assert(decode_error(std::vector<uint8_t>(junk.begin(), junk.end())) ==
               ErrorCode::MalformedDescriptor);
        std::string open = "{\"filesize\": 10";
        assert(decode_error(std::vector<uint8_t>(open.begin(), open.end())) ==
               ErrorCode::MalformedDescriptor);
    }
    {
        auto cut = bytes;
        cut.resize(4096 + 20);  // inside the host table
        assert(decode_error(cut) == ErrorCode::MalformedDescriptor);
    }
    {
        auto bad = descriptor_to_json(d);
        bad["chunks"][0]["pieces"].erase(0);
        bool threw = false;
        try {
            descriptor_from_json(bad);
        } catch (const Error& e) {
            threw = e.code() == ErrorCode::MalformedDescriptor;
        }
        assert(threw);
    }

    // A chunk size that wraps around would decode to no chunks at all.
    {
        Layout l = base;
        l.file_size = 1000;
        l.piece_size = 1ull << 63;
        l.data = 2;
        l.parity = 1;
        l.chunks = {{{0, 0, 1}}};
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);

        auto j = descriptor_to_json(d);
        j["pieceSize"] = 1ull << 63;
        j["dataPieces"] = 2;
        assert(import_error(j) == ErrorCode::MalformedDescriptor);
    }

    // Specifiers must be printable so the topology exports as JSON.
    {
        Layout l = base;
        l.algo = "\xFF" "d25519";
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        Layout l = base;
        l.key_type_json = "[255,1,2,3,0,0,0,0]";
        assert(decode_error(build(l)) == ErrorCode::MalformedDescriptor);
    }
    {
        Layout l = base;
        l.key_type_json = "[116,119,111,102,105,115,104,0]";  // "twofish"
        Descriptor t = decode_descriptor(build(l));
        assert(t.master_key_type == "twofish");
        assert(descriptor_from_json(nlohmann::json::parse(descriptor_to_json(t).dump())) == t);
    }

    // Exported counts are range checked, not truncated.
    {
        auto j = descriptor_to_json(d);
        j["dataPieces"] = 4294967297ull;
        assert(import_error(j) == ErrorCode::MalformedDescriptor);
        j = descriptor_to_json(d);
        j["encoderType"] = -1;
        assert(import_error(j) == ErrorCode::MalformedDescriptor);
        j = descriptor_to_json(d);
        j["parityPieces"] = "20";
        assert(import_error(j) == ErrorCode::MalformedDescriptor);
    }

    return 0;
}
