
#include "descriptor.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include "fec.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>

namespace salvage {

using nlohmann::json;

namespace {

[[noreturn]] void malformed(const std::string &what) {
  throw Error(ErrorCode::MalformedDescriptor, what);
}

// Length of the JSON object that opens the file.
size_t json_header_extent(const std::vector<uint8_t> &b) {
  size_t i = 0;
  while (i < b.size() && std::isspace(b[i]))
    i++;
  if (i == b.size() || b[i] != '{')
    malformed("descriptor does not start with a metadata object");
  int depth = 0;
  bool in_string = false, escaped = false;
  for (; i < b.size(); i++) {
    char c = (char)b[i];
    if (in_string) {
      if (escaped)
        escaped = false;
      else if (c == '\\')
        escaped = true;
      else if (c == '"')
        in_string = false;
      continue;
    }
    if (c == '"')
      in_string = true;
    else if (c == '{' || c == '[')
      depth++;
    else if (c == '}' || c == ']') {
      if (--depth == 0)
        return i + 1;
    }
  }
  malformed("metadata object is not terminated");
}

uint64_t get_u64(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer())
    malformed(std::string("metadata field ") + key + " is missing");
  if (it->is_number_unsigned())
    return it->get<uint64_t>();
  int64_t v = it->get<int64_t>();
  if (v < 0)
    malformed(std::string("metadata field ") + key + " is negative");
  return (uint64_t)v;
}

std::vector<uint8_t> get_byte_array(const json &j, const char *key,
                                    size_t n) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_array() || it->size() != n)
    malformed(std::string("metadata field ") + key + " must hold " +
              std::to_string(n) + " bytes");
  std::vector<uint8_t> out;
  for (const auto &v : *it) {
    if (!v.is_number_unsigned() || v.get<uint64_t>() > 0xFF)
      malformed(std::string("metadata field ") + key + " is not a byte array");
    out.push_back((uint8_t)v.get<uint64_t>());
  }
  return out;
}

// Specifiers are short ASCII tags padded with zeros.
bool printable_ascii(const std::string &s) {
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return c >= 0x20 && c < 0x7F; });
}

uint32_t narrow_u32(uint64_t v, const char *key) {
  if (v > std::numeric_limits<uint32_t>::max())
    malformed(std::string("metadata field ") + key + " is out of range");
  return (uint32_t)v;
}

std::string key_type_string(const json &j) {
  auto it = j.find("masterkeytype");
  if (it == j.end() || it->is_null())
    return cipher_type_name(CipherType::Plaintext);
  std::string raw;
  if (it->is_string()) {
    raw = it->get<std::string>();
  } else if (it->is_array()) {
    for (const auto &v : *it) {
      if (!v.is_number_unsigned())
        malformed("metadata field masterkeytype is not a byte array");
      raw.push_back((char)v.get<uint64_t>());
    }
  } else {
    malformed("metadata field masterkeytype has an unexpected type");
  }
  CipherType t;
  if (parse_cipher_type(raw, t))
    return cipher_type_name(t);
  std::string name = raw.substr(0, raw.find('\0'));
  if (!printable_ascii(name))
    malformed("master key type is not a printable specifier");
  return name;
}

std::string host_key_string(const uint8_t *entry) {
  size_t n = 0;
  while (n < 16 && entry[n] != 0)
    n++;
  std::string algo((const char *)entry, n);
  if (algo.empty() || !printable_ascii(algo))
    malformed("host table entry has an invalid key specifier");
  uint64_t key_len = read_le64(entry + 16);
  if (key_len != 32)
    malformed("host table entry has key length " + std::to_string(key_len));
  return algo + ":" + bytes_to_hex(entry + 24, 32);
}

void check_erasure(const Descriptor &d) {
  if (d.encoder_type != EC_REED_SOLOMON &&
      d.encoder_type != EC_REED_SOLOMON_SUB)
    malformed("unknown erasure coder type: " + std::to_string(d.encoder_type));
  if (d.data_pieces == 0 || d.data_pieces > 256 || d.parity_pieces > 256 ||
      d.num_pieces() > 256)
    malformed("invalid erasure parameters " + std::to_string(d.data_pieces) +
              "+" + std::to_string(d.parity_pieces));
  if (d.piece_size == 0)
    malformed("piece size is zero");
  if (d.piece_size > std::numeric_limits<uint64_t>::max() / d.data_pieces)
    malformed("piece size " + std::to_string(d.piece_size) +
              " overflows the chunk size");
}

} // namespace

uint64_t Descriptor::expected_chunks() const {
  uint64_t cs = chunk_size();
  if (cs == 0)
    return 0;
  uint64_t n = file_size / cs;
  if (file_size % cs != 0 || n == 0)
    n++;
  return n;
}

uint64_t Descriptor::chunk_length(size_t idx) const {
  uint64_t cs = chunk_size();
  uint64_t start = cs * idx;
  if (start >= file_size)
    return 0;
  return std::min(cs, file_size - start);
}

bool operator==(const SectorRef &a, const SectorRef &b) {
  return a.merkle_root == b.merkle_root && a.host_key == b.host_key;
}

bool operator==(const Chunk &a, const Chunk &b) { return a.pieces == b.pieces; }

bool operator==(const Descriptor &a, const Descriptor &b) {
  return a.file_size == b.file_size && a.piece_size == b.piece_size &&
         a.encoder_type == b.encoder_type && a.data_pieces == b.data_pieces &&
         a.parity_pieces == b.parity_pieces && a.master_key == b.master_key &&
         a.master_key_type == b.master_key_type && a.skylinks == b.skylinks &&
         a.chunks == b.chunks;
}

Descriptor decode_descriptor(const std::vector<uint8_t> &bytes) {
  size_t header_len = json_header_extent(bytes);
  json meta;
  try {
    meta = json::parse(bytes.begin(), bytes.begin() + header_len);
  } catch (const json::exception &e) {
    malformed(std::string("failed to decode metadata: ") + e.what());
  }

  Descriptor d;
  d.file_size = get_u64(meta, "filesize");
  d.piece_size = get_u64(meta, "piecesize");
  auto ec_type = get_byte_array(meta, "erasurecodetype", 4);
  auto ec_params = get_byte_array(meta, "erasurecodeparams", 8);
  d.encoder_type = read_be32(ec_type.data());
  d.data_pieces = read_le32(ec_params.data());
  d.parity_pieces = read_le32(ec_params.data() + 4);
  check_erasure(d);

  auto mk = meta.find("masterkey");
  if (mk != meta.end() && mk->is_string() &&
      !base64_decode(mk->get<std::string>(), d.master_key))
    malformed("master key is not valid base64");
  d.master_key_type = key_type_string(meta);
  auto sl = meta.find("skylinks");
  if (sl != meta.end() && sl->is_array()) {
    for (const auto &s : *sl)
      if (s.is_string())
        d.skylinks.push_back(s.get<std::string>());
  }

  uint64_t table_off = get_u64(meta, "pubkeytableoffset");
  uint64_t chunk_off = get_u64(meta, "chunkoffset");
  if (chunk_off < table_off || chunk_off > bytes.size())
    malformed("host table offsets out of range");
  uint64_t host_count = (chunk_off - table_off) / kHostTableEntrySize;
  std::vector<std::string> hosts;
  hosts.reserve(host_count);
  for (uint64_t i = 0; i < host_count; i++)
    hosts.push_back(
        host_key_string(bytes.data() + table_off + i * kHostTableEntrySize));

  const uint64_t chunks = d.expected_chunks();
  std::vector<uint8_t> record(kChunkRecordSize);
  for (uint64_t c = 0; c < chunks; c++) {
    uint64_t start = chunk_off + c * kChunkRecordSize;
    if (start >= bytes.size())
      malformed("chunk table truncated at chunk " + std::to_string(c) + " of " +
                std::to_string(chunks));
    // the final record may be short on disk
    size_t avail = (size_t)std::min<uint64_t>(kChunkRecordSize,
                                              bytes.size() - start);
    std::fill(record.begin(), record.end(), 0);
    std::memcpy(record.data(), bytes.data() + start, avail);

    Chunk chunk;
    chunk.pieces.resize(d.num_pieces());
    const uint8_t *p = record.data() + kChunkRecordSkip;
    uint16_t count = read_le16(p);
    p += 2;
    if (kChunkRecordSkip + 2 + (size_t)count * 40 > kChunkRecordSize)
      malformed("chunk " + std::to_string(c) + " lists " +
                std::to_string(count) + " pieces, more than fit in a record");
    for (uint16_t i = 0; i < count; i++, p += 40) {
      uint32_t piece_index = read_le32(p);
      uint32_t host_index = read_le32(p + 4);
      if (piece_index >= d.num_pieces())
        malformed("piece index " + std::to_string(piece_index) +
                  " out of range");
      if (host_index >= hosts.size())
        malformed("host index " + std::to_string(host_index) + " out of range");
      SectorRef ref;
      std::memcpy(ref.merkle_root.data(), p + 8, 32);
      ref.host_key = hosts[host_index];
      chunk.pieces[piece_index].push_back(std::move(ref));
    }
    d.chunks.push_back(std::move(chunk));
  }
  return d;
}

json descriptor_to_json(const Descriptor &d) {
  json chunks = json::array();
  for (const auto &c : d.chunks) {
    json pieces = json::array();
    for (const auto &piece : c.pieces) {
      json refs = json::array();
      for (const auto &r : piece)
        refs.push_back({{"merkleRoot", hash_to_hex(r.merkle_root)},
                        {"hostKey", r.host_key}});
      pieces.push_back(std::move(refs));
    }
    chunks.push_back({{"pieces", std::move(pieces)}});
  }
  return json{{"fileSize", d.file_size},
              {"pieceSize", d.piece_size},
              {"encoderType", d.encoder_type},
              {"dataPieces", d.data_pieces},
              {"parityPieces", d.parity_pieces},
              {"masterKey", base64_encode(d.master_key)},
              {"masterKeyType", d.master_key_type},
              {"skylinks", d.skylinks},
              {"chunks", std::move(chunks)}};
}

Descriptor descriptor_from_json(const json &j) {
  Descriptor d;
  try {
    d.file_size = get_u64(j, "fileSize");
    d.piece_size = get_u64(j, "pieceSize");
    d.encoder_type = narrow_u32(get_u64(j, "encoderType"), "encoderType");
    d.data_pieces = narrow_u32(get_u64(j, "dataPieces"), "dataPieces");
    d.parity_pieces = narrow_u32(get_u64(j, "parityPieces"), "parityPieces");
    if (!base64_decode(j.value("masterKey", std::string()), d.master_key))
      malformed("master key is not valid base64");
    d.master_key_type = j.value("masterKeyType", std::string("plaintext"));
    if (!printable_ascii(d.master_key_type))
      malformed("master key type is not a printable specifier");
    if (j.contains("skylinks") && !j.at("skylinks").is_null())
      d.skylinks = j.at("skylinks").get<std::vector<std::string>>();
    check_erasure(d);
    for (const auto &jc : j.at("chunks")) {
      Chunk c;
      for (const auto &jp : jc.at("pieces")) {
        std::vector<SectorRef> refs;
        for (const auto &jr : jp) {
          SectorRef r;
          if (!hex_to_hash(jr.at("merkleRoot").get<std::string>(),
                           r.merkle_root))
            malformed("invalid merkle root");
          r.host_key = jr.at("hostKey").get<std::string>();
          refs.push_back(std::move(r));
        }
        c.pieces.push_back(std::move(refs));
      }
      if (c.pieces.size() != d.num_pieces())
        malformed("chunk has " + std::to_string(c.pieces.size()) +
                  " piece slots, expected " + std::to_string(d.num_pieces()));
      d.chunks.push_back(std::move(c));
    }
  } catch (const json::exception &e) {
    malformed(std::string("invalid exported descriptor: ") + e.what());
  }
  if (d.chunks.size() != d.expected_chunks())
    malformed("descriptor lists " + std::to_string(d.chunks.size()) +
              " chunks, expected " + std::to_string(d.expected_chunks()));
  return d;
}

std::vector<uint8_t> read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw Error(ErrorCode::Io, "failed to open " + path);
  std::vector<uint8_t> out((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
  if (in.bad())
    throw Error(ErrorCode::Io, "failed to read " + path);
  return out;
}

Descriptor load_descriptor(const std::string &path) {
  auto bytes = read_file(path);
  const std::string ext = ".json";
  if (path.size() >= ext.size() &&
      path.compare(path.size() - ext.size(), ext.size(), ext) == 0) {
    json j;
    try {
      j = json::parse(bytes.begin(), bytes.end());
    } catch (const json::exception &e) {
      malformed(path + ": " + e.what());
    }
    return descriptor_from_json(j);
  }
  return decode_descriptor(bytes);
}

} // namespace salvage
