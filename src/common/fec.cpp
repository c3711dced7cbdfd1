
#include "fec.hpp"
#include "error.hpp"
#include <algorithm>
#include <cstring>
#include <string>

namespace salvage {

namespace {

// GF(2^8) with the 0x11D reduction polynomial and generator 2.
struct GaloisField {
  uint8_t exp[512];
  uint8_t log[256];
  GaloisField() {
    int x = 1;
    for (int i = 0; i < 255; i++) {
      exp[i] = (uint8_t)x;
      log[x] = (uint8_t)i;
      x <<= 1;
      if (x & 0x100)
        x ^= 0x11D;
    }
    for (int i = 255; i < 512; i++)
      exp[i] = exp[i - 255];
    log[0] = 0;
  }
};

const GaloisField &gf() {
  static const GaloisField g;
  return g;
}

uint8_t gf_mul(uint8_t a, uint8_t b) {
  if (a == 0 || b == 0)
    return 0;
  return gf().exp[gf().log[a] + gf().log[b]];
}

uint8_t gf_inv(uint8_t a) { return gf().exp[255 - gf().log[a]]; }

uint8_t gf_pow(uint8_t a, int n) {
  if (n == 0)
    return 1;
  if (a == 0)
    return 0;
  return gf().exp[(gf().log[a] * n) % 255];
}

// out ^= c * in
void gf_mul_add(uint8_t c, const uint8_t *in, uint8_t *out, size_t len) {
  if (c == 0)
    return;
  if (c == 1) {
    for (size_t i = 0; i < len; i++)
      out[i] ^= in[i];
    return;
  }
  uint8_t table[256];
  for (int v = 0; v < 256; v++)
    table[v] = gf_mul(c, (uint8_t)v);
  for (size_t i = 0; i < len; i++)
    out[i] ^= table[in[i]];
}

// Gauss-Jordan inversion of a size x size matrix, in place.
bool gf_invert(std::vector<uint8_t> &m, int size) {
  std::vector<uint8_t> inv(size * size, 0);
  for (int i = 0; i < size; i++)
    inv[i * size + i] = 1;
  for (int col = 0; col < size; col++) {
    int pivot = col;
    while (pivot < size && m[pivot * size + col] == 0)
      pivot++;
    if (pivot == size)
      return false;
    if (pivot != col) {
      for (int c = 0; c < size; c++) {
        std::swap(m[pivot * size + c], m[col * size + c]);
        std::swap(inv[pivot * size + c], inv[col * size + c]);
      }
    }
    uint8_t scale = gf_inv(m[col * size + col]);
    for (int c = 0; c < size; c++) {
      m[col * size + c] = gf_mul(m[col * size + c], scale);
      inv[col * size + c] = gf_mul(inv[col * size + c], scale);
    }
    for (int r = 0; r < size; r++) {
      if (r == col)
        continue;
      uint8_t f = m[r * size + col];
      if (f == 0)
        continue;
      for (int c = 0; c < size; c++) {
        m[r * size + c] ^= gf_mul(f, m[col * size + c]);
        inv[r * size + c] ^= gf_mul(f, inv[col * size + c]);
      }
    }
  }
  m.swap(inv);
  return true;
}

struct PieceLayout {
  size_t present{0};
  size_t length{0};
};

PieceLayout check_pieces(const std::vector<std::vector<uint8_t>> &pieces,
                         int num_pieces, int min_pieces) {
  if ((int)pieces.size() != num_pieces)
    throw Error(ErrorCode::InconsistentPieceLength,
                "expected " + std::to_string(num_pieces) + " piece slots, got " +
                    std::to_string(pieces.size()));
  PieceLayout l;
  for (const auto &p : pieces) {
    if (p.empty())
      continue;
    if (l.present == 0)
      l.length = p.size();
    else if (p.size() != l.length)
      throw Error(ErrorCode::InconsistentPieceLength,
                  "pieces have different lengths (" + std::to_string(l.length) +
                      " and " + std::to_string(p.size()) + ")");
    l.present++;
  }
  if ((int)l.present < min_pieces)
    throw Error(ErrorCode::NotEnoughPieces,
                "need " + std::to_string(min_pieces) + " pieces, have " +
                    std::to_string(l.present));
  return l;
}

} // namespace

RSMatrix::RSMatrix(int data_shards, int parity_shards)
    : k_(data_shards), n_(data_shards + parity_shards) {
  if (data_shards <= 0 || parity_shards < 0 || n_ > 256)
    throw Error(ErrorCode::UnsupportedErasureType,
                "invalid erasure parameters " + std::to_string(data_shards) +
                    "+" + std::to_string(parity_shards));
  std::vector<uint8_t> vm(n_ * k_);
  for (int r = 0; r < n_; r++)
    for (int c = 0; c < k_; c++)
      vm[r * k_ + c] = gf_pow((uint8_t)r, c);
  std::vector<uint8_t> top(vm.begin(), vm.begin() + k_ * k_);
  if (!gf_invert(top, k_))
    throw Error(ErrorCode::UnsupportedErasureType, "singular coding matrix");
  m_.assign(n_ * k_, 0);
  for (int r = 0; r < n_; r++)
    for (int c = 0; c < k_; c++) {
      uint8_t acc = 0;
      for (int j = 0; j < k_; j++)
        acc ^= gf_mul(vm[r * k_ + j], top[j * k_ + c]);
      m_[r * k_ + c] = acc;
    }
}

void RSMatrix::encode_parity(const std::vector<const uint8_t *> &data,
                             const std::vector<uint8_t *> &parity,
                             size_t len) const {
  for (int p = 0; p < n_ - k_; p++) {
    std::memset(parity[p], 0, len);
    for (int c = 0; c < k_; c++)
      gf_mul_add(m_[(k_ + p) * k_ + c], data[c], parity[p], len);
  }
}

bool RSMatrix::reconstruct_data(const std::vector<const uint8_t *> &shards,
                                const std::vector<uint8_t *> &data_out,
                                size_t len) const {
  std::vector<int> rows;
  for (int i = 0; i < n_ && (int)rows.size() < k_; i++)
    if (shards[i])
      rows.push_back(i);
  if ((int)rows.size() < k_)
    return false;

  bool all_data = true;
  for (int d = 0; d < k_; d++) {
    if (shards[d]) {
      if (data_out[d] != shards[d])
        std::memcpy(data_out[d], shards[d], len);
    } else {
      all_data = false;
    }
  }
  if (all_data)
    return true;

  std::vector<uint8_t> sub(k_ * k_);
  for (int r = 0; r < k_; r++)
    for (int c = 0; c < k_; c++)
      sub[r * k_ + c] = m_[rows[r] * k_ + c];
  if (!gf_invert(sub, k_))
    return false;
  for (int d = 0; d < k_; d++) {
    if (shards[d])
      continue;
    std::memset(data_out[d], 0, len);
    for (int j = 0; j < k_; j++)
      gf_mul_add(sub[d * k_ + j], shards[rows[j]], data_out[d], len);
  }
  return true;
}

std::vector<std::vector<uint8_t>> RSCode::encode(const std::vector<uint8_t> &data,
                                                 uint64_t piece_size) const {
  const int k = min_pieces();
  if (piece_size == 0 || data.size() > piece_size * k)
    throw Error(ErrorCode::InconsistentPieceLength,
                "data does not fit in " + std::to_string(k) + " pieces of " +
                    std::to_string(piece_size) + " bytes");
  std::vector<std::vector<uint8_t>> pieces(num_pieces(),
                                           std::vector<uint8_t>(piece_size, 0));
  size_t offset = 0;
  for (int i = 0; i < k && offset < data.size(); i++) {
    size_t n = std::min<size_t>(piece_size, data.size() - offset);
    std::memcpy(pieces[i].data(), data.data() + offset, n);
    offset += n;
  }
  std::vector<const uint8_t *> in(k);
  std::vector<uint8_t *> out(num_pieces() - k);
  for (int i = 0; i < k; i++)
    in[i] = pieces[i].data();
  for (int i = k; i < num_pieces(); i++)
    out[i - k] = pieces[i].data();
  matrix_.encode_parity(in, out, piece_size);
  return pieces;
}

void RSCode::recover(std::vector<std::vector<uint8_t>> pieces, uint64_t n,
                     std::ostream &out) const {
  const int k = min_pieces();
  PieceLayout l = check_pieces(pieces, num_pieces(), k);
  if (n > (uint64_t)l.length * k)
    throw Error(ErrorCode::InconsistentPieceLength,
                "cannot recover " + std::to_string(n) + " bytes from pieces of " +
                    std::to_string(l.length));

  std::vector<const uint8_t *> shards(num_pieces(), nullptr);
  for (int i = 0; i < num_pieces(); i++)
    if (!pieces[i].empty())
      shards[i] = pieces[i].data();
  std::vector<uint8_t *> data_out(k);
  for (int d = 0; d < k; d++) {
    if (pieces[d].empty())
      pieces[d].assign(l.length, 0);
    data_out[d] = pieces[d].data();
  }
  if (!matrix_.reconstruct_data(shards, data_out, l.length))
    throw Error(ErrorCode::NotEnoughPieces, "reconstruction failed");

  uint64_t remaining = n;
  for (int d = 0; d < k && remaining > 0; d++) {
    uint64_t w = std::min<uint64_t>(remaining, l.length);
    out.write(reinterpret_cast<const char *>(data_out[d]), (std::streamsize)w);
    remaining -= w;
  }
  if (!out)
    throw Error(ErrorCode::Io, "failed to write recovered chunk");
}

std::vector<std::vector<uint8_t>>
RSSubCode::encode(const std::vector<uint8_t> &data, uint64_t piece_size) const {
  const int k = min_pieces();
  if (piece_size == 0 || piece_size % segment_size_ != 0 ||
      data.size() > piece_size * k)
    throw Error(ErrorCode::InconsistentPieceLength,
                "piece size " + std::to_string(piece_size) +
                    " is not a usable multiple of the segment size");
  std::vector<std::vector<uint8_t>> pieces(num_pieces(),
                                           std::vector<uint8_t>(piece_size, 0));
  // segment s of the chunk is spread over segment s of each data piece
  size_t offset = 0;
  for (uint64_t s = 0; s * segment_size_ < piece_size; s++) {
    for (int i = 0; i < k && offset < data.size(); i++) {
      size_t n = std::min<size_t>(segment_size_, data.size() - offset);
      std::memcpy(pieces[i].data() + s * segment_size_, data.data() + offset, n);
      offset += n;
    }
  }
  std::vector<const uint8_t *> in(k);
  std::vector<uint8_t *> out(num_pieces() - k);
  for (int i = 0; i < k; i++)
    in[i] = pieces[i].data();
  for (int i = k; i < num_pieces(); i++)
    out[i - k] = pieces[i].data();
  // the code is linear per byte position, so coding whole pieces equals
  // coding every segment separately
  matrix_.encode_parity(in, out, piece_size);
  return pieces;
}

void RSSubCode::recover(std::vector<std::vector<uint8_t>> pieces, uint64_t n,
                        std::ostream &out) const {
  const int k = min_pieces();
  PieceLayout l = check_pieces(pieces, num_pieces(), k);
  if (l.length % segment_size_ != 0)
    throw Error(ErrorCode::InconsistentPieceLength,
                "piece length " + std::to_string(l.length) +
                    " is not a multiple of " + std::to_string(segment_size_));
  if (n > (uint64_t)l.length * k)
    throw Error(ErrorCode::InconsistentPieceLength,
                "cannot recover " + std::to_string(n) + " bytes from pieces of " +
                    std::to_string(l.length));

  std::vector<uint8_t> segment_buf(segment_size_ * k);
  std::vector<uint8_t *> data_out(k);
  for (int d = 0; d < k; d++)
    data_out[d] = segment_buf.data() + d * segment_size_;
  std::vector<const uint8_t *> shards(num_pieces(), nullptr);

  uint64_t remaining = n;
  const uint64_t segments = l.length / segment_size_;
  for (uint64_t s = 0; s < segments && remaining > 0; s++) {
    for (int i = 0; i < num_pieces(); i++)
      shards[i] =
          pieces[i].empty() ? nullptr : pieces[i].data() + s * segment_size_;
    if (!matrix_.reconstruct_data(shards, data_out, segment_size_))
      throw Error(ErrorCode::NotEnoughPieces, "reconstruction failed");
    uint64_t w = std::min<uint64_t>(remaining, segment_buf.size());
    out.write(reinterpret_cast<const char *>(segment_buf.data()),
              (std::streamsize)w);
    remaining -= w;
  }
  if (!out)
    throw Error(ErrorCode::Io, "failed to write recovered chunk");
}

std::unique_ptr<ErasureCoder> make_erasure_coder(uint32_t type,
                                                 uint32_t data_pieces,
                                                 uint32_t parity_pieces) {
  if (data_pieces == 0 || data_pieces > 256 || parity_pieces > 256)
    throw Error(ErrorCode::UnsupportedErasureType,
                "invalid erasure parameters " + std::to_string(data_pieces) +
                    "+" + std::to_string(parity_pieces));
  switch (type) {
  case EC_REED_SOLOMON:
    return std::unique_ptr<ErasureCoder>(
        new RSCode((int)data_pieces, (int)parity_pieces));
  case EC_REED_SOLOMON_SUB:
    return std::unique_ptr<ErasureCoder>(
        new RSSubCode((int)data_pieces, (int)parity_pieces));
  default:
    throw Error(ErrorCode::UnsupportedErasureType,
                "unknown erasure coder type: " + std::to_string(type));
  }
}

} // namespace salvage
