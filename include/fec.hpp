#pragma once
#include <cstdint>
#include <memory>
#include <ostream>
#include <vector>

namespace salvage {

enum ErasureType : uint32_t {
    EC_REED_SOLOMON     = 1,
    EC_REED_SOLOMON_SUB = 2
};

constexpr uint64_t kSubCodeSegmentSize = 64;

// Systematic Reed-Solomon matrix over GF(2^8). Rows 0..k-1 are the identity.
class RSMatrix {
public:
    RSMatrix(int data_shards, int parity_shards);
    int data_shards() const { return k_; }
    int total_shards() const { return n_; }
    void encode_parity(const std::vector<const uint8_t*>& data,
                       const std::vector<uint8_t*>& parity, size_t len) const;
    // shards[i] is null when absent. Writes data shard d into data_out[d] for
    // every d < k. Returns false when fewer than k shards are present.
    bool reconstruct_data(const std::vector<const uint8_t*>& shards,
                          const std::vector<uint8_t*>& data_out, size_t len) const;
private:
    int k_;
    int n_;
    std::vector<uint8_t> m_; // n_ x k_
};

class ErasureCoder {
public:
    virtual ~ErasureCoder() = default;
    virtual uint32_t type() const = 0;
    virtual int min_pieces() const = 0;
    virtual int num_pieces() const = 0;
    // Splits data into num_pieces() pieces of piece_size bytes, zero padded.
    virtual std::vector<std::vector<uint8_t>> encode(const std::vector<uint8_t>& data,
                                                     uint64_t piece_size) const = 0;
    // Empty entries are absent. Writes exactly n bytes to out.
    virtual void recover(std::vector<std::vector<uint8_t>> pieces, uint64_t n,
                         std::ostream& out) const = 0;
};

class RSCode : public ErasureCoder {
public:
    RSCode(int data_pieces, int parity_pieces) : matrix_(data_pieces, parity_pieces) {}
    uint32_t type() const override { return EC_REED_SOLOMON; }
    int min_pieces() const override { return matrix_.data_shards(); }
    int num_pieces() const override { return matrix_.total_shards(); }
    std::vector<std::vector<uint8_t>> encode(const std::vector<uint8_t>& data,
                                             uint64_t piece_size) const override;
    void recover(std::vector<std::vector<uint8_t>> pieces, uint64_t n,
                 std::ostream& out) const override;
private:
    RSMatrix matrix_;
};

// Codes each 64-byte segment of the pieces independently, so a prefix of the
// chunk can be rebuilt from matching prefixes of the pieces.
class RSSubCode : public ErasureCoder {
public:
    RSSubCode(int data_pieces, int parity_pieces, uint64_t segment_size = kSubCodeSegmentSize)
        : matrix_(data_pieces, parity_pieces), segment_size_(segment_size) {}
    uint32_t type() const override { return EC_REED_SOLOMON_SUB; }
    int min_pieces() const override { return matrix_.data_shards(); }
    int num_pieces() const override { return matrix_.total_shards(); }
    std::vector<std::vector<uint8_t>> encode(const std::vector<uint8_t>& data,
                                             uint64_t piece_size) const override;
    void recover(std::vector<std::vector<uint8_t>> pieces, uint64_t n,
                 std::ostream& out) const override;
private:
    RSMatrix matrix_;
    uint64_t segment_size_;
};

// Throws Error{UnsupportedErasureType}.
std::unique_ptr<ErasureCoder> make_erasure_coder(uint32_t type, uint32_t data_pieces,
                                                 uint32_t parity_pieces);

} // namespace salvage
