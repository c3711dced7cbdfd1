#pragma once
// In-memory hosts and a SessionProvider over them, shared by the tests.
#include "crypto.hpp"
#include "descriptor.hpp"
#include "fec.hpp"
#include "protocol.hpp"
#include "renter.hpp"
#include "sector_client.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace salvage_test {

using namespace salvage;

enum class HostMode { Serve, ContractMissing, Down, Corrupt };

struct FakeHost {
    HostMode mode{HostMode::Serve};
    std::map<Hash256, std::vector<uint8_t>> sectors;
};

class FakeProvider;

class FakeSession : public HostSession {
public:
    FakeSession(FakeProvider& p, std::string key) : provider_(p), key_(std::move(key)) {}
    const std::string& host_key() const override { return key_; }
    RpcStatus rpc_settings(HostSettings& out, const CancelToken& cancel) override;
    RpcStatus rpc_read(const ReadSection& section, uint64_t cost,
                       std::vector<uint8_t>& out, const CancelToken& cancel) override;
    void close() override {}
private:
    FakeProvider& provider_;
    std::string key_;
};

class FakeProvider : public SessionProvider {
public:
    FakeHost& add_host(const std::string& key, HostMode mode = HostMode::Serve) {
        std::lock_guard<std::mutex> lk(mtx_);
        hosts_[key].mode = mode;
        contracts_.insert(key);
        return hosts_[key];
    }
    void store(const std::string& key, const Hash256& root, const std::vector<uint8_t>& sector) {
        std::lock_guard<std::mutex> lk(mtx_);
        hosts_[key].sectors[root] = sector;
    }
    bool sector(const std::string& key, const Hash256& root, std::vector<uint8_t>& out) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto& sectors = hosts_[key].sectors;
        auto it = sectors.find(root);
        if (it == sectors.end())
            return false;
        out = it->second;
        return true;
    }
    void drop_contract(const std::string& key) {
        std::lock_guard<std::mutex> lk(mtx_);
        contracts_.erase(key);
    }

    std::vector<std::string> hosts() override {
        std::lock_guard<std::mutex> lk(mtx_);
        return std::vector<std::string>(contracts_.begin(), contracts_.end());
    }
    std::optional<ContractMeta> host_contract(const std::string& key) override {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!contracts_.count(key))
            return std::nullopt;
        ContractMeta m;
        m.id = "contract-" + key;
        m.host_key = key;
        m.expiration_height = 1000;
        return m;
    }
    std::unique_ptr<HostSession> new_session(const std::string& key, const CancelToken&) override {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!contracts_.count(key))
            throw Error(ErrorCode::NoContract, "no contract with " + key);
        sessions_[key]++;
        return std::unique_ptr<HostSession>(new FakeSession(*this, key));
    }
    void remove_host_contract(const std::string& key) override {
        std::lock_guard<std::mutex> lk(mtx_);
        contracts_.erase(key);
        removed_.push_back(key);
    }

    // Sector reads per host, including failed ones.
    size_t reads(const std::string& key) {
        std::lock_guard<std::mutex> lk(mtx_);
        return reads_[key];
    }
    size_t total_reads() {
        std::lock_guard<std::mutex> lk(mtx_);
        size_t n = 0;
        for (const auto& kv : reads_)
            n += kv.second;
        return n;
    }
    size_t sessions(const std::string& key) {
        std::lock_guard<std::mutex> lk(mtx_);
        return sessions_[key];
    }
    std::vector<std::string> removed() {
        std::lock_guard<std::mutex> lk(mtx_);
        return removed_;
    }

private:
    friend class FakeSession;
    std::mutex mtx_;
    std::map<std::string, FakeHost> hosts_;
    std::set<std::string> contracts_;
    std::map<std::string, size_t> reads_;
    std::map<std::string, size_t> sessions_;
    std::vector<std::string> removed_;
};

inline RpcStatus FakeSession::rpc_settings(HostSettings& out, const CancelToken& cancel) {
    if (cancel.cancelled())
        return RpcStatus::cancelled();
    std::lock_guard<std::mutex> lk(provider_.mtx_);
    const FakeHost& h = provider_.hosts_[key_];
    if (h.mode == HostMode::Down)
        return RpcStatus::transport("connection refused");
    if (h.mode == HostMode::ContractMissing)
        return RpcStatus::host_error(std::string("rpc error: ") + kErrNoContract);
    out = HostSettings{};
    out.base_rpc_price = 1;
    return RpcStatus::success();
}

inline RpcStatus FakeSession::rpc_read(const ReadSection& section, uint64_t,
                                       std::vector<uint8_t>& out, const CancelToken& cancel) {
    if (cancel.cancelled())
        return RpcStatus::cancelled();
    std::lock_guard<std::mutex> lk(provider_.mtx_);
    provider_.reads_[key_]++;
    const FakeHost& h = provider_.hosts_[key_];
    auto it = h.sectors.find(section.merkle_root);
    if (it == h.sectors.end())
        return RpcStatus::host_error(std::string("rpc error: ") + kErrSectorNotFound);
    const auto& s = it->second;
    if (section.offset + section.length > s.size())
        return RpcStatus::host_error("out of bounds");
    out.assign(s.begin() + section.offset, s.begin() + section.offset + section.length);
    if (h.mode == HostMode::Corrupt && !out.empty())
        out[out.size() / 2] ^= 0xFF;
    return RpcStatus::success();
}

inline std::string host_name(size_t i) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02zx", i);
    return std::string("ed25519:") + std::string(62, '0') + buf;
}

inline std::vector<uint8_t> pattern(size_t n, uint32_t seed) {
    std::vector<uint8_t> v(n);
    uint32_t x = seed * 2654435761u + 1;
    for (auto& b : v) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        b = (uint8_t)x;
    }
    return v;
}

// Erasure codes and encrypts data, stores piece p of chunk c on
// place(c, p) through sink.store(host, root, sector) and returns the
// descriptor for it.
template <typename Sink, typename Place>
Descriptor build_file(Sink& sink, const std::vector<uint8_t>& data,
                      uint32_t type, uint32_t k, uint32_t m, uint64_t piece_size,
                      CipherType cipher, const std::vector<uint8_t>& master, Place place) {
    Descriptor d;
    d.file_size = data.size();
    d.piece_size = piece_size;
    d.encoder_type = type;
    d.data_pieces = k;
    d.parity_pieces = m;
    d.master_key = master;
    d.master_key_type = cipher_type_name(cipher);
    auto coder = make_erasure_coder(type, k, m);
    auto key = make_cipher_key(cipher, master);
    for (uint64_t c = 0; c < d.expected_chunks(); c++) {
        uint64_t start = c * d.chunk_size();
        uint64_t len = d.chunk_length(c);
        std::vector<uint8_t> chunk_data(data.begin() + start, data.begin() + start + len);
        auto pieces = coder->encode(chunk_data, piece_size);
        Chunk chunk;
        chunk.pieces.resize(k + m);
        for (uint32_t p = 0; p < k + m; p++) {
            key->derive(c, p)->encrypt(pieces[p], 0);
            std::vector<uint8_t> sector(kSectorSize, 0);
            std::memcpy(sector.data(), pieces[p].data(), pieces[p].size());
            Hash256 root = sector_root(sector);
            std::string host = place(c, p);
            sink.store(host, root, sector);
            chunk.pieces[p].push_back(SectorRef{root, host});
        }
        d.chunks.push_back(std::move(chunk));
    }
    return d;
}

} // namespace salvage_test
