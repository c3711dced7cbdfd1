#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>
#include "descriptor.hpp"
#include "renter.hpp"

namespace salvage {

using SectorData = std::shared_ptr<const std::vector<uint8_t>>;

// Verified sectors by Merkle root. Append only for the life of a run.
class SectorCache {
public:
    SectorData get(const Hash256& root) const;
    // Keeps the first entry stored for root and returns it.
    SectorData put(const Hash256& root, std::vector<uint8_t> data);
    size_t size() const;
private:
    mutable std::mutex mtx_;
    std::unordered_map<Hash256, SectorData, Hash256Hasher> sectors_;
};

struct RecoveryConfig {
    size_t workers{100};
    // Health checks download whole sectors and verify their Merkle roots.
    // When false only the first segment is read.
    bool health_full_verify{true};
};

struct RecoveryReport {
    bool recoverable{true};
    size_t chunks_total{0};
    size_t chunks_recovered{0};
    std::optional<size_t> failed_chunk;
    uint64_t bytes_written{0};
    uint64_t network_fetches{0};
    uint64_t cache_hits{0};
    uint64_t races{0};
    uint64_t hosts_removed{0};
};

class Recoverer {
public:
    Recoverer(SessionProvider& provider, RecoveryConfig cfg);

    // Streams the file to out in chunk order. Stops at the first chunk that
    // cannot be rebuilt and reports it. Throws Error for structural failures.
    RecoveryReport recover(const Descriptor& d, std::ostream& out);
    // Writes <path>.partial and renames it to path once every chunk is
    // written. Nothing is left at either path otherwise.
    RecoveryReport recover_file(const Descriptor& d, const std::string& path);

    // Cache first, then host_key. Null when the host cannot supply it.
    SectorData fetch(const Hash256& root, const std::string& host_key);
    // Asks every available host for root; the first verified copy wins.
    SectorData race(const Hash256& root);

    // Aborts in-flight and future fetches.
    void cancel() { cancel_.cancel(); }

    SectorCache& cache() { return cache_; }
    uint64_t network_fetches() const { return network_fetches_.load(); }
    uint64_t cache_hits() const { return cache_hits_.load(); }
    uint64_t races() const { return races_.load(); }
    uint64_t hosts_removed() const { return hosts_removed_.load(); }

private:
    SessionProvider& provider_;
    RecoveryConfig cfg_;
    SectorCache cache_;
    CancelToken cancel_;
    std::atomic<uint64_t> network_fetches_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> races_{0};
    std::atomic<uint64_t> hosts_removed_{0};

    SectorStatus fetch_from(const std::string& host_key, const Hash256& root,
                            const CancelToken& cancel, SectorData& out);
};

} // namespace salvage
