#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "descriptor.hpp"
#include "recovery.hpp"
#include "renter.hpp"

namespace salvage {

struct PieceHealth {
    Hash256 merkle_root{};
    std::vector<std::string> hosts;
};

struct ChunkHealth {
    uint32_t min_pieces{0};
    uint32_t available_pieces{0};
    std::vector<std::vector<PieceHealth>> pieces;
};

struct FileHealth {
    std::vector<ChunkHealth> chunks;
    bool recoverable{false};
};

nlohmann::json health_to_json(const FileHealth& h);

// Read-only pass over a descriptor: asks every available host about every
// distinct root and reports which slots could be fetched.
class HealthChecker {
public:
    HealthChecker(SessionProvider& provider, RecoveryConfig cfg)
        : provider_(provider), cfg_(cfg) {}
    FileHealth check(const Descriptor& d);

    uint64_t sector_checks() const { return checks_.load(); }
    uint64_t hosts_removed() const { return hosts_removed_.load(); }

private:
    SessionProvider& provider_;
    RecoveryConfig cfg_;
    std::atomic<uint64_t> checks_{0};
    std::atomic<uint64_t> hosts_removed_{0};
};

} // namespace salvage
