#pragma once
#include <string>
#include <vector>
#include "protocol.hpp"
#include "util.hpp"

namespace salvage {

// Outcome of one RPC below the classification layer.
struct RpcStatus {
    enum class Kind { Ok, HostError, Transport, Timeout, Cancelled };
    Kind kind{Kind::Ok};
    std::string message;

    bool ok() const { return kind == Kind::Ok; }
    static RpcStatus success() { return RpcStatus{}; }
    static RpcStatus host_error(std::string msg) { return RpcStatus{Kind::HostError, std::move(msg)}; }
    static RpcStatus transport(std::string msg) { return RpcStatus{Kind::Transport, std::move(msg)}; }
    static RpcStatus timeout(std::string msg) { return RpcStatus{Kind::Timeout, std::move(msg)}; }
    static RpcStatus cancelled() { return RpcStatus{Kind::Cancelled, "cancelled"}; }
};

// An open session with one host under an existing contract.
class HostSession {
public:
    virtual ~HostSession() = default;
    virtual const std::string& host_key() const = 0;
    virtual RpcStatus rpc_settings(HostSettings& out, const CancelToken& cancel) = 0;
    virtual RpcStatus rpc_read(const ReadSection& section, uint64_t cost,
                               std::vector<uint8_t>& out, const CancelToken& cancel) = 0;
    virtual void close() = 0;
};

enum class SectorStatus { Ok, NotFound, ContractMissing, TransportError };

const char* sector_status_name(SectorStatus s);

struct SectorResult {
    SectorStatus status{SectorStatus::TransportError};
    std::vector<uint8_t> data;
    std::string detail;
    bool ok() const { return status == SectorStatus::Ok; }
};

SectorStatus classify(const RpcStatus& st);

// Fetches a full sector and verifies its Merkle root against root.
SectorResult read_sector(HostSession& session, const Hash256& root, const CancelToken& cancel);

// Presence check: reads the first segment only, unless full_verify is set,
// in which case the whole sector is fetched and verified.
SectorResult check_sector(HostSession& session, const Hash256& root, const CancelToken& cancel,
                          bool full_verify = false);

} // namespace salvage
