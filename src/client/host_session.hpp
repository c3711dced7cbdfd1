#pragma once
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "crypto.hpp"
#include "protocol.hpp"
#include "sector_client.hpp"

namespace salvage {

struct HostInfo {
    std::string public_key;  // "ed25519:<hex>"
    std::string net_address; // host:port
};

struct ContractMeta {
    std::string id;
    std::string host_key;
    uint64_t expiration_height{0};
};

struct TransportConfig {
    std::vector<uint8_t> key;
    std::chrono::milliseconds dial_timeout{std::chrono::minutes(1)};
    std::chrono::milliseconds settings_timeout{std::chrono::minutes(1)};
    std::chrono::milliseconds read_timeout{std::chrono::minutes(5)};
};

// Opens sessions under an existing contract. Host-side failures do not
// throw: the returned session reports them from its first RPC.
class SessionDialer {
public:
    virtual ~SessionDialer() = default;
    virtual std::unique_ptr<HostSession> dial(const HostInfo& host, const ContractMeta& contract,
                                              const CancelToken& cancel) = 0;
};

// Framed, sealed request/response session over one TCP connection. Each
// call drives a private io_context until the exchange completes, its
// deadline passes or the cancel token fires. Not thread safe.
class TcpHostSession : public HostSession {
public:
    using tcp = asio::ip::tcp;
    TcpHostSession(const HostInfo& host, const ContractMeta& contract, const TransportConfig& cfg);
    ~TcpHostSession() override;

    // Connects and sends OPEN. A failure sticks to the session.
    RpcStatus open(const CancelToken& cancel);

    const std::string& host_key() const override { return host_.public_key; }
    RpcStatus rpc_settings(HostSettings& out, const CancelToken& cancel) override;
    RpcStatus rpc_read(const ReadSection& section, uint64_t cost,
                       std::vector<uint8_t>& out, const CancelToken& cancel) override;
    void close() override;

private:
    asio::io_context io_;
    tcp::socket sock_;
    HostInfo host_;
    ContractMeta contract_;
    TransportConfig cfg_;
    SodiumAead aead_;
    uint64_t session_id_{0};
    uint64_t next_request_{1};
    RpcStatus broken_;

    RpcStatus resolve(const std::string& host, uint16_t port,
                      std::chrono::steady_clock::time_point deadline, const CancelToken& cancel,
                      tcp::resolver::results_type& out);
    RpcStatus run(std::chrono::milliseconds timeout, const CancelToken& cancel, const bool& done);
    RpcStatus exchange(FrameType type, std::vector<uint8_t> payload, std::vector<uint8_t>& reply,
                       std::chrono::milliseconds timeout, const CancelToken& cancel);
    RpcStatus fail(RpcStatus st);
};

class TcpSessionDialer : public SessionDialer {
public:
    explicit TcpSessionDialer(TransportConfig cfg) : cfg_(std::move(cfg)) {}
    std::unique_ptr<HostSession> dial(const HostInfo& host, const ContractMeta& contract,
                                      const CancelToken& cancel) override;
private:
    TransportConfig cfg_;
};

} // namespace salvage
