#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "descriptor.hpp"
#include "host_session.hpp"

namespace salvage {

// Session and contract surface consumed by recovery and health checks.
class SessionProvider {
public:
    virtual ~SessionProvider() = default;
    // Hosts with an unexpired contract.
    virtual std::vector<std::string> hosts() = 0;
    virtual std::optional<ContractMeta> host_contract(const std::string& host_key) = 0;
    // Throws Error{NoContract} without a contract and Error{Transport} when
    // the host cannot be located. Failures reported by the host itself
    // surface from the session's RPCs.
    virtual std::unique_ptr<HostSession> new_session(const std::string& host_key,
                                                     const CancelToken& cancel) = 0;
    virtual void remove_host_contract(const std::string& host_key) = 0;
};

// On-disk contract cache, <dir>/contracts.json.
class ContractStore {
public:
    explicit ContractStore(std::string dir) : dir_(std::move(dir)) {}

    // A missing file is an empty cache. Contracts expiring at or before
    // current_height are dropped and the file rewritten. Throws Error{Io}.
    void load(uint64_t current_height);
    // Writes contracts.json.tmp and renames it over contracts.json.
    void save() const;

    std::string path() const;
    const std::string& renter_key() const { return renter_key_; }
    void set_renter_key(std::string key) { renter_key_ = std::move(key); }
    uint64_t height() const { return height_; }

    std::optional<ContractMeta> find(const std::string& host_key) const;
    void put(const ContractMeta& c);
    bool erase(const std::string& host_key);
    std::vector<ContractMeta> contracts() const;

private:
    std::string dir_;
    std::string renter_key_;
    uint64_t height_{0};
    std::map<std::string, ContractMeta> by_host_;
};

class HostDirectory {
public:
    virtual ~HostDirectory() = default;
    virtual std::vector<HostInfo> active_hosts() = 0;
    virtual std::optional<HostInfo> lookup(const std::string& host_key) = 0;
};

// Reads <dir>/hosts.json: [{"publicKey": ..., "netAddress": ...}].
class FileHostDirectory : public HostDirectory {
public:
    // Throws Error{Io} or Error{Config}.
    explicit FileHostDirectory(const std::string& path);
    std::vector<HostInfo> active_hosts() override;
    std::optional<HostInfo> lookup(const std::string& host_key) override;
private:
    std::map<std::string, HostInfo> hosts_;
};

class Renter : public SessionProvider {
public:
    Renter(ContractStore& store, HostDirectory& directory, SessionDialer& dialer)
        : store_(store), directory_(directory), dialer_(dialer) {}

    std::vector<std::string> hosts() override;
    std::optional<ContractMeta> host_contract(const std::string& host_key) override;
    std::unique_ptr<HostSession> new_session(const std::string& host_key,
                                             const CancelToken& cancel) override;
    void remove_host_contract(const std::string& host_key) override;

    // Hosts referenced by d that have no contract, sorted.
    std::vector<std::string> missing_contracts(const Descriptor& d);

private:
    std::mutex mtx_;
    ContractStore& store_;
    HostDirectory& directory_;
    SessionDialer& dialer_;
};

} // namespace salvage
