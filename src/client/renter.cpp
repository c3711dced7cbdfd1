
#include "renter.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <cstdio>
#include <fstream>
#include <set>

namespace salvage {

using nlohmann::json;

std::string ContractStore::path() const { return dir_ + "/contracts.json"; }

void ContractStore::load(uint64_t current_height) {
  height_ = current_height;
  by_host_.clear();
  std::ifstream in(path());
  if (!in)
    return;
  json j;
  try {
    in >> j;
  } catch (const json::exception &e) {
    throw Error(ErrorCode::Io,
                "failed to decode " + path() + ": " + std::string(e.what()));
  }
  renter_key_ = j.value("renterKey", std::string());
  size_t pruned = 0;
  auto it = j.find("contracts");
  if (it != j.end() && it->is_array()) {
    for (const auto &c : *it) {
      ContractMeta m;
      m.id = c.value("id", std::string());
      m.host_key = c.value("hostKey", std::string());
      m.expiration_height = c.value("expirationHeight", (uint64_t)0);
      if (m.host_key.empty())
        continue;
      if (m.expiration_height <= current_height) {
        pruned++;
        continue;
      }
      by_host_[m.host_key] = m;
    }
  }
  if (pruned > 0) {
    Logger::instance().log(LogLevel::INFO,
                           "pruned %zu expired contracts at height %llu",
                           pruned, (unsigned long long)current_height);
    save();
  }
}

void ContractStore::save() const {
  json j;
  j["renterKey"] = renter_key_;
  j["contracts"] = json::array();
  for (const auto &kv : by_host_) {
    j["contracts"].push_back({{"id", kv.second.id},
                              {"hostKey", kv.second.host_key},
                              {"expirationHeight",
                               kv.second.expiration_height}});
  }
  const std::string out = path();
  const std::string tmp = out + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    f << j.dump(2) << "\n";
    f.flush();
    if (!f)
      throw Error(ErrorCode::Io, "failed to write " + tmp);
  }
  if (std::rename(tmp.c_str(), out.c_str()) != 0)
    throw Error(ErrorCode::Io, "failed to rename " + tmp + " to " + out);
}

std::optional<ContractMeta>
ContractStore::find(const std::string &host_key) const {
  auto it = by_host_.find(host_key);
  if (it == by_host_.end() || it->second.expiration_height <= height_)
    return std::nullopt;
  return it->second;
}

void ContractStore::put(const ContractMeta &c) { by_host_[c.host_key] = c; }

bool ContractStore::erase(const std::string &host_key) {
  return by_host_.erase(host_key) > 0;
}

std::vector<ContractMeta> ContractStore::contracts() const {
  std::vector<ContractMeta> out;
  for (const auto &kv : by_host_)
    if (kv.second.expiration_height > height_)
      out.push_back(kv.second);
  return out;
}

FileHostDirectory::FileHostDirectory(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw Error(ErrorCode::Io, "failed to open " + path);
  json j;
  try {
    in >> j;
  } catch (const json::exception &e) {
    throw Error(ErrorCode::Config,
                "failed to decode " + path + ": " + std::string(e.what()));
  }
  if (!j.is_array())
    throw Error(ErrorCode::Config, path + " must hold an array of hosts");
  for (const auto &h : j) {
    HostInfo info;
    info.public_key = h.value("publicKey", std::string());
    info.net_address = h.value("netAddress", std::string());
    if (info.public_key.empty() || info.net_address.empty()) {
      Logger::instance().log(LogLevel::WARN,
                             "skipping incomplete host entry in %s",
                             path.c_str());
      continue;
    }
    hosts_[info.public_key] = info;
  }
}

std::vector<HostInfo> FileHostDirectory::active_hosts() {
  std::vector<HostInfo> out;
  out.reserve(hosts_.size());
  for (const auto &kv : hosts_)
    out.push_back(kv.second);
  return out;
}

std::optional<HostInfo>
FileHostDirectory::lookup(const std::string &host_key) {
  auto it = hosts_.find(host_key);
  if (it == hosts_.end())
    return std::nullopt;
  return it->second;
}

std::vector<std::string> Renter::hosts() {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<std::string> out;
  for (const auto &c : store_.contracts())
    out.push_back(c.host_key);
  return out;
}

std::optional<ContractMeta> Renter::host_contract(const std::string &host_key) {
  std::lock_guard<std::mutex> lk(mtx_);
  return store_.find(host_key);
}

std::unique_ptr<HostSession> Renter::new_session(const std::string &host_key,
                                                 const CancelToken &cancel) {
  std::optional<ContractMeta> contract;
  std::optional<HostInfo> host;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    contract = store_.find(host_key);
    if (!contract)
      throw Error(ErrorCode::NoContract, "no contract with " + host_key);
    host = directory_.lookup(host_key);
  }
  if (!host)
    throw Error(ErrorCode::Transport, "host " + host_key + " not in directory");
  return dialer_.dial(*host, *contract, cancel);
}

void Renter::remove_host_contract(const std::string &host_key) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!store_.erase(host_key))
    return;
  try {
    store_.save();
  } catch (const Error &e) {
    Logger::instance().log(LogLevel::WARN,
                           "failed to persist removal of %s: %s",
                           host_key.c_str(), e.what());
  }
}

std::vector<std::string> Renter::missing_contracts(const Descriptor &d) {
  std::set<std::string> referenced;
  for (const auto &chunk : d.chunks)
    for (const auto &slot : chunk.pieces)
      for (const auto &ref : slot)
        referenced.insert(ref.host_key);
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<std::string> out;
  for (const auto &key : referenced)
    if (!store_.find(key))
      out.push_back(key);
  return out;
}

} // namespace salvage
