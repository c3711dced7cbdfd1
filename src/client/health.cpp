
#include "health.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "sector_client.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <map>
#include <mutex>

namespace salvage {

using nlohmann::json;

json health_to_json(const FileHealth &h) {
  json chunks = json::array();
  for (const auto &c : h.chunks) {
    json pieces = json::array();
    for (const auto &slot : c.pieces) {
      json refs = json::array();
      for (const auto &p : slot)
        refs.push_back(
            {{"merkleRoot", hash_to_hex(p.merkle_root)}, {"hosts", p.hosts}});
      pieces.push_back(refs);
    }
    chunks.push_back({{"minPieces", c.min_pieces},
                      {"availablePieces", c.available_pieces},
                      {"pieces", pieces}});
  }
  return json{{"chunks", chunks}, {"recoverable", h.recoverable}};
}

FileHealth HealthChecker::check(const Descriptor &d) {
  std::vector<Hash256> roots;
  {
    std::map<Hash256, bool> seen;
    for (const auto &chunk : d.chunks)
      for (const auto &slot : chunk.pieces)
        for (const auto &ref : slot)
          if (seen.emplace(ref.merkle_root, true).second)
            roots.push_back(ref.merkle_root);
  }
  const std::vector<std::string> hosts = provider_.hosts();
  Logger::instance().log(LogLevel::INFO,
                         "checking %zu sectors on %zu hosts", roots.size(),
                         hosts.size());

  std::mutex mtx;
  std::map<Hash256, std::vector<std::string>> availability;
  CancelToken cancel;
  // one session per host, every root checked through it
  parallel_for(hosts.size(), cfg_.workers, cancel, [&](size_t i) {
    const std::string &host = hosts[i];
    std::unique_ptr<HostSession> session;
    try {
      session = provider_.new_session(host, cancel);
    } catch (const Error &e) {
      Logger::instance().log(LogLevel::WARN, "failed to check sectors on %s: %s",
                             host.c_str(), e.what());
      return;
    }
    for (const auto &root : roots) {
      checks_++;
      SectorResult r = check_sector(*session, root, cancel,
                                    cfg_.health_full_verify);
      if (r.ok()) {
        std::lock_guard<std::mutex> lk(mtx);
        availability[root].push_back(host);
        continue;
      }
      if (r.status == SectorStatus::NotFound)
        continue;
      if (r.status == SectorStatus::ContractMissing) {
        provider_.remove_host_contract(host);
        hosts_removed_++;
        Logger::instance().log(LogLevel::WARN,
                               "removed host %s from available hosts: "
                               "contract not found, form a new contract",
                               host.c_str());
      } else {
        Logger::instance().log(LogLevel::WARN,
                               "failed to check sectors on %s: %s",
                               host.c_str(), r.detail.c_str());
      }
      break;
    }
    session->close();
  });
  for (auto &kv : availability)
    std::sort(kv.second.begin(), kv.second.end());

  FileHealth health;
  health.recoverable = true;
  for (const auto &chunk : d.chunks) {
    ChunkHealth ch;
    ch.min_pieces = d.data_pieces;
    for (const auto &slot : chunk.pieces) {
      std::vector<PieceHealth> refs;
      bool available = false;
      for (const auto &ref : slot) {
        PieceHealth p;
        p.merkle_root = ref.merkle_root;
        auto it = availability.find(ref.merkle_root);
        if (it != availability.end())
          p.hosts = it->second;
        available = available || !p.hosts.empty();
        refs.push_back(std::move(p));
      }
      if (available)
        ch.available_pieces++;
      ch.pieces.push_back(std::move(refs));
    }
    if (ch.available_pieces < ch.min_pieces)
      health.recoverable = false;
    health.chunks.push_back(std::move(ch));
  }
  Logger::instance().log(LogLevel::INFO, "file is %s",
                         health.recoverable ? "recoverable"
                                            : "not recoverable");
  return health;
}

} // namespace salvage
