
#include "recovery.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include "fec.hpp"
#include "logging.hpp"
#include "sector_client.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace salvage {

namespace fs = std::filesystem;

SectorData SectorCache::get(const Hash256 &root) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = sectors_.find(root);
  if (it == sectors_.end())
    return nullptr;
  return it->second;
}

SectorData SectorCache::put(const Hash256 &root, std::vector<uint8_t> data) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = sectors_.find(root);
  if (it != sectors_.end())
    return it->second;
  SectorData d = std::make_shared<const std::vector<uint8_t>>(std::move(data));
  sectors_.emplace(root, d);
  return d;
}

size_t SectorCache::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sectors_.size();
}

namespace {

std::unique_ptr<CipherKey> master_key(const Descriptor &d) {
  CipherType type;
  if (!parse_cipher_type(d.master_key_type, type))
    throw Error(ErrorCode::UnsupportedCipher,
                "unknown master key type: " + d.master_key_type);
  return make_cipher_key(type, d.master_key);
}

std::vector<uint8_t> decrypt_piece(const CipherKey &master,
                                   const std::vector<uint8_t> &sector,
                                   uint64_t piece_size, size_t chunk_idx,
                                   size_t piece_idx) {
  std::vector<uint8_t> piece(sector.begin(),
                             sector.begin() +
                                 std::min<uint64_t>(piece_size, sector.size()));
  master.derive(chunk_idx, piece_idx)->decrypt(piece, 0);
  return piece;
}

} // namespace

Recoverer::Recoverer(SessionProvider &provider, RecoveryConfig cfg)
    : provider_(provider), cfg_(cfg) {}

SectorStatus Recoverer::fetch_from(const std::string &host_key,
                                   const Hash256 &root,
                                   const CancelToken &cancel,
                                   SectorData &out) {
  std::unique_ptr<HostSession> session;
  try {
    session = provider_.new_session(host_key, cancel);
  } catch (const Error &e) {
    Logger::instance().log(LogLevel::DEBUG, "no session with %s: %s",
                           host_key.c_str(), e.what());
    return SectorStatus::TransportError;
  }
  network_fetches_++;
  SectorResult r = read_sector(*session, root, cancel);
  session->close();

  const std::string hex = hash_to_hex(root);
  switch (r.status) {
  case SectorStatus::Ok:
    out = cache_.put(root, std::move(r.data));
    Logger::instance().log(LogLevel::INFO, "recovered sector %s from host %s",
                           hex.c_str(), host_key.c_str());
    break;
  case SectorStatus::NotFound:
    Logger::instance().log(LogLevel::DEBUG, "host %s does not have sector %s",
                           host_key.c_str(), hex.c_str());
    break;
  case SectorStatus::ContractMissing:
    provider_.remove_host_contract(host_key);
    hosts_removed_++;
    Logger::instance().log(LogLevel::WARN,
                           "removed host %s from available hosts: contract "
                           "not found, form a new contract",
                           host_key.c_str());
    break;
  default:
    Logger::instance().log(cancel.cancelled() ? LogLevel::DEBUG
                                              : LogLevel::WARN,
                           "failed to download sector %s from host %s: %s",
                           hex.c_str(), host_key.c_str(), r.detail.c_str());
    break;
  }
  return r.status;
}

SectorData Recoverer::fetch(const Hash256 &root, const std::string &host_key) {
  SectorData data = cache_.get(root);
  if (data) {
    cache_hits_++;
    Logger::instance().log(LogLevel::DEBUG, "sector %s already in cache",
                           hash_to_hex(root).c_str());
    return data;
  }
  if (!provider_.host_contract(host_key)) {
    Logger::instance().log(LogLevel::DEBUG, "skipping %s: no contract",
                           host_key.c_str());
    return nullptr;
  }
  fetch_from(host_key, root, cancel_, data);
  return data;
}

SectorData Recoverer::race(const Hash256 &root) {
  SectorData data = cache_.get(root);
  if (data) {
    cache_hits_++;
    return data;
  }
  races_++;
  const std::vector<std::string> hosts = provider_.hosts();
  Logger::instance().log(LogLevel::INFO, "checking %zu hosts for sector %s",
                         hosts.size(), hash_to_hex(root).c_str());

  CancelToken won = cancel_.child();
  std::mutex mtx;
  parallel_for(hosts.size(), cfg_.workers, won, [&](size_t i) {
    SectorData got;
    if (fetch_from(hosts[i], root, won, got) != SectorStatus::Ok)
      return;
    std::lock_guard<std::mutex> lk(mtx);
    if (!data)
      data = got;
    won.cancel();
  });
  return data;
}

RecoveryReport Recoverer::recover(const Descriptor &d, std::ostream &out) {
  auto coder = make_erasure_coder(d.encoder_type, d.data_pieces,
                                  d.parity_pieces);
  auto master = master_key(d);
  const size_t k = (size_t)coder->min_pieces();
  const size_t n = (size_t)coder->num_pieces();
  const uint64_t fetches_before = network_fetches_, hits_before = cache_hits_,
                 races_before = races_, removed_before = hosts_removed_;

  RecoveryReport report;
  report.chunks_total = d.chunks.size();
  for (size_t ci = 0; ci < d.chunks.size(); ci++) {
    const Chunk &chunk = d.chunks[ci];
    std::vector<std::vector<uint8_t>> pieces(n);
    std::vector<size_t> missing;
    size_t recovered = 0;

    for (size_t pi = 0; pi < chunk.pieces.size() && pi < n && recovered < k;
         pi++) {
      const auto &refs = chunk.pieces[pi];
      if (refs.empty())
        continue;
      SectorData data;
      for (const auto &ref : refs) {
        data = fetch(ref.merkle_root, ref.host_key);
        if (data)
          break;
      }
      if (!data) {
        Logger::instance().log(LogLevel::INFO,
                               "failed to recover piece %zu for chunk %zu",
                               pi + 1, ci + 1);
        missing.push_back(pi);
        continue;
      }
      pieces[pi] = decrypt_piece(*master, *data, d.piece_size, ci, pi);
      recovered++;
      Logger::instance().log(LogLevel::INFO,
                             "recovered piece %zu for chunk %zu (%zu/%zu)",
                             pi + 1, ci + 1, recovered, k);
    }

    if (recovered < k && !missing.empty()) {
      Logger::instance().log(LogLevel::INFO,
                             "checking for missing pieces, need %zu more",
                             k - recovered);
      for (size_t pi : missing) {
        if (recovered >= k || cancel_.cancelled())
          break;
        SectorData data = race(chunk.pieces[pi].front().merkle_root);
        if (!data)
          continue;
        pieces[pi] = decrypt_piece(*master, *data, d.piece_size, ci, pi);
        recovered++;
        Logger::instance().log(LogLevel::INFO,
                               "recovered piece %zu for chunk %zu (%zu/%zu)",
                               pi + 1, ci + 1, recovered, k);
      }
    }

    if (recovered < k) {
      Logger::instance().log(LogLevel::ERROR,
                             "chunk %zu is not recoverable: %zu of %zu pieces",
                             ci + 1, recovered, k);
      report.recoverable = false;
      report.failed_chunk = ci;
      break;
    }
    const uint64_t len = d.chunk_length(ci);
    coder->recover(std::move(pieces), len, out);
    report.bytes_written += len;
    report.chunks_recovered++;
    Logger::instance().log(LogLevel::INFO, "recovered chunk %zu/%zu", ci + 1,
                           d.chunks.size());
  }

  report.network_fetches = network_fetches_ - fetches_before;
  report.cache_hits = cache_hits_ - hits_before;
  report.races = races_ - races_before;
  report.hosts_removed = hosts_removed_ - removed_before;
  return report;
}

RecoveryReport Recoverer::recover_file(const Descriptor &d,
                                       const std::string &path) {
  const std::string partial = path + ".partial";
  std::error_code ec;
  RecoveryReport report;
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out)
      throw Error(ErrorCode::Io, "failed to create " + partial);
    try {
      report = recover(d, out);
      out.flush();
      if (!out)
        throw Error(ErrorCode::Io, "failed to write " + partial);
    } catch (const std::exception &) {
      out.close();
      fs::remove(partial, ec);
      throw;
    }
  }
  if (!report.recoverable) {
    fs::remove(partial, ec);
    return report;
  }
  fs::rename(partial, path, ec);
  if (ec) {
    const std::string why = ec.message();
    fs::remove(partial, ec);
    throw Error(ErrorCode::Io, "failed to move output to " + path + ": " + why);
  }
  return report;
}

} // namespace salvage
