
#include "error.hpp"
#include "logging.hpp"
#include "sector_host.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

using namespace salvage;

namespace {

// Splits path into zero-padded sectors and stores them, printing each root.
int import_file(DirSectorStore &store, const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    std::cerr << "cannot open " << path << std::endl;
    return 1;
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)),
                            std::istreambuf_iterator<char>());
  size_t count = 0;
  for (size_t off = 0; off < data.size() || count == 0; off += kSectorSize) {
    size_t n = std::min<size_t>(kSectorSize, data.size() - off);
    std::vector<uint8_t> sector(kSectorSize, 0);
    std::copy(data.begin() + off, data.begin() + off + n, sector.begin());
    std::cout << hash_to_hex(store.put(sector)) << "\n";
    count++;
  }
  Logger::instance().log(LogLevel::INFO, "imported %zu sectors from %s", count,
                         path.c_str());
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:9982";
  int threads = std::max(2u, std::thread::hardware_concurrency());
  std::string key_hex;
  std::string import_path;
  HostdConfig cfg;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    try {
      if (a == "--listen")
        listen = next(i);
      else if (a == "--threads")
        threads = std::stoi(next(i));
      else if (a == "--key")
        key_hex = next(i);
      else if (a == "--sectors")
        cfg.sectors_dir = next(i);
      else if (a == "--import")
        import_path = next(i);
      else if (a == "--contract")
        cfg.contracts.insert(next(i));
      else if (a == "--base-price")
        cfg.settings.base_rpc_price = std::stoull(next(i));
      else if (a == "--sector-access-price")
        cfg.settings.sector_access_price = std::stoull(next(i));
      else if (a == "--download-price")
        cfg.settings.download_bandwidth_price = std::stoull(next(i));
      else if (a == "--log-level") {
        LogLevel lvl;
        std::string v = next(i);
        if (!parse_log_level(v, lvl)) {
          std::cerr << "bad log level " << v << "\n";
          return 1;
        }
        Logger::instance().set_level(lvl);
      }
    } catch (const std::logic_error &) {
      std::cerr << "bad value for " << a << "\n";
      return 1;
    }
  }

  std::string host;
  uint16_t port;
  if (!parse_host_port(listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  if (cfg.sectors_dir.empty()) {
    std::cerr << "--sectors is required" << std::endl;
    return 1;
  }

  cfg.listen_host = host;
  cfg.listen_port = port;
  cfg.threads = std::max(1, threads);
  cfg.key = hex_to_bytes(key_hex);
  if (cfg.key.empty())
    cfg.key = hex_to_bytes(
        "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff");

  try {
    DirSectorStore store(cfg.sectors_dir);
    if (!import_path.empty())
      return import_file(store, import_path);
    asio::io_context io;
    SectorHost sh(io, cfg, store);
    sh.start();
    Logger::instance().log(LogLevel::INFO, "%zu contracts, %d threads",
                           cfg.contracts.size(), cfg.threads);

    std::vector<std::thread> th;
    th.reserve(cfg.threads);
    for (int i = 0; i < cfg.threads; i++)
      th.emplace_back([&]() { io.run(); });
    for (auto &t : th)
      t.join();
  } catch (const Error &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  }
  return 0;
}
