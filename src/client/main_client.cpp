
#include "descriptor.hpp"
#include "error.hpp"
#include "health.hpp"
#include "host_session.hpp"
#include "logging.hpp"
#include "recovery.hpp"
#include "renter.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace salvage;

namespace {

const char *kDefaultKey =
    "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";

struct Options {
  std::string command;
  std::vector<std::string> args;
  std::string dir = ".";
  std::string input;
  std::string output;
  uint64_t height = 0;
  RecoveryConfig recovery;
  TransportConfig transport;
};

void usage() {
  std::cerr
      << "usage: salvage <command> [options]\n"
         "  extract <siafile> [-o out.json]   print the file topology as JSON\n"
         "  recover -i <descriptor> -o <out>  rebuild a file from its hosts\n"
         "  check <descriptor>                write <dir>/<name>.health.json\n"
         "  contracts                         list cached contracts\n"
         "options:\n"
         "  --dir <path>            contracts.json and hosts.json (default .)\n"
         "  --workers <n>           concurrent sessions per race (default 100)\n"
         "  --height <n>            current block height for contract expiry\n"
         "  --transport-key <hex>   32-byte host transport key\n"
         "  --dial-timeout <sec>    --read-timeout <sec>\n"
         "  --quick-check           check reads one segment without verifying roots\n"
         "  --log-level <level>     trace, debug, info, warn, error\n";
}

// Logs hosts referenced by d that have no contract.
void report_missing(Renter &renter, HostDirectory &hosts, const Descriptor &d) {
  auto missing = renter.missing_contracts(d);
  if (missing.empty())
    return;
  Logger::instance().log(LogLevel::WARN,
                         "missing contracts for %zu hosts listed in the file:",
                         missing.size());
  for (const auto &key : missing) {
    auto info = hosts.lookup(key);
    Logger::instance().log(LogLevel::WARN, " - %s %s", key.c_str(),
                           info ? info->net_address.c_str() : "(unknown)");
  }
}

int cmd_extract(const Options &o) {
  std::string in = o.input.empty() && !o.args.empty() ? o.args[0] : o.input;
  if (in.empty()) {
    usage();
    return 1;
  }
  Descriptor d = decode_descriptor(read_file(in));
  std::string text = descriptor_to_json(d).dump(2);
  if (o.output.empty()) {
    std::cout << text << std::endl;
    return 0;
  }
  std::ofstream out(o.output, std::ios::trunc);
  out << text << "\n";
  out.flush();
  if (!out)
    throw Error(ErrorCode::Io, "failed to write " + o.output);
  Logger::instance().log(LogLevel::INFO, "wrote %zu chunks to %s",
                         d.chunks.size(), o.output.c_str());
  return 0;
}

int cmd_contracts(const Options &o) {
  ContractStore store(o.dir);
  store.load(o.height);
  auto contracts = store.contracts();
  std::cout << "Host Key\tContract ID\tExpiration Height\n";
  for (const auto &c : contracts)
    std::cout << c.host_key << "\t" << c.id << "\t" << c.expiration_height
              << "\n";
  Logger::instance().log(LogLevel::INFO, "%zu contracts", contracts.size());
  return 0;
}

int cmd_recover(const Options &o) {
  if (o.input.empty() || o.output.empty()) {
    usage();
    Logger::instance().log(LogLevel::ERROR, "flags -i and -o are required");
    return 1;
  }
  Descriptor d = load_descriptor(o.input);
  ContractStore store(o.dir);
  store.load(o.height);
  FileHostDirectory hosts(o.dir + "/hosts.json");
  TcpSessionDialer dialer(o.transport);
  Renter renter(store, hosts, dialer);
  report_missing(renter, hosts, d);
  if (renter.hosts().empty()) {
    Logger::instance().log(LogLevel::ERROR, "no hosts available");
    return 1;
  }

  Recoverer rec(renter, o.recovery);
  RecoveryReport r = rec.recover_file(d, o.output);
  Logger::instance().log(
      LogLevel::INFO,
      "%zu/%zu chunks, %llu bytes, %llu fetches, %llu cache hits, %llu races, "
      "%llu hosts removed",
      r.chunks_recovered, r.chunks_total, (unsigned long long)r.bytes_written,
      (unsigned long long)r.network_fetches, (unsigned long long)r.cache_hits,
      (unsigned long long)r.races, (unsigned long long)r.hosts_removed);
  if (!r.recoverable) {
    Logger::instance().log(LogLevel::ERROR,
                           "file is not recoverable: chunk %zu lacks pieces",
                           *r.failed_chunk + 1);
    return 2;
  }
  Logger::instance().log(LogLevel::INFO, "recovered %s", o.output.c_str());
  return 0;
}

int cmd_check(const Options &o) {
  std::string in = o.input.empty() && !o.args.empty() ? o.args[0] : o.input;
  if (in.empty()) {
    usage();
    return 1;
  }
  Descriptor d = load_descriptor(in);
  ContractStore store(o.dir);
  store.load(o.height);
  FileHostDirectory hosts(o.dir + "/hosts.json");
  TcpSessionDialer dialer(o.transport);
  Renter renter(store, hosts, dialer);
  report_missing(renter, hosts, d);
  if (renter.hosts().empty()) {
    Logger::instance().log(LogLevel::ERROR, "no hosts available");
    return 1;
  }

  HealthChecker checker(renter, o.recovery);
  FileHealth health = checker.check(d);
  std::string path =
      o.dir + "/" + std::filesystem::path(in).filename().string() +
      ".health.json";
  std::ofstream out(path, std::ios::trunc);
  out << health_to_json(health).dump(2) << "\n";
  out.flush();
  if (!out)
    throw Error(ErrorCode::Io, "failed to write " + path);
  Logger::instance().log(LogLevel::INFO, "health report written to %s",
                         path.c_str());
  return health.recoverable ? 0 : 2;
}

} // namespace

int main(int argc, char **argv) {
  Options o;
  std::string key_hex = kDefaultKey;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    try {
      if (a == "--dir")
        o.dir = next(i);
      else if (a == "-i")
        o.input = next(i);
      else if (a == "-o")
        o.output = next(i);
      else if (a == "--workers")
        o.recovery.workers = (size_t)std::stoul(next(i));
      else if (a == "--height")
        o.height = std::stoull(next(i));
      else if (a == "--transport-key")
        key_hex = next(i);
      else if (a == "--dial-timeout")
        o.transport.dial_timeout = o.transport.settings_timeout =
            std::chrono::seconds(std::stoul(next(i)));
      else if (a == "--read-timeout")
        o.transport.read_timeout = std::chrono::seconds(std::stoul(next(i)));
      else if (a == "--quick-check")
        o.recovery.health_full_verify = false;
      else if (a == "--log-level") {
        LogLevel lvl;
        std::string v = next(i);
        if (!parse_log_level(v, lvl)) {
          std::cerr << "bad log level " << v << "\n";
          return 1;
        }
        Logger::instance().set_level(lvl);
      } else if (a == "-h" || a == "--help") {
        usage();
        return 0;
      } else if (o.command.empty())
        o.command = a;
      else
        o.args.push_back(a);
    } catch (const std::logic_error &) {
      std::cerr << "bad value for " << a << "\n";
      return 1;
    }
  }
  if (o.recovery.workers == 0)
    o.recovery.workers = 1;
  o.transport.key = hex_to_bytes(key_hex);
  if (o.transport.key.size() != 32) {
    std::cerr << "transport key must be 32 bytes of hex" << std::endl;
    return 1;
  }

  try {
    if (o.command == "extract")
      return cmd_extract(o);
    if (o.command == "recover")
      return cmd_recover(o);
    if (o.command == "check")
      return cmd_check(o);
    if (o.command == "contracts")
      return cmd_contracts(o);
  } catch (const Error &e) {
    Logger::instance().log(LogLevel::ERROR, "%s: %s",
                           error_code_name(e.code()), e.what());
    return 1;
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  }
  usage();
  return 1;
}
