
#include "host_session.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>
#include <sodium.h>

namespace salvage {

namespace {
// granularity of deadline and cancel checks
constexpr std::chrono::milliseconds kSlice{50};
} // namespace

TcpHostSession::TcpHostSession(const HostInfo &host,
                               const ContractMeta &contract,
                               const TransportConfig &cfg)
    : sock_(io_), host_(host), contract_(contract), cfg_(cfg) {
  aead_.set_key(cfg_.key);
  randombytes_buf(&session_id_, sizeof(session_id_));
}

TcpHostSession::~TcpHostSession() { close(); }

void TcpHostSession::close() {
  std::error_code ec;
  sock_.close(ec);
  if (broken_.ok())
    broken_ = RpcStatus::transport("session closed");
}

RpcStatus TcpHostSession::fail(RpcStatus st) {
  std::error_code ec;
  sock_.close(ec);
  broken_ = st;
  return st;
}

RpcStatus TcpHostSession::run(std::chrono::milliseconds timeout,
                              const CancelToken &cancel, const bool &done) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  RpcStatus st;
  io_.restart();
  while (!done) {
    auto now = std::chrono::steady_clock::now();
    if (cancel.cancelled()) {
      st = RpcStatus::cancelled();
      break;
    }
    if (now >= deadline) {
      st = RpcStatus::timeout("deadline exceeded after " +
                              std::to_string(timeout.count()) + "ms");
      break;
    }
    auto slice = std::min<std::chrono::steady_clock::duration>(
        kSlice, deadline - now);
    io_.run_for(slice);
  }
  if (!st.ok()) {
    // pending handlers reference the caller's frame; let them finish
    std::error_code ec;
    sock_.close(ec);
    io_.restart();
    io_.run();
    broken_ = st;
  }
  return st;
}

RpcStatus TcpHostSession::exchange(FrameType type, std::vector<uint8_t> payload,
                                   std::vector<uint8_t> &reply,
                                   std::chrono::milliseconds timeout,
                                   const CancelToken &cancel) {
  if (!broken_.ok())
    return broken_;
  const uint64_t rid = next_request_++;
  if (!aead_.encrypt(session_id_, rid, (uint8_t)Direction::Request, payload))
    return fail(RpcStatus::transport("failed to seal request"));
  FrameHeader hdr = make_header(type, Direction::Request, session_id_, rid,
                                (uint32_t)payload.size());
  std::vector<uint8_t> out(sizeof(FrameHeader) + payload.size());
  std::memcpy(out.data(), &hdr, sizeof(FrameHeader));
  std::memcpy(out.data() + sizeof(FrameHeader), payload.data(), payload.size());

  FrameHeader in{};
  std::vector<uint8_t> body;
  std::error_code err;
  bool bad_header = false;
  bool done = false;
  asio::async_write(sock_, asio::buffer(out), [&](std::error_code ec,
                                                  std::size_t) {
    if (ec) {
      err = ec;
      done = true;
      return;
    }
    asio::async_read(
        sock_, asio::buffer(&in, sizeof(in)),
        [&](std::error_code ec, std::size_t) {
          if (ec || !header_valid(in)) {
            err = ec;
            bad_header = !ec;
            done = true;
            return;
          }
          body.resize(in.payload_len);
          asio::async_read(sock_, asio::buffer(body),
                           [&](std::error_code ec, std::size_t) {
                             err = ec;
                             done = true;
                           });
        });
  });
  RpcStatus st = run(timeout, cancel, done);
  if (!st.ok())
    return st;
  if (err)
    return fail(RpcStatus::transport(err.message()));
  if (bad_header)
    return fail(RpcStatus::transport("invalid frame header"));
  if (in.session_id != session_id_ || in.request_id != rid ||
      in.direction != (uint8_t)Direction::Response)
    return fail(RpcStatus::transport("response does not match request"));
  if (!aead_.decrypt(session_id_, rid, (uint8_t)Direction::Response, body))
    return fail(RpcStatus::transport("frame authentication failed"));
  if (in.type == (uint8_t)FrameType::ERROR)
    return RpcStatus::host_error(std::string(body.begin(), body.end()));
  if (in.type != (uint8_t)FrameType::RESPONSE)
    return fail(RpcStatus::transport("unexpected frame type " +
                                     std::to_string(in.type)));
  reply.swap(body);
  return RpcStatus::success();
}

namespace {

struct Lookup {
  std::mutex mtx;
  std::condition_variable cv;
  bool done{false};
  std::error_code ec;
  asio::ip::tcp::resolver::results_type results;
};

} // namespace

// getaddrinfo cannot be interrupted, so the lookup runs on its own thread and
// is abandoned at the deadline.
RpcStatus TcpHostSession::resolve(
    const std::string &host, uint16_t port,
    std::chrono::steady_clock::time_point deadline, const CancelToken &cancel,
    tcp::resolver::results_type &out) {
  auto lookup = std::make_shared<Lookup>();
  std::thread([lookup, host, port]() {
    asio::io_context io;
    tcp::resolver res(io);
    std::error_code ec;
    auto results = res.resolve(host, std::to_string(port), ec);
    std::lock_guard<std::mutex> lk(lookup->mtx);
    lookup->ec = ec;
    lookup->results = results;
    lookup->done = true;
    lookup->cv.notify_all();
  }).detach();

  std::unique_lock<std::mutex> lk(lookup->mtx);
  while (!lookup->done) {
    if (cancel.cancelled())
      return RpcStatus::cancelled();
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return RpcStatus::timeout("resolve " + host + ": deadline exceeded");
    lookup->cv.wait_for(
        lk, std::min<std::chrono::steady_clock::duration>(kSlice,
                                                          deadline - now));
  }
  if (lookup->ec)
    return RpcStatus::transport("resolve " + host + ": " +
                                lookup->ec.message());
  out = lookup->results;
  return RpcStatus::success();
}

RpcStatus TcpHostSession::open(const CancelToken &cancel) {
  std::string host;
  uint16_t port;
  if (!parse_host_port(host_.net_address, host, port))
    return fail(
        RpcStatus::transport("bad host address: " + host_.net_address));
  // resolve and connect share the dial deadline
  const auto deadline = std::chrono::steady_clock::now() + cfg_.dial_timeout;
  tcp::resolver::results_type results;
  RpcStatus st = resolve(host, port, deadline, cancel, results);
  if (!st.ok())
    return fail(st);
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0)
    return fail(RpcStatus::timeout("dial deadline exceeded"));

  std::error_code err;
  bool done = false;
  asio::async_connect(sock_, results,
                      [&](std::error_code e, const tcp::endpoint &) {
                        err = e;
                        done = true;
                      });
  st = run(left, cancel, done);
  if (!st.ok())
    return st;
  if (err)
    return fail(RpcStatus::transport("dial: " + err.message()));
  std::error_code ec;
  sock_.set_option(tcp::no_delay(true), ec);

  std::vector<uint8_t> id(contract_.id.begin(), contract_.id.end());
  std::vector<uint8_t> reply;
  st = exchange(FrameType::OPEN, std::move(id), reply, cfg_.dial_timeout,
                cancel);
  if (!st.ok())
    broken_ = st;
  return st;
}

RpcStatus TcpHostSession::rpc_settings(HostSettings &out,
                                       const CancelToken &cancel) {
  std::vector<uint8_t> reply;
  RpcStatus st = exchange(FrameType::SETTINGS, {}, reply,
                          cfg_.settings_timeout, cancel);
  if (!st.ok())
    return st;
  if (!decode_settings(reply, out))
    return fail(RpcStatus::transport("malformed settings response"));
  return st;
}

RpcStatus TcpHostSession::rpc_read(const ReadSection &section, uint64_t cost,
                                   std::vector<uint8_t> &out,
                                   const CancelToken &cancel) {
  return exchange(FrameType::READ, encode_read_request(section, cost), out,
                  cfg_.read_timeout, cancel);
}

std::unique_ptr<HostSession>
TcpSessionDialer::dial(const HostInfo &host, const ContractMeta &contract,
                       const CancelToken &cancel) {
  std::unique_ptr<TcpHostSession> s(
      new TcpHostSession(host, contract, cfg_));
  RpcStatus st = s->open(cancel);
  if (!st.ok())
    Logger::instance().log(LogLevel::DEBUG, "open %s (%s) failed: %s",
                           host.public_key.c_str(), host.net_address.c_str(),
                           st.message.c_str());
  return std::unique_ptr<HostSession>(std::move(s));
}

} // namespace salvage
