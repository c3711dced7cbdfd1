
#include "sector_host.hpp"
#include "logging.hpp"
#include <cstring>

namespace salvage {

SectorHost::SectorHost(asio::io_context &io, const HostdConfig &cfg,
                       SectorStore &store)
    : io_(io), cfg_(cfg), store_(store), acceptor_(io) {
  aead_.set_key(cfg_.key);
}

void SectorHost::start() {
  asio::ip::tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host),
                             cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  port_ = acceptor_.local_endpoint().port();
  Logger::instance().log(LogLevel::INFO, "serving sectors on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)port_);
  do_accept();
}

void SectorHost::stop() {
  asio::post(io_, [this]() {
    std::error_code ec;
    acceptor_.close(ec);
  });
}

void SectorHost::do_accept() {
  auto c = std::make_shared<Conn>(io_);
  acceptor_.async_accept(c->sock, [this, c](std::error_code ec) {
    if (ec == asio::error::operation_aborted)
      return;
    if (!ec) {
      Logger::instance().log(LogLevel::DEBUG, "accepted connection");
      asio::dispatch(c->strand, [this, c]() { do_read(c); });
    }
    do_accept();
  });
}

void SectorHost::do_read(std::shared_ptr<Conn> c) {
  c->sock.async_read_some(
      asio::buffer(c->read_buf),
      asio::bind_executor(c->strand, [this, c](std::error_code ec,
                                               std::size_t n) {
        if (ec)
          return;
        parse_and_handle(c, c->read_buf.data(), n);
        if (c->sock.is_open())
          do_read(c);
      }));
}

void SectorHost::parse_and_handle(std::shared_ptr<Conn> c, const uint8_t *data,
                                  size_t n) {
  c->inbuf.insert(c->inbuf.end(), data, data + n);
  size_t off = 0;
  while (c->inbuf.size() - off >= sizeof(FrameHeader)) {
    FrameHeader hdr;
    std::memcpy(&hdr, c->inbuf.data() + off, sizeof(hdr));
    if (!header_valid(hdr) ||
        hdr.direction != static_cast<uint8_t>(Direction::Request)) {
      Logger::instance().log(LogLevel::WARN,
                             "invalid frame header, closing connection");
      std::error_code ec;
      c->sock.close(ec);
      return;
    }
    size_t need = sizeof(FrameHeader) + hdr.payload_len;
    if (c->inbuf.size() - off < need)
      break;
    std::vector<uint8_t> payload(c->inbuf.begin() + off + sizeof(FrameHeader),
                                 c->inbuf.begin() + off + need);
    off += need;
    if (!aead_.decrypt(hdr.session_id, hdr.request_id, hdr.direction,
                       payload)) {
      Logger::instance().log(LogLevel::WARN, "decrypt failed session=%llu",
                             (unsigned long long)hdr.session_id);
      std::error_code ec;
      c->sock.close(ec);
      return;
    }
    handle_frame(c, hdr, std::move(payload));
  }
  if (off > 0)
    c->inbuf.erase(c->inbuf.begin(), c->inbuf.begin() + off);
}

void SectorHost::do_write(std::shared_ptr<Conn> c) {
  if (c->write_q.empty())
    return;
  auto &front = c->write_q.front();
  asio::async_write(c->sock, asio::buffer(front),
                    asio::bind_executor(c->strand, [this, c](std::error_code ec,
                                                             std::size_t) {
                      if (ec)
                        return;
                      c->write_q.pop_front();
                      if (!c->write_q.empty())
                        do_write(c);
                    }));
}

void SectorHost::send_via(std::shared_ptr<Conn> c, Frame &&f) {
  std::vector<uint8_t> buf(sizeof(FrameHeader) + f.payload.size());
  std::memcpy(buf.data(), &f.hdr, sizeof(FrameHeader));
  if (!f.payload.empty())
    std::memcpy(buf.data() + sizeof(FrameHeader), f.payload.data(),
                f.payload.size());
  c->write_q.emplace_back(std::move(buf));
  if (c->write_q.size() == 1)
    do_write(c);
}

void SectorHost::reply(std::shared_ptr<Conn> c, const FrameHeader &req,
                       FrameType type, std::vector<uint8_t> payload) {
  if (!aead_.encrypt(req.session_id, req.request_id,
                     static_cast<uint8_t>(Direction::Response), payload)) {
    Logger::instance().log(LogLevel::ERROR, "failed to seal response");
    return;
  }
  Frame f;
  f.hdr = make_header(type, Direction::Response, req.session_id,
                      req.request_id, (uint32_t)payload.size());
  f.payload = std::move(payload);
  send_via(c, std::move(f));
}

void SectorHost::reply_error(std::shared_ptr<Conn> c, const FrameHeader &req,
                             const std::string &msg) {
  reply(c, req, FrameType::ERROR, std::vector<uint8_t>(msg.begin(), msg.end()));
}

void SectorHost::handle_frame(std::shared_ptr<Conn> c, const FrameHeader &hdr,
                              std::vector<uint8_t> &&payload) {
  switch (static_cast<FrameType>(hdr.type)) {
  case FrameType::OPEN: {
    std::string id(payload.begin(), payload.end());
    if (cfg_.contracts.count(id) == 0) {
      Logger::instance().log(LogLevel::INFO, "OPEN with unknown contract %s",
                             id.c_str());
      reply_error(c, hdr, kErrNoContract);
      return;
    }
    c->opened = true;
    reply(c, hdr, FrameType::RESPONSE, {});
    return;
  }
  case FrameType::SETTINGS:
    if (!c->opened) {
      reply_error(c, hdr, kErrNoContract);
      return;
    }
    reply(c, hdr, FrameType::RESPONSE, encode_settings(cfg_.settings));
    return;
  case FrameType::READ: {
    ReadSection section;
    uint64_t cost = 0;
    if (!c->opened) {
      reply_error(c, hdr, kErrNoContract);
      return;
    }
    if (!decode_read_request(payload, section, cost)) {
      reply_error(c, hdr, "malformed read request");
      return;
    }
    if (cost < read_cost(cfg_.settings, section)) {
      reply_error(c, hdr, "insufficient payment for read");
      return;
    }
    std::vector<uint8_t> sector;
    if (!store_.get(section.merkle_root, sector)) {
      reply_error(c, hdr, kErrSectorNotFound);
      return;
    }
    if (section.offset > sector.size() ||
        section.length > sector.size() - section.offset) {
      reply_error(c, hdr, "requested section is out of bounds");
      return;
    }
    reads_served_++;
    reply(c, hdr, FrameType::RESPONSE,
          std::vector<uint8_t>(sector.begin() + section.offset,
                               sector.begin() + section.offset +
                                   section.length));
    return;
  }
  case FrameType::CLOSE: {
    std::error_code ec;
    c->sock.close(ec);
    return;
  }
  default:
    reply_error(c, hdr, "unexpected frame type " + std::to_string(hdr.type));
    return;
  }
}

} // namespace salvage
