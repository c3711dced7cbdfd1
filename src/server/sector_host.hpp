#pragma once
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <set>
#include "crypto.hpp"
#include "protocol.hpp"
#include "sector_store.hpp"

namespace salvage {

struct HostdConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{9982};
    int threads{4};
    std::vector<uint8_t> key;
    std::string sectors_dir;
    std::set<std::string> contracts;
    HostSettings settings;
};

// Serves OPEN, SETTINGS and READ frames for sectors held in a SectorStore.
class SectorHost {
public:
    using tcp = asio::ip::tcp;

    struct Conn : public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        asio::strand<asio::io_context::executor_type> strand;
        std::vector<uint8_t> read_buf;
        std::vector<uint8_t> inbuf;
        std::deque<std::vector<uint8_t>> write_q;
        bool opened{false};
        Conn(asio::io_context& io) : sock(io), strand(asio::make_strand(io)), read_buf(64*1024) {}
    };

    SectorHost(asio::io_context& io, const HostdConfig& cfg, SectorStore& store);
    void start();
    void stop();
    // Bound port, useful after listening on port 0.
    uint16_t port() const { return port_; }
    uint64_t reads_served() const { return reads_served_.load(); }

private:
    asio::io_context& io_;
    HostdConfig cfg_;
    SectorStore& store_;
    tcp::acceptor acceptor_;
    SodiumAead aead_;
    uint16_t port_{0};
    std::atomic<uint64_t> reads_served_{0};

    void do_accept();
    void do_read(std::shared_ptr<Conn> c);
    void do_write(std::shared_ptr<Conn> c);
    void parse_and_handle(std::shared_ptr<Conn> c, const uint8_t* data, size_t n);
    void handle_frame(std::shared_ptr<Conn> c, const FrameHeader& hdr, std::vector<uint8_t>&& payload);
    void reply(std::shared_ptr<Conn> c, const FrameHeader& req, FrameType type, std::vector<uint8_t> payload);
    void reply_error(std::shared_ptr<Conn> c, const FrameHeader& req, const std::string& msg);
    void send_via(std::shared_ptr<Conn> c, Frame&& f);
};

} // namespace salvage
