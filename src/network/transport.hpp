/**
 * @file transport.hpp
 * @brief TCP transport for scheduler RPCs with length-prefixed framing.
 *
 * Provides both client (connect + send/receive) and server (accept + handle)
 * sides. Messages are framed as [4-byte big-endian length][payload].
 * Uses non-blocking I/O with poll() for cooperative scheduling.
 */

#pragma once

#include "core/result.hpp"
#include "executor/thread_pool.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace tco_scheduler {

/**
 * @brief Length-prefixed TCP transport.
 *
 * Wire format per message:
 *   [uint32_t big-endian length][payload bytes]
 *
 * The server answers one request per accepted connection. Connections are
 * handled on a worker pool so a slow client does not stall the accept loop.
 */
class TcpTransport {
public:
    static constexpr uint32_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16 MB
    static constexpr int DEFAULT_BACKLOG = 64;

    TcpTransport();
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // ── Client-side ──────────────────────────
    /// @p address may be a dotted IPv4 address or a host name.
    Result<void> connect(const std::string& address, uint16_t port,
                         uint32_t timeout_ms = 5000);
    Result<void> send(const std::vector<uint8_t>& data);
    Result<std::vector<uint8_t>> receive(uint32_t timeout_ms = 10000);
    void disconnect();

    // ── Server-side ──────────────────────────
    using MessageHandler = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

    /// Bind and listen. Port 0 picks an ephemeral port (see bound_port()).
    Result<void> listen(uint16_t port, int backlog = DEFAULT_BACKLOG);
    void serve(MessageHandler handler, size_t worker_threads = 4);
    void stop_serving();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }

private:
    static void handle_connection(int fd, const MessageHandler& handler);

    // Wire helpers
    static Result<void> send_on_fd(int fd, const std::vector<uint8_t>& data);
    static Result<std::vector<uint8_t>> recv_on_fd(int fd, uint32_t timeout_ms);
    static bool send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms = 5000);
    static bool recv_all(int fd, void* buf, size_t len, uint32_t timeout_ms = 10000);

    int client_fd_ = -1;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> serving_{false};
    std::unique_ptr<ThreadPool> workers_;
    std::jthread serve_thread_;
};

}  // namespace tco_scheduler
