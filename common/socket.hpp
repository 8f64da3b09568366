#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>
#include <initializer_list>

// Transport-level failure (reset, send error, timeout on send)
class SocketError : public std::runtime_error {
public:
    explicit SocketError(const std::string& what) : std::runtime_error(what) {}
};

// Could not establish a connection (refused, unreachable, timed out)
class ConnectError : public SocketError {
public:
    explicit ConnectError(const std::string& what) : SocketError(what) {}
};

// One contiguous piece of a frame payload
struct ConstBuffer {
    const void* data;
    size_t      len;
};

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote; timeout_ms <= 0 blocks indefinitely.
    // Throws ConnectError.
    void connect(const std::string& ip, u16 port, int timeout_ms = 0);

    // Server: bind + listen
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking). Throws SocketError; after
    // shutdown_both() on a listening socket the pending accept fails.
    TcpSocket accept();

    // Send exactly 'len' bytes; throws SocketError
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on close or receive timeout
    bool recv_all(void* buf, size_t len);

    // Send a complete frame: header followed by the concatenated parts
    void write_frame(MsgType type, u16 flags, std::initializer_list<ConstBuffer> parts);
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len) {
        write_frame(type, flags, {ConstBuffer{payload, payload_len}});
    }

    // Read next frame: fills header, resizes payload_buf and reads payload.
    // Returns false if the peer closed (or timed out) before a full frame.
    // Throws ProtocolError if payload_len exceeds max_payload.
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf,
                    u32 max_payload = MAX_FRAME_PAYLOAD);

    // Apply TCP tuning (nodelay, keepalive, buffer sizes)
    void tune();

    bool is_valid() const { return fd_ != MEDIADROP_INVALID_SOCKET; }
    socket_t native() const { return fd_; }

    void close();

    // Disable both directions without releasing the descriptor; wakes a
    // thread blocked in accept()/recv() on this socket.
    void shutdown_both();

    // Get peer address as string
    std::string peer_addr() const;

    // Locally bound port (useful after binding port 0)
    u16 local_port() const;

    // Socket-level timeouts in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);
    void set_send_timeout_ms(int ms);

private:
    socket_t fd_{MEDIADROP_INVALID_SOCKET};

    void apply_socket_opts();
};
