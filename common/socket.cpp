// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <climits>

#ifndef _WIN32
#  include <sys/uio.h>
#endif

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;
static constexpr size_t FRAME_READ_STEP = 4 * 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == MEDIADROP_INVALID_SOCKET) {
        throw SocketError("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != MEDIADROP_INVALID_SOCKET) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = MEDIADROP_INVALID_SOCKET;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = MEDIADROP_INVALID_SOCKET;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
}

void TcpSocket::connect(const std::string& ip, u16 port, int timeout_ms) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw ConnectError("Invalid IP address: " + ip);
    }
    const std::string target = ip + ":" + std::to_string(port);

#ifdef _WIN32
    (void)timeout_ms;
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == MEDIADROP_SOCKET_ERROR) {
        throw ConnectError("connect(" + target + ") failed: " +
                           socket_error_str(last_socket_error()));
    }
#else
    if (timeout_ms <= 0) {
        if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == MEDIADROP_SOCKET_ERROR) {
            throw ConnectError("connect(" + target + ") failed: " +
                               socket_error_str(last_socket_error()));
        }
        tune();
        return;
    }

    // Non-blocking connect bounded by poll(), then back to blocking mode
    int fl = fcntl(fd_, F_GETFL, 0);
    fcntl(fd_, F_SETFL, fl | O_NONBLOCK);

    int rc = ::connect(fd_, (sockaddr*)&addr, sizeof(addr));
    if (rc != 0) {
        int err = last_socket_error();
        if (err != EINPROGRESS) {
            fcntl(fd_, F_SETFL, fl);
            throw ConnectError("connect(" + target + ") failed: " + socket_error_str(err));
        }
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        int prc;
        do {
            prc = ::poll(&pfd, 1, timeout_ms);
        } while (prc < 0 && errno == EINTR);
        if (prc == 0) {
            fcntl(fd_, F_SETFL, fl);
            throw ConnectError("connect(" + target + ") timed out after " +
                               std::to_string(timeout_ms) + " ms");
        }
        if (prc < 0) {
            int perr = errno;
            fcntl(fd_, F_SETFL, fl);
            throw ConnectError("poll() during connect failed: " + socket_error_str(perr));
        }
        int so_err = 0;
        socklen_t len = sizeof(so_err);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_err, &len);
        if (so_err != 0) {
            fcntl(fd_, F_SETFL, fl);
            throw ConnectError("connect(" + target + ") failed: " + socket_error_str(so_err));
        }
    }
    fcntl(fd_, F_SETFL, fl);
#endif
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw SocketError("Invalid listen address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == MEDIADROP_SOCKET_ERROR) {
        throw SocketError("bind(" + ip + ":" + std::to_string(port) + ") failed: " +
                          socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == MEDIADROP_SOCKET_ERROR) {
        throw SocketError("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
#ifdef _WIN32
    int peer_len = sizeof(peer);
#else
    socklen_t peer_len = sizeof(peer);
#endif
    socket_t client;
    for (;;) {
        client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
        if (client != MEDIADROP_INVALID_SOCKET) break;
        int err = last_socket_error();
#ifndef _WIN32
        if (err == EINTR || err == ECONNABORTED) continue;
#endif
        throw SocketError("accept() failed: " + socket_error_str(err));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw SocketError("Connection closed during send");
            }
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            if (would_block(err)) {
                throw SocketError("send() timed out");
            }
            throw SocketError("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int received = ::recv(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, p, remaining, 0);
#endif
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            if (would_block(err)) {
                // SO_RCVTIMEO expired
                return false;
            }
            throw SocketError("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

void TcpSocket::write_frame(MsgType type, u16 flags, std::initializer_list<ConstBuffer> parts) {
    u64 total_payload = 0;
    for (const auto& part : parts) total_payload += part.len;
    if (total_payload > MAX_FRAME_PAYLOAD) {
        throw ProtocolError("Frame payload too large: " + std::to_string(total_payload));
    }

    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = static_cast<u32>(total_payload);
    proto::encode_header(hdr, hdr_buf);

#ifdef _WIN32
    send_all(hdr_buf, 8);
    for (const auto& part : parts) {
        if (part.len > 0) send_all(part.data, part.len);
    }
#else
    // sendmsg: header + all parts in as few syscalls as possible, resuming
    // after partial sends. MSG_NOSIGNAL keeps a dead peer from raising SIGPIPE.
    std::vector<ConstBuffer> segs;
    segs.reserve(parts.size() + 1);
    segs.push_back({hdr_buf, 8});
    for (const auto& part : parts) {
        if (part.len > 0) segs.push_back(part);
    }

    size_t total = 8 + (size_t)total_payload;
    size_t sent_total = 0;
    std::vector<iovec> iov;
    iov.reserve(segs.size());
    while (sent_total < total) {
        iov.clear();
        size_t skip = sent_total;
        for (const auto& seg : segs) {
            if (skip >= seg.len) { skip -= seg.len; continue; }
            iovec v;
            v.iov_base = const_cast<char*>(static_cast<const char*>(seg.data) + skip);
            v.iov_len  = seg.len - skip;
            skip = 0;
            iov.push_back(v);
        }
        msghdr msg{};
        msg.msg_iov    = iov.data();
        msg.msg_iovlen = iov.size();
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (would_block(errno)) throw SocketError("send() timed out");
            throw SocketError("sendmsg failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
#endif
}

bool TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf, u32 max_payload) {
    u8 hdr_buf[8];
    if (!recv_all(hdr_buf, 8)) return false;
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > max_payload) {
        throw ProtocolError("Payload too large: " + std::to_string(hdr.payload_len) +
                            " > " + std::to_string(max_payload));
    }
    // Grow with the bytes that actually arrive, never to the claimed size up front
    payload_buf.clear();
    size_t got = 0;
    while (got < hdr.payload_len) {
        size_t step = std::min<size_t>(hdr.payload_len - got, FRAME_READ_STEP);
        payload_buf.resize(got + step);
        if (!recv_all(payload_buf.data() + got, step)) return false;
        got += step;
    }
    return true;
}

void TcpSocket::close() {
    if (fd_ != MEDIADROP_INVALID_SOCKET) {
        MEDIADROP_CLOSE_SOCKET(fd_);
        fd_ = MEDIADROP_INVALID_SOCKET;
    }
}

void TcpSocket::shutdown_both() {
    if (fd_ == MEDIADROP_INVALID_SOCKET) return;
#ifdef _WIN32
    ::shutdown(fd_, SD_BOTH);
#else
    ::shutdown(fd_, SHUT_RDWR);
#endif
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
#ifdef _WIN32
    int len = sizeof(local);
#else
    socklen_t len = sizeof(local);
#endif
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw SocketError("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

void TcpSocket::set_send_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
#endif
}
