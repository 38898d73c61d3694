#include "udp.hpp"

PeerAddr PeerAddr::from_sockaddr(const struct sockaddr_in &addr) {
    PeerAddr peer;
    peer.ip = ntohl(addr.sin_addr.s_addr);
    peer.port = ntohs(addr.sin_port);
    return peer;
}

std::string PeerAddr::to_string() const {
    struct in_addr in;
    in.s_addr = htonl(ip);
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &in, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(port);
}

bool make_sockaddr(const char *ip, int port, struct sockaddr_in *addr) {
    memset(addr, 0, sizeof(*addr));
    addr->sin_family = AF_INET;
    addr->sin_port = htons(port);
    return inet_pton(AF_INET, ip, &addr->sin_addr) > 0;
}

UDP::UDP(const char *ip, int port) {
    // create socket
    sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        err("UDP::UDP(): Error creating socket");
        return;
    }
    // set addr
    if (!make_sockaddr(ip, port, &addr)) {
        err("UDP::UDP(): Error converting ip address");
        release();
        return;
    }
    // bind addr
    if (bind(sock, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        err(("UDP::UDP(): Error binding socket: " + std::string(strerror(errno))).c_str());
        release();
        return;
    }
}

UDP::~UDP() {
    release();
}

void UDP::release() {
    int fd = sock.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

void UDP::close() {
    if (sock < 0 || closed.exchange(true)) {
        return;
    }
    // wakes a blocked recvfrom; ENOTCONN on an unconnected socket is expected
    if (shutdown(sock, SHUT_RDWR) < 0 && errno != ENOTCONN) {
        err(("UDP::close(): Error shutting down socket: " + std::string(strerror(errno))).c_str());
    }
}

int UDP::local_port() const {
    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (sock < 0 || getsockname(sock, (struct sockaddr *)&bound, &len) < 0) {
        return -1;
    }
    return ntohs(bound.sin_port);
}

// send datagram to addr and return the number of bytes sent
int UDP::send_datagram(const std::vector<uint8_t> &data, const struct sockaddr_in *addr) {
    if (!is_open()) {
        err("UDP::send_datagram(): Socket closed");
        return -1;
    }
    packets_sent++;
    int ret = sendto(sock, data.data(), data.size(), 0, (const struct sockaddr *)addr, sizeof(struct sockaddr_in));
    if (ret < 0) {
        err(("UDP::send_datagram(): Error sending packet: " + std::string(strerror(errno))).c_str());
        return -1;
    }

    if (debug_enabled()) {
        debug(get_debug_str("UDP::send_datagram(): Sent", data.data(), data.size()).c_str());
    }
    return ret;
}

// set receive timeout in milliseconds (0 for no timeout)
int UDP::set_timeout(unsigned int timeout) {
    if (timeout == current_timeout) {
        return 0;
    }
    struct timeval tv;
    tv.tv_sec = timeout / 1000;
    tv.tv_usec = (timeout % 1000) * 1000;
    if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        err("UDP::set_timeout(): Error setting timeout");
        return -1;
    }
    current_timeout = timeout;
    return 0;
}

// recv datagram with timeout in milliseconds (0 for no timeout)
int UDP::recv_datagram(uint8_t *buf, size_t cap, struct sockaddr_in *addr, unsigned int timeout) {
    if (!is_open()) {
        return -1;
    }
    if (set_timeout(timeout) < 0) {
        return -1;
    }
    while (true) {
        socklen_t addr_len = sizeof(struct sockaddr_in);
        int ret = recvfrom(sock, buf, cap, 0, (struct sockaddr *)addr, &addr_len);
        if (closed) {
            return -1;
        }
        if (ret < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return 0;
            }
            if (errno == EINTR) {
                // a signal is not a timeout, wait again
                continue;
            }
            err(("UDP::recv_datagram(): Error receiving packet: " + std::string(strerror(errno))).c_str());
            return -1;
        }
        if (ret == 0) {
            // empty datagram carries no frame
            continue;
        }
        packets_recv++;
        if (debug_enabled()) {
            debug(get_debug_str("UDP::recv_datagram(): Recv", buf, ret).c_str());
        }
        return ret;
    }
}
