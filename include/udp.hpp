#ifndef UDP_HPP
#define UDP_HPP
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <atomic>
#include <string>
#include <vector>
#include "protocol.hpp"
#include "utils.hpp"

static const unsigned int BUF_SIZE = 65535;

// IPv4 address + port, usable as a map key
struct PeerAddr {
    uint32_t ip = 0;    // host order
    uint16_t port = 0;  // host order

    static PeerAddr from_sockaddr(const struct sockaddr_in &addr);
    std::string to_string() const;

    bool operator<(const PeerAddr &rhs) const {
        return ip < rhs.ip || (ip == rhs.ip && port < rhs.port);
    }
    bool operator==(const PeerAddr &rhs) const {
        return ip == rhs.ip && port == rhs.port;
    }
    bool operator!=(const PeerAddr &rhs) const {
        return !(*this == rhs);
    }
};

// fills addr from dotted ip and port, returns false on a bad ip
bool make_sockaddr(const char *ip, int port, struct sockaddr_in *addr);

class UDP {
public:
    UDP(const char *ip, int port);
    ~UDP();
    UDP(const UDP &) = delete;
    UDP &operator=(const UDP &) = delete;

    bool is_open() const {
        return sock >= 0 && !closed;
    }
    // shut the socket down, safe while another thread is receiving on it;
    // the descriptor itself is released by the destructor
    void close();
    // port actually bound, useful after binding port 0
    int local_port() const;

    // send datagram to addr, returns bytes sent or -1
    int send_datagram(const std::vector<uint8_t> &data, const struct sockaddr_in *addr);
    // recv datagram into buf, returns bytes, 0 on timeout, -1 on error
    int recv_datagram(uint8_t *buf, size_t cap, struct sockaddr_in *addr, unsigned int timeout = 0);

    unsigned int packets_sent = 0;
    unsigned int packets_recv = 0;
private:
    std::atomic<int> sock{-1};
    std::atomic<bool> closed{false};
    unsigned int current_timeout = 0;
    struct sockaddr_in addr;

    int set_timeout(unsigned int timeout);
    void release();
};

#endif
