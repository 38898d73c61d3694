#ifndef FTP_HPP
#define FTP_HPP
#include <atomic>
#include <string>
#include <vector>
#include "config.hpp"
#include "loss.hpp"
#include "rdt.hpp"
#include "session.hpp"
#include "udp.hpp"

class FTPServer {
public:
    FTPServer(const char *ip, int port, const std::string &data_dir,
        unsigned int segment_size = DEFAULT_SEGMENT_SIZE);

    ~FTPServer();

    bool is_open() const {
        return udp.is_open();
    }
    int get_port() const {
        return udp.local_port();
    }

    // receive and handle datagrams until stop() is called
    int serve_forever();
    void stop() {
        running = false;
    }

    // handle one inbound datagram from peer
    void handle_datagram(const uint8_t *buf, size_t len, const struct sockaddr_in &peer);

    SessionStore &get_sessions() {
        return sessions;
    }

private:
    UDP udp;
    std::string data_dir;
    unsigned int segment_size;
    std::atomic<bool> running;
    SessionStore sessions;

    void handle_get(const uint8_t *buf, size_t len, const struct sockaddr_in &peer);
    void handle_nack(const uint8_t *buf, size_t len, const struct sockaddr_in &peer);
    void handle_ok(const struct sockaddr_in &peer);
    void send_err(uint8_t code, const std::string &msg, const struct sockaddr_in &peer);
};

struct ClientResult {
    bool ok = false;
    TransferError error = TRANSFER_OK;
    std::string reason;
    std::string out_path;
    uint64_t bytes = 0;
};

class FTPClient {
public:
    FTPClient(const char *server_ip, int server_port, unsigned int timeout = DEFAULT_RECV_TIMEOUT);

    ~FTPClient();

    bool is_open() const {
        return udp.is_open();
    }
    // close the socket, a request in progress aborts
    void close() {
        udp.close();
    }

    // install a loss injector for testing, nullptr removes it
    void set_loss_injector(PacketLossInjector *injector) {
        this->injector = injector;
    }

    /**
     * Fetch filename from the server and write it to out_path.
     * An empty out_path means downloads/<basename>.
     **/
    ClientResult request_file(const std::string &filename, const std::string &out_path = "");

    const ReassemblyMachine::Stats &get_stats() const {
        return stats;
    }

    static std::string default_out_path(const std::string &filename);

private:
    UDP udp;
    struct sockaddr_in server_addr;
    bool server_addr_ok;
    unsigned int timeout;
    PacketLossInjector *injector = nullptr;
    ReassemblyMachine::Stats stats;

    int send_actions(const ReassemblyMachine::Actions &actions);
};

#endif
