#include "utils.hpp"
#include "config.hpp"
#include "ftp.hpp"
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iostream>

static FTPServer *active_server = nullptr;

static void handle_signal(int) {
    if (active_server) {
        active_server->stop();
    }
}

static void usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--host <ip>] [--port <port>] [--data-dir <dir>]"
        << " [--segment-size <bytes>] [--verbose]" << std::endl;
}

int main(int argc, char *argv[]) {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    std::string data_dir = DEFAULT_DATA_DIR;
    int segment_size = DEFAULT_SEGMENT_SIZE;

    struct option long_options[] = {
        {"host", required_argument, 0, 'H'},
        {"port", required_argument, 0, 'p'},
        {"data-dir", required_argument, 0, 'd'},
        {"segment-size", required_argument, 0, 's'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "H:p:d:s:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'H':
                host = optarg;
                break;
            case 'p':
                port = std::atoi(optarg);
                break;
            case 'd':
                data_dir = optarg;
                break;
            case 's':
                segment_size = std::atoi(optarg);
                break;
            case 'v':
                set_debug(true);
                break;
            case 'h':
                usage(argv[0]);
                return 0;
            default:
                usage(argv[0]);
                return 1;
        }
    }

    if (port <= 0 || port > 65535) {
        std::cerr << "Error: Invalid argument --port." << std::endl;
        return 1;
    }
    if (segment_size <= 0) {
        std::cerr << "Error: Invalid argument --segment-size." << std::endl;
        return 1;
    }

    log("Welcome to NackRDT!");

    FTPServer server(host.c_str(), port, data_dir, segment_size);
    if (!server.is_open()) {
        err("Server could not start");
        return 1;
    }

    active_server = &server;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int ret = server.serve_forever();
    active_server = nullptr;
    return ret == 0 ? 0 : 1;
}
