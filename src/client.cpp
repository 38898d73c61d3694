#include "utils.hpp"
#include "config.hpp"
#include "ftp.hpp"
#include "loss.hpp"
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <random>

static void usage(const char *prog) {
    std::cerr << "Usage: " << prog << " --server <ip:port> --file <name> [--out <path>]"
        << " [--timeout <seconds>] [--drop seq:1,5-9]... [--drop-prob <p>] [--seed <n>] [--verbose]" << std::endl;
}

// split "ip:port", false when the port is missing or out of range
static bool parse_server(const std::string &spec, std::string &ip, int &port) {
    size_t colon = spec.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == spec.size()) {
        return false;
    }
    ip = spec.substr(0, colon);
    char *end = nullptr;
    long p = std::strtol(spec.c_str() + colon + 1, &end, 10);
    if (*end != '\0' || p <= 0 || p > 65535) {
        return false;
    }
    port = (int)p;
    return true;
}

int main(int argc, char *argv[]) {
    std::string server_spec;
    std::string file;
    std::string out;
    double timeout = DEFAULT_RECV_TIMEOUT / 1000.0;
    std::vector<std::string> drops;
    double drop_prob = 0.0;
    unsigned int seed = std::random_device{}();

    struct option long_options[] = {
        {"server", required_argument, 0, 'S'},
        {"file", required_argument, 0, 'f'},
        {"out", required_argument, 0, 'o'},
        {"timeout", required_argument, 0, 't'},
        {"drop", required_argument, 0, 'D'},
        {"drop-prob", required_argument, 0, 'P'},
        {"seed", required_argument, 0, 'r'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "S:f:o:t:D:P:r:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'S':
                server_spec = optarg;
                break;
            case 'f':
                file = optarg;
                break;
            case 'o':
                out = optarg;
                break;
            case 't':
                timeout = std::atof(optarg);
                break;
            case 'D':
                drops.push_back(optarg);
                break;
            case 'P':
                drop_prob = std::atof(optarg);
                break;
            case 'r':
                seed = (unsigned int)std::strtoul(optarg, nullptr, 10);
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

    if (server_spec.empty() || file.empty()) {
        std::cerr << "Error: Missing required arguments --server or --file." << std::endl;
        usage(argv[0]);
        return 1;
    }
    std::string ip;
    int port = 0;
    if (!parse_server(server_spec, ip, port)) {
        std::cerr << "Error: Use --server ip:port" << std::endl;
        return 1;
    }
    if (timeout <= 0) {
        std::cerr << "Error: Invalid argument --timeout." << std::endl;
        return 1;
    }
    if (drop_prob < 0 || drop_prob > 1) {
        std::cerr << "Error: --drop-prob must be within [0, 1]." << std::endl;
        return 1;
    }

    FTPClient client(ip.c_str(), port, (unsigned int)(timeout * 1000));
    if (!client.is_open()) {
        err("Client could not start");
        return 1;
    }

    // loss simulation only when asked for
    PacketLossInjector injector(drop_prob, seed);
    for (const auto &spec : drops) {
        injector.add_spec(spec);
    }
    if (!injector.get_drop_seqs().empty() || drop_prob > 0) {
        client.set_loss_injector(&injector);
    }

    ClientResult result = client.request_file(file, out);
    if (!result.ok) {
        err(("Transfer failed (" + std::string(transfer_error_str(result.error)) + "): " + result.reason).c_str());
        return 1;
    }
    return 0;
}
