#include "ftp.hpp"
#include "fileio.hpp"
#include "segmenter.hpp"
#include <filesystem>
#include <fstream>

FTPServer::FTPServer(const char *ip, int port, const std::string &data_dir, unsigned int segment_size)
    : udp(ip, port), data_dir(data_dir), segment_size(Segmenter::clamp_segment_size(segment_size)),
      running(true) {
    if (udp.is_open()) {
        log(("FTPServer: Listening on " + std::string(ip) + ":" + std::to_string(udp.local_port())
            + " | data_dir=" + data_dir
            + " | segment_size=" + std::to_string(this->segment_size)).c_str());
    }
}

FTPServer::~FTPServer() {
    log("FTPServer: Terminated");
}

int FTPServer::serve_forever() {
    if (!udp.is_open()) {
        err("FTPServer::serve_forever(): Socket not open");
        return -1;
    }
    std::vector<uint8_t> buf(BUF_SIZE);
    struct sockaddr_in peer;
    while (running) {
        int len = udp.recv_datagram(buf.data(), buf.size(), &peer, SERVER_POLL_TIMEOUT);
        if (len < 0) {
            err("FTPServer::serve_forever(): Receive failed, shutting down");
            return -1;
        }
        if (len == 0) {
            // poll timeout, check running again
            continue;
        }
        handle_datagram(buf.data(), len, peer);
    }
    log("FTPServer: Shutting down");
    return 0;
}

void FTPServer::handle_datagram(const uint8_t *buf, size_t len, const struct sockaddr_in &peer) {
    switch (frame_type(buf, len)) {
        case TYPE_GET:
            handle_get(buf, len, peer);
            break;
        case TYPE_NACK:
            handle_nack(buf, len, peer);
            break;
        case TYPE_OK:
            handle_ok(peer);
            break;
        default:
            debug(get_debug_str("FTPServer: Ignoring", buf, len).c_str());
            break;
    }
}

void FTPServer::send_err(uint8_t code, const std::string &msg, const struct sockaddr_in &peer) {
    err(("FTPServer: " + msg).c_str());
    udp.send_datagram(encode_err(code, msg), &peer);
}

void FTPServer::handle_get(const uint8_t *buf, size_t len, const struct sockaddr_in &peer) {
    PeerAddr who = PeerAddr::from_sockaddr(peer);
    GetFrame get;
    if (decode_get(buf, len, get) != DECODE_OK) {
        err(("FTPServer: Invalid GET from " + who.to_string()).c_str());
        return;
    }

    std::string path;
    switch (resolve_path(data_dir, get.filename, path)) {
        case RESOLVE_INVALID_PATH:
            send_err(ERR_INVALID_PATH, "Invalid path: " + get.filename, peer);
            return;
        case RESOLVE_NOT_FOUND:
            send_err(ERR_NOT_FOUND, "File not found: " + get.filename, peer);
            return;
        case RESOLVE_OK:
            break;
    }

    int64_t total_size = file_size(path);
    std::ifstream in(path, std::ios::binary);
    if (total_size < 0 || !in) {
        send_err(ERR_IO, "Cannot read file: " + get.filename, peer);
        return;
    }

    // build every DATA frame up front, folding the file crc on the way
    SessionEntry entry;
    entry.filename = get.filename;
    entry.total_size = total_size;
    Segmenter segmenter(in, total_size, segment_size);
    Segment seg;
    uint32_t file_crc = 0;
    Segmenter::Status status;
    while ((status = segmenter.next(seg)) == Segmenter::SEGMENT_OK) {
        uint8_t flags = 0;
        if (seg.offset + seg.payload.size() == (uint64_t)total_size) {
            flags |= FLAG_FINAL;
        }
        entry.packets[seg.seq] = encode_data(seg.seq, total_size, seg.offset,
            seg.payload.data(), seg.payload.size(), flags);
        file_crc = crc32_update(file_crc, seg.payload.data(), seg.payload.size());
        entry.total_segments++;
    }
    if (status == Segmenter::SEGMENT_READ_ERROR) {
        send_err(ERR_IO, "Error reading file: " + get.filename, peer);
        return;
    }
    entry.file_checksum = file_crc;

    sessions.put(who, entry);

    log(("FTPServer: Sending " + std::to_string(entry.total_segments) + " segments ("
        + std::to_string(total_size) + " bytes) to " + who.to_string() + ": " + get.filename).c_str());
    for (const auto &pkt : entry.packets) {
        udp.send_datagram(pkt.second, &peer);
    }
    udp.send_datagram(encode_end(entry.total_segments, entry.file_checksum), &peer);
}

void FTPServer::handle_nack(const uint8_t *buf, size_t len, const struct sockaddr_in &peer) {
    PeerAddr who = PeerAddr::from_sockaddr(peer);
    NackFrame nack;
    if (decode_nack(buf, len, nack) != DECODE_OK) {
        err(("FTPServer: Invalid NACK from " + who.to_string()).c_str());
        return;
    }
    auto frames = sessions.lookup(who, nack.seqs);
    if (!frames) {
        log(("FTPServer: NACK from " + who.to_string() + " without session").c_str());
        return;
    }
    debug(("FTPServer: Resending " + std::to_string(frames->size()) + " of "
        + std::to_string(nack.seqs.size()) + " requested segments to " + who.to_string()).c_str());
    for (const auto &pkt : *frames) {
        udp.send_datagram(pkt, &peer);
    }
}

void FTPServer::handle_ok(const struct sockaddr_in &peer) {
    PeerAddr who = PeerAddr::from_sockaddr(peer);
    if (sessions.erase(who)) {
        log(("FTPServer: OK from " + who.to_string() + ", state cleared").c_str());
    } else {
        debug(("FTPServer: OK from " + who.to_string() + " without session").c_str());
    }
}

FTPClient::FTPClient(const char *server_ip, int server_port, unsigned int timeout)
    : udp("0.0.0.0", 0), timeout(timeout > 0 ? timeout : 1) {
    server_addr_ok = make_sockaddr(server_ip, server_port, &server_addr);
    if (!server_addr_ok) {
        err(("FTPClient: Invalid server address " + std::string(server_ip)).c_str());
    }
}

FTPClient::~FTPClient() {
}

std::string FTPClient::default_out_path(const std::string &filename) {
    std::filesystem::path name = std::filesystem::path(filename).filename();
    if (name.empty()) {
        name = "download.bin";
    }
    return (std::filesystem::path(DEFAULT_DOWNLOAD_DIR) / name).string();
}

int FTPClient::send_actions(const ReassemblyMachine::Actions &actions) {
    for (const auto &frame : actions) {
        if (udp.send_datagram(frame, &server_addr) < 0) {
            return -1;
        }
    }
    return 0;
}

ClientResult FTPClient::request_file(const std::string &filename, const std::string &out_path) {
    ClientResult result;
    if (!server_addr_ok || !udp.is_open()) {
        result.error = TRANSFER_SOCKET;
        result.reason = "Client socket not ready";
        err(("FTPClient: " + result.reason).c_str());
        return result;
    }
    PeerAddr server = PeerAddr::from_sockaddr(server_addr);
    log(("FTPClient: Requesting " + filename + " from " + server.to_string()).c_str());

    ReassemblyMachine machine(filename, injector);
    std::vector<uint8_t> buf(BUF_SIZE);
    struct sockaddr_in from;
    bool socket_failed = send_actions(machine.start()) < 0;
    auto start = std::chrono::steady_clock::now();
    while (!socket_failed && !machine.done()) {
        int len = udp.recv_datagram(buf.data(), buf.size(), &from, timeout);
        if (len < 0) {
            socket_failed = true;
            break;
        }
        ReassemblyMachine::Actions actions;
        if (len == 0) {
            actions = machine.on_timeout();
        } else if (PeerAddr::from_sockaddr(from) != server) {
            debug(("FTPClient: Ignoring datagram from " + PeerAddr::from_sockaddr(from).to_string()).c_str());
            continue;
        } else {
            actions = machine.on_datagram(buf.data(), len);
        }
        if (send_actions(actions) < 0) {
            socket_failed = true;
        }
    }
    auto end = std::chrono::steady_clock::now();
    stats = machine.get_stats();

    if (socket_failed && !machine.done()) {
        result.error = TRANSFER_SOCKET;
        result.reason = "Socket closed during transfer";
        err(("FTPClient: " + result.reason).c_str());
        return result;
    }
    if (machine.get_state() == ReassemblyMachine::ABORTED) {
        result.error = machine.get_error();
        result.reason = machine.get_reason();
        return result;
    }

    std::vector<uint8_t> data;
    if (!machine.finalize(data)) {
        result.error = machine.get_error();
        result.reason = machine.get_reason();
        err(("FTPClient: " + result.reason).c_str());
        return result;
    }

    result.out_path = out_path.empty() ? default_out_path(filename) : out_path;
    if (write_file(result.out_path, data) < 0) {
        result.error = TRANSFER_IO;
        result.reason = "Cannot write " + result.out_path;
        err(("FTPClient: " + result.reason).c_str());
        return result;
    }
    result.ok = true;
    result.bytes = data.size();

    // file saved
    log(("FTPClient: File saved to " + result.out_path + " (" + std::to_string(data.size()) + " bytes)").c_str());

    // time elapsed
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    log(("FTPClient: Time elapsed: " + std::to_string((float)elapsed.count() / 1000.0) + " s").c_str());

    // recovery counters
    log(("FTPClient: Segments " + std::to_string(stats.segments)
        + ", duplicates " + std::to_string(stats.duplicates)
        + ", corrupt " + std::to_string(stats.corrupt)
        + ", dropped " + std::to_string(stats.dropped)
        + ", NACKs " + std::to_string(stats.nacks_sent)
        + ", timeouts " + std::to_string(stats.timeouts)).c_str());
    return result;
}
