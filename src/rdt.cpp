#include "rdt.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <algorithm>

const char *transfer_error_str(TransferError error) {
    switch (error) {
        case TRANSFER_OK:
            return "ok";
        case TRANSFER_PROTOCOL:
            return "server error";
        case TRANSFER_TIMEOUT:
            return "timeout";
        case TRANSFER_NO_PROGRESS:
            return "no progress";
        case TRANSFER_VERIFICATION:
            return "verification failed";
        case TRANSFER_SOCKET:
            return "socket error";
        case TRANSFER_IO:
            return "io error";
    }
    return "unknown";
}

bool ReassemblyBuffer::store(uint32_t seq, const std::vector<uint8_t> &payload) {
    if ((int64_t)seq > max_seq) {
        max_seq = seq;
    }
    return segments.emplace(seq, payload).second;
}

void ReassemblyBuffer::set_total_segments(uint32_t total) {
    total_segments = total;
    segments.erase(segments.lower_bound(total), segments.end());
}

bool ReassemblyBuffer::complete() const {
    return total_segments && segments.size() == *total_segments;
}

std::vector<uint32_t> ReassemblyBuffer::missing(size_t max_count) const {
    std::vector<uint32_t> seqs;
    uint64_t limit;
    if (total_segments) {
        limit = *total_segments;
    } else if (max_seq >= 0) {
        limit = (uint64_t)max_seq + 1;
    } else {
        return seqs;
    }
    // walk the sorted keys and collect the holes between them
    uint64_t expect = 0;
    for (auto it = segments.begin(); it != segments.end() && it->first < limit; it++) {
        for (; expect < it->first && seqs.size() < max_count; expect++) {
            seqs.push_back((uint32_t)expect);
        }
        if (seqs.size() >= max_count) {
            return seqs;
        }
        expect = (uint64_t)it->first + 1;
    }
    for (; expect < limit && seqs.size() < max_count; expect++) {
        seqs.push_back((uint32_t)expect);
    }
    return seqs;
}

ReassemblyMachine::ReassemblyMachine(const std::string &filename, PacketLossInjector *injector)
    : filename(filename), injector(injector) {
}

ReassemblyMachine::Actions ReassemblyMachine::start() {
    state = AWAIT_REPLY;
    return Actions{encode_get(filename)};
}

void ReassemblyMachine::abort(TransferError error, const std::string &reason) {
    state = ABORTED;
    this->error = error;
    this->reason = reason;
    err(("ReassemblyMachine: " + reason).c_str());
}

ReassemblyMachine::Actions ReassemblyMachine::finish() {
    state = COMPLETE;
    debug("ReassemblyMachine: All segments received");
    return Actions{encode_ok()};
}

ReassemblyMachine::Actions ReassemblyMachine::make_nacks(const std::vector<uint32_t> &seqs) {
    Actions actions;
    for (size_t i = 0; i < seqs.size(); i += MAX_NACK_ENTRIES) {
        size_t end = std::min(seqs.size(), i + (size_t)MAX_NACK_ENTRIES);
        actions.push_back(encode_nack(std::vector<uint32_t>(seqs.begin() + i, seqs.begin() + end)));
        stats.nacks_sent++;
    }
    return actions;
}

ReassemblyMachine::Actions ReassemblyMachine::on_datagram(const uint8_t *buf, size_t len) {
    if (done()) {
        return Actions();
    }
    timeout_count = 0;
    switch (frame_type(buf, len)) {
        case TYPE_DATA:
            return handle_data(buf, len);
        case TYPE_END:
            return handle_end(buf, len);
        case TYPE_ERR:
            return handle_err(buf, len);
        default:
            debug("ReassemblyMachine: Ignoring unexpected frame");
            return Actions();
    }
}

ReassemblyMachine::Actions ReassemblyMachine::handle_err(const uint8_t *buf, size_t len) {
    ErrFrame frame;
    if (decode_err(buf, len, frame) != DECODE_OK) {
        frame.code = ERR_UNKNOWN;
        frame.message = "Unknown error";
    }
    err_code = frame.code;
    abort(TRANSFER_PROTOCOL, "Server error (" + std::to_string(frame.code) + "): " + frame.message);
    return Actions();
}

ReassemblyMachine::Actions ReassemblyMachine::handle_data(const uint8_t *buf, size_t len) {
    DataFrame frame;
    DecodeStatus status = decode_data(buf, len, frame);
    if (status != DECODE_OK) {
        if (status == DECODE_INTEGRITY) {
            stats.corrupt++;
        } else {
            stats.malformed++;
        }
        debug((std::string("ReassemblyMachine: Discard DATA, ") + decode_status_str(status)).c_str());
        return Actions();
    }
    if (injector && injector->should_drop(frame.seq)) {
        stats.dropped++;
        log(("[DROP] Discarding seq " + std::to_string(frame.seq)).c_str());
        return Actions();
    }
    state = RECEIVING;
    if (buffer.total_segments && frame.seq >= *buffer.total_segments) {
        debug(("ReassemblyMachine: Discard seq " + std::to_string(frame.seq) + " past the end").c_str());
        return Actions();
    }
    if (!buffer.total_size) {
        buffer.total_size = frame.total_size;
    }
    if (buffer.store(frame.seq, frame.payload)) {
        stats.segments++;
    } else {
        stats.duplicates++;
    }
    if (frame.is_final() && !buffer.total_segments) {
        buffer.set_total_segments(frame.seq + 1);
    }
    if (buffer.complete()) {
        return finish();
    }
    return Actions();
}

ReassemblyMachine::Actions ReassemblyMachine::handle_end(const uint8_t *buf, size_t len) {
    EndFrame frame;
    if (decode_end(buf, len, frame) != DECODE_OK) {
        stats.malformed++;
        debug("ReassemblyMachine: Discard malformed END");
        return Actions();
    }
    // END carries no checksum, so check its count against verified DATA
    uint32_t total = frame.total_segments;
    if ((int64_t)total <= buffer.max_seq
        || (buffer.total_size && *buffer.total_size > 0 && total > *buffer.total_size)
        || (buffer.total_segments && *buffer.total_segments != total)) {
        stats.malformed++;
        debug(("ReassemblyMachine: Discard END with inconsistent count " + std::to_string(total)).c_str());
        return Actions();
    }
    state = RECEIVING;
    buffer.set_total_segments(total);
    buffer.file_checksum = frame.file_checksum;
    std::vector<uint32_t> missing = buffer.missing(MAX_NACK_ROUND);
    if (!missing.empty()) {
        log(("ReassemblyMachine: END received, " + std::to_string(missing.size()) + " segments missing -> NACK").c_str());
        return make_nacks(missing);
    }
    return finish();
}

ReassemblyMachine::Actions ReassemblyMachine::on_timeout() {
    if (done()) {
        return Actions();
    }
    timeout_count++;
    stats.timeouts++;
    if (timeout_count >= MAX_TIMEOUTS) {
        abort(TRANSFER_TIMEOUT, "Aborting after " + std::to_string(MAX_TIMEOUTS) + " consecutive timeouts");
        return Actions();
    }
    std::vector<uint32_t> missing = buffer.missing(MAX_NACK_ROUND);
    if (!missing.empty()) {
        log(("ReassemblyMachine: Timeout, NACK " + std::to_string(missing.size()) + " segments").c_str());
        return make_nacks(missing);
    }
    if (buffer.segments.empty() && !buffer.total_segments) {
        log("ReassemblyMachine: Timeout, resending GET");
        stats.get_resends++;
        return Actions{encode_get(filename)};
    }
    if (!buffer.total_segments && buffer.max_seq >= 0) {
        // ask for the highest seq again to learn whether more follow
        log(("ReassemblyMachine: Timeout, probing seq " + std::to_string(buffer.max_seq)).c_str());
        return make_nacks(std::vector<uint32_t>{(uint32_t)buffer.max_seq});
    }
    abort(TRANSFER_NO_PROGRESS, "Timeout without progress");
    return Actions();
}

bool ReassemblyMachine::finalize(std::vector<uint8_t> &out) {
    out.clear();
    if (state != COMPLETE || !buffer.total_segments) {
        // nothing to verify, keep whatever error aborted the transfer
        return false;
    }
    uint32_t total = *buffer.total_segments;
    for (uint32_t seq = 0; seq < total; seq++) {
        auto it = buffer.segments.find(seq);
        if (it == buffer.segments.end()) {
            error = TRANSFER_VERIFICATION;
            reason = "Segment " + std::to_string(seq) + " missing at reassembly";
            out.clear();
            return false;
        }
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
    if (buffer.total_size && out.size() != *buffer.total_size) {
        error = TRANSFER_VERIFICATION;
        reason = "Size mismatch: expected " + std::to_string(*buffer.total_size)
            + ", got " + std::to_string(out.size());
        return false;
    }
    if (buffer.file_checksum) {
        uint32_t calc = crc32(out.data(), out.size());
        if (calc != *buffer.file_checksum) {
            char msg[64];
            snprintf(msg, sizeof(msg), "CRC mismatch: expected %08x, got %08x", *buffer.file_checksum, calc);
            error = TRANSFER_VERIFICATION;
            reason = msg;
            return false;
        }
    }
    return true;
}
