#include "../include/rdt.hpp"
#include "../include/config.hpp"
#include <stdio.h>
#include <assert.h>
#include <string>
#include <algorithm>

typedef ReassemblyMachine::Actions Actions;

static const std::string FILE_DATA = "ABCDEFGHIJ";

// DATA frame for segment seq of FILE_DATA cut into 4 byte pieces
static std::vector<uint8_t> data_frame(uint32_t seq) {
    uint64_t offset = seq * 4;
    size_t len = std::min<size_t>(4, FILE_DATA.size() - offset);
    uint8_t flags = offset + len == FILE_DATA.size() ? FLAG_FINAL : 0;
    return encode_data(seq, FILE_DATA.size(), offset,
        reinterpret_cast<const uint8_t *>(FILE_DATA.data()) + offset, len, flags);
}

static uint32_t file_crc() {
    return crc32(reinterpret_cast<const uint8_t *>(FILE_DATA.data()), FILE_DATA.size());
}

static Actions feed(ReassemblyMachine &m, const std::vector<uint8_t> &frame) {
    return m.on_datagram(frame.data(), frame.size());
}

static std::vector<uint32_t> nack_seqs(const std::vector<uint8_t> &frame) {
    NackFrame nack;
    assert(decode_nack(frame.data(), frame.size(), nack) == DECODE_OK);
    return nack.seqs;
}

static bool is_ok(const Actions &actions) {
    return actions.size() == 1 && frame_type(actions[0].data(), actions[0].size()) == TYPE_OK;
}

static std::string finalize_str(ReassemblyMachine &m) {
    std::vector<uint8_t> out;
    assert(m.finalize(out));
    return std::string(out.begin(), out.end());
}

void test_in_order() {
    ReassemblyMachine m("f.txt");
    Actions start = m.start();
    assert(start.size() == 1);
    GetFrame get;
    assert(decode_get(start[0].data(), start[0].size(), get) == DECODE_OK && get.filename == "f.txt");
    assert(m.get_state() == ReassemblyMachine::AWAIT_REPLY);

    assert(feed(m, data_frame(0)).empty());
    assert(m.get_state() == ReassemblyMachine::RECEIVING);
    assert(feed(m, data_frame(1)).empty());
    // final flag tells the count, so completion does not wait for END
    assert(is_ok(feed(m, data_frame(2))));
    assert(m.get_state() == ReassemblyMachine::COMPLETE);
    assert(*m.get_buffer().total_segments == 3);
    assert(finalize_str(m) == FILE_DATA);
    // late END is ignored once done
    assert(feed(m, encode_end(3, file_crc())).empty());
    printf("in order ok\n");
}

void test_out_of_order_and_duplicates() {
    ReassemblyMachine m("f.txt");
    m.start();
    assert(feed(m, data_frame(2)).empty());
    assert(feed(m, data_frame(2)).empty());
    assert(feed(m, data_frame(0)).empty());
    assert(feed(m, data_frame(0)).empty());
    assert(m.get_buffer().segments.size() == 2);
    assert(m.get_stats().duplicates == 2);
    assert(is_ok(feed(m, data_frame(1))));
    assert(finalize_str(m) == FILE_DATA);
    printf("out of order and duplicates ok\n");
}

void test_end_with_gap() {
    ReassemblyMachine m("f.txt");
    m.start();
    feed(m, data_frame(0));
    feed(m, data_frame(2));
    Actions actions = feed(m, encode_end(3, file_crc()));
    assert(actions.size() == 1);
    assert((nack_seqs(actions[0]) == std::vector<uint32_t>{1}));
    assert(m.get_state() == ReassemblyMachine::RECEIVING);
    assert(is_ok(feed(m, data_frame(1))));
    assert(finalize_str(m) == FILE_DATA);
    printf("end with gap ok\n");
}

void test_corrupt_ignored() {
    ReassemblyMachine m("f.txt");
    m.start();
    std::vector<uint8_t> bad = data_frame(1);
    bad[DATA_HEADER_SIZE] ^= 0x01;
    assert(feed(m, bad).empty());
    assert(m.get_buffer().segments.empty());
    assert(m.get_stats().corrupt == 1);
    std::vector<uint8_t> shortframe = data_frame(1);
    shortframe.resize(10);
    assert(feed(m, shortframe).empty());
    assert(m.get_stats().malformed == 1);
    assert(m.get_buffer().segments.empty());
    printf("corrupt ignored ok\n");
}

void test_err_aborts() {
    ReassemblyMachine m("missing.txt");
    m.start();
    assert(feed(m, encode_err(ERR_NOT_FOUND, "File not found: missing.txt")).empty());
    assert(m.get_state() == ReassemblyMachine::ABORTED);
    assert(m.get_error() == TRANSFER_PROTOCOL);
    assert(m.get_err_code() == ERR_NOT_FOUND);
    assert(m.get_reason().find("File not found") != std::string::npos);
    std::vector<uint8_t> out;
    assert(!m.finalize(out));

    // an unreadable ERR still aborts
    ReassemblyMachine m2("x");
    m2.start();
    std::vector<uint8_t> junk = {TYPE_ERR, PROTOCOL_VERSION};
    feed(m2, junk);
    assert(m2.get_state() == ReassemblyMachine::ABORTED);
    assert(m2.get_err_code() == ERR_UNKNOWN);
    printf("err aborts ok\n");
}

void test_timeouts() {
    // nothing received: GET again, then give up on the third timeout
    ReassemblyMachine m("f.txt");
    m.start();
    Actions a = m.on_timeout();
    assert(a.size() == 1 && frame_type(a[0].data(), a[0].size()) == TYPE_GET);
    a = m.on_timeout();
    assert(a.size() == 1 && frame_type(a[0].data(), a[0].size()) == TYPE_GET);
    a = m.on_timeout();
    assert(a.empty());
    assert(m.get_state() == ReassemblyMachine::ABORTED);
    assert(m.get_error() == TRANSFER_TIMEOUT);

    // a datagram resets the counter
    ReassemblyMachine r("f.txt");
    r.start();
    r.on_timeout();
    r.on_timeout();
    assert(r.get_timeout_count() == 2);
    feed(r, data_frame(0));
    assert(r.get_timeout_count() == 0);
    assert(r.get_state() == ReassemblyMachine::RECEIVING);

    // gap below max_seq is NACKed on timeout
    feed(r, data_frame(2));
    a = r.on_timeout();
    assert(a.size() == 1 && (nack_seqs(a[0]) == std::vector<uint32_t>{1}));

    // no gap and unknown count: probe the highest seq
    ReassemblyMachine p("f.txt");
    p.start();
    feed(p, data_frame(0));
    feed(p, data_frame(1));
    a = p.on_timeout();
    assert(a.size() == 1 && (nack_seqs(a[0]) == std::vector<uint32_t>{1}));
    assert(p.get_state() == ReassemblyMachine::RECEIVING);
    printf("timeouts ok\n");
}

void test_zero_length() {
    ReassemblyMachine m("empty.bin");
    m.start();
    assert(is_ok(feed(m, encode_end(0, crc32(nullptr, 0)))));
    assert(m.get_state() == ReassemblyMachine::COMPLETE);
    std::vector<uint8_t> out(3, 'x');
    assert(m.finalize(out));
    assert(out.empty());
    printf("zero length ok\n");
}

void test_verification() {
    // END announces a different checksum
    ReassemblyMachine m("f.txt");
    m.start();
    feed(m, data_frame(0));
    feed(m, data_frame(1));
    assert(is_ok(feed(m, encode_end(3, file_crc() ^ 1))) == false);
    assert(is_ok(feed(m, data_frame(2))));
    std::vector<uint8_t> out;
    assert(!m.finalize(out));
    assert(m.get_error() == TRANSFER_VERIFICATION);
    assert(m.get_reason().find("CRC") != std::string::npos);

    // total_size disagrees with what arrived
    ReassemblyMachine s("f.txt");
    s.start();
    const char *p = "ABCD";
    std::vector<uint8_t> only = encode_data(0, 99, 0, reinterpret_cast<const uint8_t *>(p), 4, FLAG_FINAL);
    assert(is_ok(feed(s, only)));
    assert(!s.finalize(out));
    assert(s.get_error() == TRANSFER_VERIFICATION);
    assert(s.get_reason().find("Size") != std::string::npos);
    printf("verification ok\n");
}

void test_past_end_discarded() {
    ReassemblyMachine m("f.txt");
    m.start();
    feed(m, data_frame(0));
    feed(m, encode_end(3, file_crc()));
    // seq 7 cannot belong to a 3 segment file
    std::vector<uint8_t> stray = encode_data(7, 10, 28, reinterpret_cast<const uint8_t *>("zz"), 2);
    assert(feed(m, stray).empty());
    assert(m.get_buffer().segments.size() == 1);
    feed(m, data_frame(1));
    assert(is_ok(feed(m, data_frame(2))));
    assert(finalize_str(m) == FILE_DATA);
    printf("past end discarded ok\n");
}

void test_injector() {
    PacketLossInjector injector(0.0, 1);
    injector.add_seq(1);
    ReassemblyMachine m("f.txt", &injector);
    m.start();
    feed(m, data_frame(0));
    feed(m, data_frame(1));
    feed(m, data_frame(2));
    assert(m.get_stats().dropped == 1);
    Actions a = feed(m, encode_end(3, file_crc()));
    assert(a.size() == 1 && (nack_seqs(a[0]) == std::vector<uint32_t>{1}));
    // the resent copy gets through
    assert(is_ok(feed(m, data_frame(1))));
    assert(finalize_str(m) == FILE_DATA);
    printf("injector ok\n");
}

void test_nack_split() {
    ReassemblyMachine m("big.bin");
    m.start();
    const char *p = "x";
    feed(m, encode_data(0, 600, 0, reinterpret_cast<const uint8_t *>(p), 1));
    Actions a = feed(m, encode_end(600, 0));
    // 599 missing seqs spread over 256 + 256 + 87
    assert(a.size() == 3);
    assert(nack_seqs(a[0]).size() == MAX_NACK_ENTRIES);
    assert(nack_seqs(a[1]).size() == MAX_NACK_ENTRIES);
    assert(nack_seqs(a[2]).size() == 599 - 2 * MAX_NACK_ENTRIES);
    assert(nack_seqs(a[0]).front() == 1);
    assert(nack_seqs(a[2]).back() == 599);
    assert(m.get_stats().nacks_sent == 3);
    printf("nack split ok\n");
}

void test_inconsistent_end_discarded() {
    ReassemblyMachine m("f.txt");
    m.start();
    feed(m, data_frame(0));
    // one flipped bit in the count makes it larger than the file
    std::vector<uint8_t> end = encode_end(3, file_crc());
    end[3] ^= 0x40;
    assert(feed(m, end).empty());
    assert(m.get_stats().malformed == 1);
    assert(!m.get_buffer().total_segments);

    // a count at or below a seq already received
    feed(m, data_frame(1));
    assert(feed(m, encode_end(1, file_crc())).empty());
    assert(m.get_stats().malformed == 2);
    assert(m.get_buffer().segments.size() == 2);

    Actions a = feed(m, encode_end(3, file_crc()));
    assert(a.size() == 1 && (nack_seqs(a[0]) == std::vector<uint32_t>{2}));
    // a second END must agree with the first
    assert(feed(m, encode_end(4, file_crc())).empty());
    assert(m.get_stats().malformed == 3);
    assert(is_ok(feed(m, data_frame(2))));
    assert(finalize_str(m) == FILE_DATA);
    printf("inconsistent end discarded ok\n");
}

void test_nack_round_capped() {
    // without DATA a huge count cannot be checked, only bounded
    ReassemblyMachine m("f.txt");
    m.start();
    Actions a = feed(m, encode_end(0x40000003, 0));
    assert(a.size() == MAX_NACK_ROUND / MAX_NACK_ENTRIES);
    assert(nack_seqs(a.front()).front() == 0);
    assert(nack_seqs(a.back()).back() == MAX_NACK_ROUND - 1);
    a = m.on_timeout();
    assert(a.size() == MAX_NACK_ROUND / MAX_NACK_ENTRIES);

    ReassemblyBuffer buf;
    buf.store(2, std::vector<uint8_t>(1, 'a'));
    buf.set_total_segments(10);
    assert((buf.missing(3) == std::vector<uint32_t>{0, 1, 3}));
    printf("nack round capped ok\n");
}

void test_buffer_missing() {
    ReassemblyBuffer buf;
    assert(buf.missing().empty());
    buf.store(3, std::vector<uint8_t>(1, 'a'));
    assert((buf.missing() == std::vector<uint32_t>{0, 1, 2}));
    buf.store(1, std::vector<uint8_t>(1, 'b'));
    assert(!buf.store(1, std::vector<uint8_t>(1, 'c')));
    assert(buf.segments[1][0] == 'b');
    buf.set_total_segments(6);
    assert((buf.missing() == std::vector<uint32_t>{0, 2, 4, 5}));
    buf.set_total_segments(2);
    assert(buf.segments.size() == 1);
    assert((buf.missing() == std::vector<uint32_t>{0}));
    printf("buffer missing ok\n");
}

int main() {
    test_in_order();
    test_out_of_order_and_duplicates();
    test_end_with_gap();
    test_corrupt_ignored();
    test_err_aborts();
    test_timeouts();
    test_zero_length();
    test_verification();
    test_past_end_discarded();
    test_injector();
    test_nack_split();
    test_buffer_missing();
    test_inconsistent_end_discarded();
    test_nack_round_capped();
    printf("test_reassembly passed\n");
    return 0;
}
