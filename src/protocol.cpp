#include "protocol.hpp"

static const uint32_t CRC32_POLY = 0xEDB88320;

// lookup table for the reflected crc32
struct Crc32Table {
    uint32_t entries[256];

    Crc32Table() {
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t c = i;
            for (int k = 0; k < 8; k++) {
                c = (c & 1) ? (CRC32_POLY ^ (c >> 1)) : (c >> 1);
            }
            entries[i] = c;
        }
    }
};

static const uint32_t *crc32_table() {
    static const Crc32Table table;
    return table.entries;
}

uint32_t crc32_update(uint32_t crc, const uint8_t *data, size_t len) {
    const uint32_t *table = crc32_table();
    uint32_t c = crc ^ 0xFFFFFFFF;
    for (size_t i = 0; i < len; i++) {
        c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFF;
}

uint32_t crc32(const uint8_t *data, size_t len) {
    return crc32_update(0, data, len);
}

// big-endian helpers
static void put_u16(std::vector<uint8_t> &buf, uint16_t v) {
    buf.push_back(v >> 8);
    buf.push_back(v & 0xFF);
}

static void put_u32(std::vector<uint8_t> &buf, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buf.push_back((v >> shift) & 0xFF);
    }
}

static void put_u64(std::vector<uint8_t> &buf, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buf.push_back((v >> shift) & 0xFF);
    }
}

static uint16_t get_u16(const uint8_t *p) {
    return (uint16_t)((p[0] << 8) | p[1]);
}

static uint32_t get_u32(const uint8_t *p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

static uint64_t get_u64(const uint8_t *p) {
    return ((uint64_t)get_u32(p) << 32) | get_u32(p + 4);
}

// checks the common prefix
static bool check_prefix(const uint8_t *buf, size_t len, size_t min_size, uint8_t type) {
    if (len < min_size) {
        return false;
    }
    return buf[0] == type && buf[1] == PROTOCOL_VERSION;
}

uint8_t frame_type(const uint8_t *buf, size_t len) {
    if (len == 0) {
        return 0;
    }
    return buf[0];
}

std::vector<uint8_t> encode_get(const std::string &filename) {
    std::vector<uint8_t> buf;
    uint16_t name_len = filename.size() > 0xFFFF ? 0xFFFF : filename.size();
    buf.reserve(GET_HEADER_SIZE + name_len);
    buf.push_back(TYPE_GET);
    buf.push_back(PROTOCOL_VERSION);
    buf.push_back(0);
    put_u16(buf, name_len);
    buf.insert(buf.end(), filename.begin(), filename.begin() + name_len);
    return buf;
}

DecodeStatus decode_get(const uint8_t *buf, size_t len, GetFrame &frame) {
    if (!check_prefix(buf, len, GET_HEADER_SIZE, TYPE_GET)) {
        return DECODE_MALFORMED;
    }
    size_t name_len = get_u16(buf + 3);
    // read what fits
    if (name_len > len - GET_HEADER_SIZE) {
        name_len = len - GET_HEADER_SIZE;
    }
    frame.flags = buf[2];
    frame.filename.assign(reinterpret_cast<const char *>(buf + GET_HEADER_SIZE), name_len);
    return DECODE_OK;
}

std::vector<uint8_t> encode_data(uint32_t seq, uint64_t total_size, uint64_t offset,
    const uint8_t *payload, uint16_t len, uint8_t flags, uint8_t window_id) {
    std::vector<uint8_t> buf;
    buf.reserve(DATA_HEADER_SIZE + len);
    buf.push_back(TYPE_DATA);
    buf.push_back(PROTOCOL_VERSION);
    buf.push_back(flags);
    buf.push_back(window_id);
    put_u32(buf, seq);
    put_u64(buf, total_size);
    put_u64(buf, offset);
    put_u16(buf, len);
    // checksum covers everything so far plus the payload
    uint32_t sum = crc32_update(crc32(buf.data(), buf.size()), payload, len);
    put_u32(buf, sum);
    buf.insert(buf.end(), payload, payload + len);
    return buf;
}

DecodeStatus decode_data(const uint8_t *buf, size_t len, DataFrame &frame) {
    if (!check_prefix(buf, len, DATA_HEADER_SIZE, TYPE_DATA)) {
        return DECODE_MALFORMED;
    }
    size_t payload_len = get_u16(buf + 24);
    if (payload_len > len - DATA_HEADER_SIZE) {
        payload_len = len - DATA_HEADER_SIZE;
    }
    const uint8_t *payload = buf + DATA_HEADER_SIZE;
    uint32_t rx_sum = get_u32(buf + DATA_CHECKSUM_OFFSET);
    uint32_t calc_sum = crc32_update(crc32(buf, DATA_CHECKSUM_OFFSET), payload, payload_len);
    if (rx_sum != calc_sum) {
        return DECODE_INTEGRITY;
    }
    frame.flags = buf[2];
    frame.window_id = buf[3];
    frame.seq = get_u32(buf + 4);
    frame.total_size = get_u64(buf + 8);
    frame.offset = get_u64(buf + 16);
    frame.checksum = rx_sum;
    frame.payload.assign(payload, payload + payload_len);
    return DECODE_OK;
}

std::vector<uint8_t> encode_end(uint32_t total_segments, uint32_t file_checksum) {
    std::vector<uint8_t> buf;
    buf.reserve(END_SIZE);
    buf.push_back(TYPE_END);
    buf.push_back(PROTOCOL_VERSION);
    buf.push_back(FLAG_FINAL);
    put_u32(buf, total_segments);
    put_u32(buf, file_checksum);
    return buf;
}

DecodeStatus decode_end(const uint8_t *buf, size_t len, EndFrame &frame) {
    if (!check_prefix(buf, len, END_SIZE, TYPE_END)) {
        return DECODE_MALFORMED;
    }
    frame.flags = buf[2];
    frame.total_segments = get_u32(buf + 3);
    frame.file_checksum = get_u32(buf + 7);
    return DECODE_OK;
}

std::vector<uint8_t> encode_err(uint8_t code, const std::string &message) {
    std::vector<uint8_t> buf;
    uint16_t msg_len = message.size() > 0xFFFF ? 0xFFFF : message.size();
    buf.reserve(ERR_HEADER_SIZE + msg_len);
    buf.push_back(TYPE_ERR);
    buf.push_back(PROTOCOL_VERSION);
    buf.push_back(code);
    put_u16(buf, msg_len);
    buf.insert(buf.end(), message.begin(), message.begin() + msg_len);
    return buf;
}

DecodeStatus decode_err(const uint8_t *buf, size_t len, ErrFrame &frame) {
    if (!check_prefix(buf, len, ERR_HEADER_SIZE, TYPE_ERR)) {
        return DECODE_MALFORMED;
    }
    size_t msg_len = get_u16(buf + 3);
    if (msg_len > len - ERR_HEADER_SIZE) {
        msg_len = len - ERR_HEADER_SIZE;
    }
    frame.code = buf[2];
    frame.message.assign(reinterpret_cast<const char *>(buf + ERR_HEADER_SIZE), msg_len);
    return DECODE_OK;
}

std::vector<uint8_t> encode_nack(const std::vector<uint32_t> &seqs) {
    std::vector<uint8_t> buf;
    uint16_t count = seqs.size() > 0xFFFF ? 0xFFFF : seqs.size();
    buf.reserve(NACK_HEADER_SIZE + 4 * count);
    buf.push_back(TYPE_NACK);
    buf.push_back(PROTOCOL_VERSION);
    buf.push_back(0);
    put_u16(buf, count);
    for (uint16_t i = 0; i < count; i++) {
        put_u32(buf, seqs[i]);
    }
    return buf;
}

DecodeStatus decode_nack(const uint8_t *buf, size_t len, NackFrame &frame) {
    if (!check_prefix(buf, len, NACK_HEADER_SIZE, TYPE_NACK)) {
        return DECODE_MALFORMED;
    }
    uint16_t count = get_u16(buf + 3);
    frame.flags = buf[2];
    frame.seqs.clear();
    size_t off = NACK_HEADER_SIZE;
    // a short frame yields only the entries that are complete
    for (uint16_t i = 0; i < count && off + 4 <= len; i++) {
        frame.seqs.push_back(get_u32(buf + off));
        off += 4;
    }
    return DECODE_OK;
}

std::vector<uint8_t> encode_ok() {
    return std::vector<uint8_t>{TYPE_OK, PROTOCOL_VERSION, 0};
}

DecodeStatus decode_ok(const uint8_t *buf, size_t len) {
    if (!check_prefix(buf, len, OK_MIN_SIZE, TYPE_OK)) {
        return DECODE_MALFORMED;
    }
    return DECODE_OK;
}

const char *decode_status_str(DecodeStatus status) {
    switch (status) {
        case DECODE_OK:
            return "ok";
        case DECODE_MALFORMED:
            return "malformed frame";
        case DECODE_INTEGRITY:
            return "checksum mismatch";
    }
    return "unknown";
}
