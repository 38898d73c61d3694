#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Every frame starts with the same two bytes, all integers are big-endian.
//
//  0               1               2
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// |    Type (8)   |  Version (8)  |  variant fields ...
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
//
// GET   flags(8) name_len(16) name
// DATA  flags(8) window(8) seq(32) total_size(64) offset(64)
//       payload_len(16) checksum(32) payload
// END   flags(8) total_segments(32) file_checksum(32)
// ERR   code(8) msg_len(16) msg
// NACK  flags(8) count(16) count x seq(32)
// OK    flags(8)
//
// DATA checksum: CRC-32 over the header without the checksum field, then
// the payload. END file_checksum: CRC-32 over all payloads in seq order.

const uint8_t PROTOCOL_VERSION = 1;

const uint8_t TYPE_GET = 0x01;
const uint8_t TYPE_DATA = 0x02;
const uint8_t TYPE_END = 0x03;
const uint8_t TYPE_NACK = 0x11;
const uint8_t TYPE_OK = 0x12;
const uint8_t TYPE_ERR = 0x7F;

const uint8_t FLAG_FINAL = 0x01;

const uint8_t ERR_NOT_FOUND = 0x01;
const uint8_t ERR_INVALID_PATH = 0x02;
const uint8_t ERR_IO = 0x03;
const uint8_t ERR_UNKNOWN = 0xFF;

const size_t GET_HEADER_SIZE = 5;
const size_t DATA_HEADER_SIZE = 30;
const size_t DATA_CHECKSUM_OFFSET = 26;
const size_t END_SIZE = 11;
const size_t ERR_HEADER_SIZE = 5;
const size_t NACK_HEADER_SIZE = 5;
const size_t OK_MIN_SIZE = 2;

enum DecodeStatus {
    DECODE_OK,
    DECODE_MALFORMED,   // too short, wrong type or wrong version
    DECODE_INTEGRITY    // structurally fine but checksum mismatch
};

struct GetFrame {
    uint8_t flags = 0;
    std::string filename;
};

struct DataFrame {
    uint8_t flags = 0;
    uint8_t window_id = 0;
    uint32_t seq = 0;
    uint64_t total_size = 0;
    uint64_t offset = 0;
    uint32_t checksum = 0;
    std::vector<uint8_t> payload;

    bool is_final() const {
        return flags & FLAG_FINAL;
    }
};

struct EndFrame {
    uint8_t flags = FLAG_FINAL;
    uint32_t total_segments = 0;
    uint32_t file_checksum = 0;
};

struct ErrFrame {
    uint8_t code = 0;
    std::string message;
};

struct NackFrame {
    uint8_t flags = 0;
    std::vector<uint32_t> seqs;
};

// crc32 (reflected, poly 0xEDB88320), crc32_update continues a running value
uint32_t crc32(const uint8_t *data, size_t len);
uint32_t crc32_update(uint32_t crc, const uint8_t *data, size_t len);

// type byte of a raw frame, 0 when empty
uint8_t frame_type(const uint8_t *buf, size_t len);

std::vector<uint8_t> encode_get(const std::string &filename);
std::vector<uint8_t> encode_data(uint32_t seq, uint64_t total_size, uint64_t offset,
    const uint8_t *payload, uint16_t len, uint8_t flags = 0, uint8_t window_id = 0);
std::vector<uint8_t> encode_end(uint32_t total_segments, uint32_t file_checksum);
std::vector<uint8_t> encode_err(uint8_t code, const std::string &message);
std::vector<uint8_t> encode_nack(const std::vector<uint32_t> &seqs);
std::vector<uint8_t> encode_ok();

DecodeStatus decode_get(const uint8_t *buf, size_t len, GetFrame &frame);
DecodeStatus decode_data(const uint8_t *buf, size_t len, DataFrame &frame);
DecodeStatus decode_end(const uint8_t *buf, size_t len, EndFrame &frame);
DecodeStatus decode_err(const uint8_t *buf, size_t len, ErrFrame &frame);
DecodeStatus decode_nack(const uint8_t *buf, size_t len, NackFrame &frame);
DecodeStatus decode_ok(const uint8_t *buf, size_t len);

const char *decode_status_str(DecodeStatus status);

#endif
