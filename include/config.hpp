#ifndef CONFIG_HPP
#define CONFIG_HPP
#include <cstdint>

// server defaults
static const char *const DEFAULT_HOST = "0.0.0.0";
static const int DEFAULT_PORT = 9000;
static const char *const DEFAULT_DATA_DIR = "data";
static const unsigned int DEFAULT_SEGMENT_SIZE = 1200;
static const unsigned int MIN_SEGMENT_SIZE = 1;
static const unsigned int MAX_SEGMENT_SIZE = 1300; // keeps DATA under a 1500 byte MTU
static const unsigned int SERVER_POLL_TIMEOUT = 200; // ms

// client defaults
static const unsigned int DEFAULT_RECV_TIMEOUT = 1000; // ms
static const unsigned int MAX_TIMEOUTS = 3;
static const unsigned int MAX_NACK_ENTRIES = 256;
static const unsigned int MAX_NACK_ROUND = 16 * MAX_NACK_ENTRIES; // seqs asked for per round
static const char *const DEFAULT_DOWNLOAD_DIR = "downloads";
static const uint32_t MAX_DROP_RANGE = 65536; // seqs one drop range may expand to

#endif
