#include "utils.hpp"
#include <atomic>
#include <ctime>

static std::atomic<bool> debug_on(false);

// print timestamped line as [hh:mm:ss.micros] [TAG] msg, wrapped in color codes
static void print_line(FILE *out, const char *color, const char *tag, const char *msg) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    struct tm parts;
    localtime_r(&now_c, &parts);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    fprintf(out, "%s[%02d:%02d:%02d.%06ld] [%s] %s%s\n", color, parts.tm_hour, parts.tm_min, parts.tm_sec,
        (long)microseconds, tag, msg, color[0] ? "\033[0m" : "");
    fflush(out);
}

// print log with green color, time(ms) and [LOG] prefix
void log(const char *msg) {
    print_line(stdout, "\033[32m", "LOG", msg);
}

// print error with red color, time and [ERR] prefix
void err(const char *msg) {
    print_line(stderr, "\033[31m", "ERR", msg);
}

// print debug info, time and [DBG] prefix
void debug(const char *msg) {
    if (debug_on) {
        print_line(stdout, "", "DBG", msg);
    }
}

void set_debug(bool enabled) {
    debug_on = enabled;
}

bool debug_enabled() {
    return debug_on;
}

// get debug string of a frame
// in format "prefix GET/DAT/END/ERR/NAK/OK  field=value ..."
std::string get_debug_str(const char *prefix, const uint8_t *buf, size_t len) {
    std::string ret = prefix;
    switch (frame_type(buf, len)) {
        case TYPE_GET: {
            GetFrame frame;
            ret += " GET";
            if (decode_get(buf, len, frame) == DECODE_OK) {
                ret += " name=" + frame.filename;
            }
            break;
        }
        case TYPE_DATA: {
            DataFrame frame;
            ret += " DAT";
            DecodeStatus status = decode_data(buf, len, frame);
            if (status == DECODE_OK) {
                ret += " seq=" + std::to_string(frame.seq);
                ret += " off=" + std::to_string(frame.offset);
                ret += " len=" + std::to_string(frame.payload.size());
                ret += " total=" + std::to_string(frame.total_size);
                if (frame.is_final()) {
                    ret += " FINAL";
                }
            } else {
                ret += " (";
                ret += decode_status_str(status);
                ret += ")";
            }
            break;
        }
        case TYPE_END: {
            EndFrame frame;
            ret += " END";
            if (decode_end(buf, len, frame) == DECODE_OK) {
                ret += " segments=" + std::to_string(frame.total_segments);
                char sum[16];
                snprintf(sum, sizeof(sum), "%08x", frame.file_checksum);
                ret += " crc=";
                ret += sum;
            }
            break;
        }
        case TYPE_ERR: {
            ErrFrame frame;
            ret += " ERR";
            if (decode_err(buf, len, frame) == DECODE_OK) {
                ret += " code=" + std::to_string(frame.code) + " msg=" + frame.message;
            }
            break;
        }
        case TYPE_NACK: {
            NackFrame frame;
            ret += " NAK";
            if (decode_nack(buf, len, frame) == DECODE_OK) {
                ret += " count=" + std::to_string(frame.seqs.size());
                if (!frame.seqs.empty()) {
                    ret += " first=" + std::to_string(frame.seqs.front());
                }
            }
            break;
        }
        case TYPE_OK:
            ret += " OK";
            break;
        default:
            ret += " UNK";
            break;
    }
    ret += " bytes=";
    ret += std::to_string(len);
    return ret;
}
