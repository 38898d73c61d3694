#ifndef RDT_HPP
#define RDT_HPP
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"
#include "loss.hpp"

enum TransferError {
    TRANSFER_OK,
    TRANSFER_PROTOCOL,      // server answered with ERR
    TRANSFER_TIMEOUT,       // too many consecutive timeouts
    TRANSFER_NO_PROGRESS,   // timed out with nothing left to ask for
    TRANSFER_VERIFICATION,  // reassembled file failed size/crc checks
    TRANSFER_SOCKET,        // socket closed or failed
    TRANSFER_IO             // output could not be written
};

const char *transfer_error_str(TransferError error);

// Segments received so far for one request.
struct ReassemblyBuffer {
    std::map<uint32_t, std::vector<uint8_t>> segments;
    std::optional<uint64_t> total_size;
    std::optional<uint32_t> total_segments;
    std::optional<uint32_t> file_checksum;
    int64_t max_seq = -1;

    // store payload, false if seq is already present
    bool store(uint32_t seq, const std::vector<uint8_t> &payload);
    // fix the segment count, dropping anything stored beyond it
    void set_total_segments(uint32_t total);
    // all segments 0..total-1 present
    bool complete() const;
    // seqs below the known count, or below max_seq when the count is unknown,
    // at most max_count of them
    std::vector<uint32_t> missing(size_t max_count = SIZE_MAX) const;
};

// Client side of a transfer. Handlers update the state and return the
// frames to send; the caller owns the socket.
class ReassemblyMachine {
public:
    enum State {
        AWAIT_REPLY,
        RECEIVING,
        COMPLETE,
        ABORTED
    };

    struct Stats {
        unsigned int segments = 0;
        unsigned int duplicates = 0;
        unsigned int corrupt = 0;
        unsigned int malformed = 0;
        unsigned int dropped = 0;
        unsigned int nacks_sent = 0;
        unsigned int timeouts = 0;
        unsigned int get_resends = 0;
    };

    typedef std::vector<std::vector<uint8_t>> Actions;

    explicit ReassemblyMachine(const std::string &filename, PacketLossInjector *injector = nullptr);

    // first GET
    Actions start();
    Actions on_datagram(const uint8_t *buf, size_t len);
    Actions on_timeout();

    /**
     * Concatenate the segments and check them against the size and
     * checksum the server announced. Only valid in COMPLETE.
     * @return true and the file contents in out
     **/
    bool finalize(std::vector<uint8_t> &out);

    State get_state() const {
        return state;
    }
    bool done() const {
        return state == COMPLETE || state == ABORTED;
    }
    TransferError get_error() const {
        return error;
    }
    const std::string &get_reason() const {
        return reason;
    }
    // ERR code from the server when aborted by one
    uint8_t get_err_code() const {
        return err_code;
    }
    unsigned int get_timeout_count() const {
        return timeout_count;
    }
    const ReassemblyBuffer &get_buffer() const {
        return buffer;
    }
    const Stats &get_stats() const {
        return stats;
    }

private:
    std::string filename;
    PacketLossInjector *injector;
    State state = AWAIT_REPLY;
    ReassemblyBuffer buffer;
    Stats stats;
    unsigned int timeout_count = 0;
    TransferError error = TRANSFER_OK;
    std::string reason;
    uint8_t err_code = 0;

    Actions handle_data(const uint8_t *buf, size_t len);
    Actions handle_end(const uint8_t *buf, size_t len);
    Actions handle_err(const uint8_t *buf, size_t len);
    Actions make_nacks(const std::vector<uint32_t> &seqs);
    Actions finish();
    void abort(TransferError error, const std::string &reason);
};

#endif
