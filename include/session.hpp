#ifndef SESSION_HPP
#define SESSION_HPP
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "udp.hpp"

// Encoded DATA frames of one transfer, kept until the requester sends OK.
struct SessionEntry {
    std::string filename;
    uint64_t total_size = 0;
    uint32_t total_segments = 0;
    uint32_t file_checksum = 0;
    std::map<uint32_t, std::vector<uint8_t>> packets;
};

struct SessionInfo {
    std::string filename;
    uint64_t total_size = 0;
    uint32_t total_segments = 0;
    uint32_t file_checksum = 0;
};

// Per-requester session cache. All members lock, so handlers may run on
// any thread. Entries live until erase(); there is no expiry.
class SessionStore {
public:
    // store entry for peer, replacing any previous one
    void put(const PeerAddr &peer, SessionEntry entry);
    // drop the entry, returns false if there was none
    bool erase(const PeerAddr &peer);
    bool contains(const PeerAddr &peer) const;
    size_t size() const;

    std::optional<SessionInfo> info(const PeerAddr &peer) const;

    /**
     * Cached frames for the requested seqs, in request order.
     * Seqs the session does not hold are skipped.
     * @return nullopt when peer has no session
     **/
    std::optional<std::vector<std::vector<uint8_t>>> lookup(const PeerAddr &peer,
        const std::vector<uint32_t> &seqs) const;

private:
    mutable std::mutex mtx;
    std::map<PeerAddr, SessionEntry> sessions;
};

#endif
