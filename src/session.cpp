#include "session.hpp"

void SessionStore::put(const PeerAddr &peer, SessionEntry entry) {
    std::lock_guard<std::mutex> lck(mtx);
    sessions[peer] = std::move(entry);
}

bool SessionStore::erase(const PeerAddr &peer) {
    std::lock_guard<std::mutex> lck(mtx);
    return sessions.erase(peer) > 0;
}

bool SessionStore::contains(const PeerAddr &peer) const {
    std::lock_guard<std::mutex> lck(mtx);
    return sessions.count(peer) > 0;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lck(mtx);
    return sessions.size();
}

std::optional<SessionInfo> SessionStore::info(const PeerAddr &peer) const {
    std::lock_guard<std::mutex> lck(mtx);
    auto it = sessions.find(peer);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    SessionInfo info;
    info.filename = it->second.filename;
    info.total_size = it->second.total_size;
    info.total_segments = it->second.total_segments;
    info.file_checksum = it->second.file_checksum;
    return info;
}

std::optional<std::vector<std::vector<uint8_t>>> SessionStore::lookup(const PeerAddr &peer,
    const std::vector<uint32_t> &seqs) const {
    std::lock_guard<std::mutex> lck(mtx);
    auto it = sessions.find(peer);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    std::vector<std::vector<uint8_t>> frames;
    for (uint32_t seq : seqs) {
        auto pkt = it->second.packets.find(seq);
        if (pkt != it->second.packets.end()) {
            frames.push_back(pkt->second);
        }
    }
    return frames;
}
