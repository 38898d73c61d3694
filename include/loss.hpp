#ifndef LOSS_HPP
#define LOSS_HPP
#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <vector>

// Simulated loss of inbound DATA segments, for testing recovery.
// Listed seqs are dropped the first time they arrive; on top of that
// every segment is dropped with probability drop_prob.
class PacketLossInjector {
public:
    PacketLossInjector(double drop_prob = 0.0, unsigned int seed = std::random_device{}());

    // add seqs from a spec like "seq:1,5-9", returns false if nothing was parsed
    bool add_spec(const std::string &spec);
    void add_seq(uint32_t seq);

    // true when the segment should be treated as lost
    bool should_drop(uint32_t seq);

    unsigned int get_drops() const {
        return drops;
    }
    const std::set<uint32_t> &get_drop_seqs() const {
        return drop_seqs;
    }

private:
    std::set<uint32_t> drop_seqs;
    std::set<uint32_t> already_dropped;
    double drop_prob;
    std::mt19937 rng;
    std::uniform_real_distribution<double> dist;
    unsigned int drops = 0;
};

// parse "seq:1,5-9" into a list of seqs, malformed items are skipped
std::vector<uint32_t> parse_drop_spec(const std::string &spec);

#endif
