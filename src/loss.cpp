#include "loss.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <utility>

// parse unsigned decimal, false if anything but digits
static bool parse_uint(const std::string &s, uint32_t &out) {
    size_t b = s.find_first_not_of(" \t");
    size_t e = s.find_last_not_of(" \t");
    if (b == std::string::npos) {
        return false;
    }
    std::string t = s.substr(b, e - b + 1);
    if (t.find_first_not_of("0123456789") != std::string::npos || t.size() > 10) {
        return false;
    }
    unsigned long long v = std::strtoull(t.c_str(), nullptr, 10);
    if (v > 0xFFFFFFFFULL) {
        return false;
    }
    out = (uint32_t)v;
    return true;
}

std::vector<uint32_t> parse_drop_spec(const std::string &spec) {
    std::vector<uint32_t> seqs;
    size_t colon = spec.find(':');
    if (colon == std::string::npos || spec.substr(0, colon) != "seq") {
        return seqs;
    }
    std::string items = spec.substr(colon + 1);
    size_t start = 0;
    while (start <= items.size()) {
        size_t comma = items.find(',', start);
        if (comma == std::string::npos) {
            comma = items.size();
        }
        std::string item = items.substr(start, comma - start);
        start = comma + 1;

        size_t dash = item.find('-');
        if (dash == std::string::npos) {
            uint32_t v;
            if (parse_uint(item, v)) {
                seqs.push_back(v);
            }
            continue;
        }
        uint32_t a, b;
        if (!parse_uint(item.substr(0, dash), a) || !parse_uint(item.substr(dash + 1), b)) {
            continue;
        }
        if (a > b) {
            std::swap(a, b);
        }
        if (b - a >= MAX_DROP_RANGE) {
            err(("parse_drop_spec(): Range " + item + " cut to " + std::to_string(MAX_DROP_RANGE) + " seqs").c_str());
            b = a + MAX_DROP_RANGE - 1;
        }
        for (uint64_t s = a; s <= b; s++) {
            seqs.push_back((uint32_t)s);
        }
    }
    return seqs;
}

PacketLossInjector::PacketLossInjector(double drop_prob, unsigned int seed)
    : drop_prob(drop_prob), rng(seed), dist(0.0, 1.0) {
}

bool PacketLossInjector::add_spec(const std::string &spec) {
    std::vector<uint32_t> seqs = parse_drop_spec(spec);
    if (seqs.empty()) {
        err(("PacketLossInjector: Ignoring drop spec \"" + spec + "\"").c_str());
        return false;
    }
    drop_seqs.insert(seqs.begin(), seqs.end());
    return true;
}

void PacketLossInjector::add_seq(uint32_t seq) {
    drop_seqs.insert(seq);
}

bool PacketLossInjector::should_drop(uint32_t seq) {
    if (drop_seqs.count(seq) && !already_dropped.count(seq)) {
        already_dropped.insert(seq);
        drops++;
        return true;
    }
    if (drop_prob > 0 && dist(rng) < drop_prob) {
        drops++;
        return true;
    }
    return false;
}
