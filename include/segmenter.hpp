#ifndef SEGMENTER_HPP
#define SEGMENTER_HPP
#include <cstdint>
#include <istream>
#include <vector>

struct Segment {
    uint32_t seq = 0;
    uint64_t offset = 0;
    std::vector<uint8_t> payload;
};

// Splits a seekable stream of known length into fixed size segments.
// Segments are produced on demand, in ascending seq/offset order, and
// the last one ends exactly at total_size.
class Segmenter {
public:
    enum Status {
        SEGMENT_OK,
        SEGMENT_DONE,
        SEGMENT_READ_ERROR
    };

    Segmenter(std::istream &source, uint64_t total_size, unsigned int segment_size);

    // fill seg with the next segment
    Status next(Segment &seg);
    // restart from the first segment
    bool rewind();

    unsigned int get_segment_size() const {
        return segment_size;
    }
    // number of segments a full pass produces
    uint32_t segment_count() const;

    static unsigned int clamp_segment_size(unsigned int size);

private:
    std::istream &source;
    uint64_t total_size;
    unsigned int segment_size;
    uint32_t next_seq = 0;
    uint64_t next_offset = 0;
};

#endif
