#include "segmenter.hpp"
#include "config.hpp"

Segmenter::Segmenter(std::istream &source, uint64_t total_size, unsigned int segment_size)
    : source(source), total_size(total_size), segment_size(clamp_segment_size(segment_size)) {
}

unsigned int Segmenter::clamp_segment_size(unsigned int size) {
    if (size < MIN_SEGMENT_SIZE) {
        return MIN_SEGMENT_SIZE;
    }
    if (size > MAX_SEGMENT_SIZE) {
        return MAX_SEGMENT_SIZE;
    }
    return size;
}

uint32_t Segmenter::segment_count() const {
    return (uint32_t)((total_size + segment_size - 1) / segment_size);
}

Segmenter::Status Segmenter::next(Segment &seg) {
    if (next_offset >= total_size) {
        return SEGMENT_DONE;
    }
    uint64_t remaining = total_size - next_offset;
    size_t len = remaining < segment_size ? (size_t)remaining : segment_size;
    seg.seq = next_seq;
    seg.offset = next_offset;
    seg.payload.resize(len);
    source.read(reinterpret_cast<char *>(seg.payload.data()), len);
    if ((size_t)source.gcount() != len) {
        // source shrank under us
        seg.payload.resize(source.gcount());
        return SEGMENT_READ_ERROR;
    }
    next_seq++;
    next_offset += len;
    return SEGMENT_OK;
}

bool Segmenter::rewind() {
    source.clear();
    source.seekg(0, std::ios::beg);
    if (source.fail()) {
        return false;
    }
    next_seq = 0;
    next_offset = 0;
    return true;
}
