#include "../include/segmenter.hpp"
#include "../include/config.hpp"
#include <stdio.h>
#include <assert.h>
#include <sstream>
#include <string>

static std::string as_string(const Segment &seg) {
    return std::string(seg.payload.begin(), seg.payload.end());
}

void test_split() {
    std::istringstream src("ABCDEFGHIJ");
    Segmenter segmenter(src, 10, 4);
    assert(segmenter.segment_count() == 3);
    Segment seg;
    assert(segmenter.next(seg) == Segmenter::SEGMENT_OK);
    assert(seg.seq == 0 && seg.offset == 0 && as_string(seg) == "ABCD");
    assert(segmenter.next(seg) == Segmenter::SEGMENT_OK);
    assert(seg.seq == 1 && seg.offset == 4 && as_string(seg) == "EFGH");
    assert(segmenter.next(seg) == Segmenter::SEGMENT_OK);
    assert(seg.seq == 2 && seg.offset == 8 && as_string(seg) == "IJ");
    assert(seg.offset + seg.payload.size() == 10);
    assert(segmenter.next(seg) == Segmenter::SEGMENT_DONE);
    assert(segmenter.next(seg) == Segmenter::SEGMENT_DONE);
    printf("split ok\n");
}

void test_rewind() {
    std::istringstream src("ABCDEFGHIJ");
    Segmenter segmenter(src, 10, 4);
    Segment seg;
    while (segmenter.next(seg) == Segmenter::SEGMENT_OK) {}
    assert(segmenter.rewind());
    assert(segmenter.next(seg) == Segmenter::SEGMENT_OK);
    assert(seg.seq == 0 && as_string(seg) == "ABCD");
    printf("rewind ok\n");
}

void test_exact_multiple() {
    std::istringstream src("ABCDEFGH");
    Segmenter segmenter(src, 8, 4);
    assert(segmenter.segment_count() == 2);
    Segment seg;
    int n = 0;
    uint64_t covered = 0;
    while (segmenter.next(seg) == Segmenter::SEGMENT_OK) {
        assert(seg.offset == covered);
        covered += seg.payload.size();
        n++;
    }
    assert(n == 2 && covered == 8);
    printf("exact multiple ok\n");
}

void test_empty() {
    std::istringstream src("");
    Segmenter segmenter(src, 0, 4);
    Segment seg;
    assert(segmenter.segment_count() == 0);
    assert(segmenter.next(seg) == Segmenter::SEGMENT_DONE);
    printf("empty ok\n");
}

void test_clamp() {
    assert(Segmenter::clamp_segment_size(0) == MIN_SEGMENT_SIZE);
    assert(Segmenter::clamp_segment_size(5000) == MAX_SEGMENT_SIZE);
    assert(Segmenter::clamp_segment_size(512) == 512);
    std::istringstream src("XYZ");
    Segmenter segmenter(src, 3, 0);
    assert(segmenter.get_segment_size() == 1);
    assert(segmenter.segment_count() == 3);
    printf("clamp ok\n");
}

void test_short_source() {
    // announced length longer than the stream
    std::istringstream src("ABCDEF");
    Segmenter segmenter(src, 10, 4);
    Segment seg;
    assert(segmenter.next(seg) == Segmenter::SEGMENT_OK);
    assert(segmenter.next(seg) == Segmenter::SEGMENT_READ_ERROR);
    printf("short source ok\n");
}

int main() {
    test_split();
    test_rewind();
    test_exact_multiple();
    test_empty();
    test_clamp();
    test_short_source();
    printf("test_segmenter passed\n");
    return 0;
}
