#include <sandcell/sandbox/output_buffer.hpp>

#include <cassert>
#include <string>

static void testWithinLimit() {
    sandcell::OutputBuffer buf(16);
    buf.append("hello ");
    buf.append("world");
    assert(!buf.truncated());
    assert(buf.size() == 11);
    assert(buf.str() == "hello world");
}

static void testKeepsHeadAndMarksTruncation() {
    sandcell::OutputBuffer buf(5);
    buf.append("0123456789");
    buf.append("abc");
    assert(buf.truncated());
    assert(buf.dropped_bytes() == 8);
    assert(buf.size() == 5);
    assert(buf.str() == "01234" + sandcell::truncation_marker(8));
    assert(sandcell::truncation_marker(8) == "\n[output truncated: 8 bytes omitted]\n");
}

static void testNeverSplitsUtf8() {
    // "aé€" = 1 + 2 + 3 bytes; the limit cuts the euro sign
    sandcell::OutputBuffer buf(4);
    buf.append("a\xC3\xA9\xE2\x82\xAC");
    assert(buf.truncated());
    assert(buf.dropped_bytes() == 2);
    assert(buf.str() == "a\xC3\xA9" + sandcell::truncation_marker(3));

    // A complete sequence at the cut is kept
    sandcell::OutputBuffer whole(3);
    whole.append("a\xC3\xA9zz");
    assert(whole.str() == "a\xC3\xA9" + sandcell::truncation_marker(2));
}

static void testZeroLimit() {
    sandcell::OutputBuffer buf(0);
    buf.append("x");
    assert(buf.size() == 0);
    assert(buf.str() == sandcell::truncation_marker(1));
}

static void testTail() {
    sandcell::OutputBuffer buf(100);
    buf.append("line one\nline two\n");
    assert(buf.tail(9) == "line two\n");
    assert(buf.tail(1000) == "line one\nline two\n");
}

int main() {
    testWithinLimit();
    testKeepsHeadAndMarksTruncation();
    testNeverSplitsUtf8();
    testZeroLimit();
    testTail();
    return 0;
}
