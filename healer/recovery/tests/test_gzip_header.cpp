#include <catch2/catch_all.hpp>

#include <algorithm>
#include <string>
#include "../include/gzip_header.hpp"
#include "../include/native_compress.hpp"
#include "test_helpers.hpp"

using namespace healer::recovery;
using namespace healer::recovery::testing;

// ---------- Fixtures ----------

// Fixed 10-byte preamble with XFL = 0.
static Bytes preamble(std::uint8_t flags, std::uint32_t mtime = 0x5F5E1000, std::uint8_t os = 3) {
    return Bytes{0x1f, 0x8b, 8, flags,
                 static_cast<std::uint8_t>(mtime), static_cast<std::uint8_t>(mtime >> 8),
                 static_cast<std::uint8_t>(mtime >> 16), static_cast<std::uint8_t>(mtime >> 24),
                 0, os};
}

static void append(Bytes& b, const std::string& s, bool nul) {
    b.insert(b.end(), s.begin(), s.end());
    if (nul) b.push_back(0);
}

// Header with FEXTRA, FNAME and FCOMMENT followed by a fake payload + trailer.
static Bytes full_stream() {
    Bytes b = preamble(gzipfmt::kFExtra | gzipfmt::kFName | gzipfmt::kFComment);
    b.push_back(3); b.push_back(0);
    append(b, "abc", false);
    append(b, "hello.txt", true);
    append(b, "a comment", true);
    append(b, "PAYLOAD-AND-TRAILER!", false);
    return b;
}

static Bytes native_hello() {
    const auto raw = bytes_of("hello world");
    // level 6 leaves XFL at 0, so the stream round-trips through patch
    auto gz = nativeGzip(raw, 6, 0);
    REQUIRE(gz.has_value());
    return gz.take();
}

// ---------- parse ----------

TEST_CASE("GzipHeader: little-endian field readers") {
    const std::uint8_t b[] = {0x78, 0x56, 0x34, 0x12};
    CHECK(gzipfmt::readLe16(b) == 0x5678);
    CHECK(gzipfmt::readLe32(b) == 0x12345678u);

    const std::uint8_t hi[] = {0xFF, 0xFF, 0xFF, 0xFF};
    CHECK(gzipfmt::readLe32(hi) == 0xFFFFFFFFu);
}

TEST_CASE("GzipHeader: parse reads fixed fields and optional fields in order") {
    auto h = GzipHeaderCodec::parse(std::span<const std::uint8_t>(full_stream()));
    REQUIRE(h.has_value());
    CHECK(h->mtime == 0x5F5E1000u);
    CHECK(h->os == 3);
    CHECK(h->flags == (gzipfmt::kFExtra | gzipfmt::kFName | gzipfmt::kFComment));
    CHECK(*h->extra == bytes_of("abc"));
    CHECK(*h->fname == bytes_of("hello.txt"));
    CHECK(*h->fcomment == bytes_of("a comment"));
}

TEST_CASE("GzipHeader: parse rejects malformed input") {
    CHECK_FALSE(GzipHeaderCodec::parse(std::span<const std::uint8_t>(Bytes{0x1f, 0x8b, 8})).has_value());

    Bytes badMagic = preamble(0);
    badMagic[1] = 0x8c;
    CHECK_FALSE(GzipHeaderCodec::parse(std::span<const std::uint8_t>(badMagic)).has_value());

    Bytes badMethod = preamble(0);
    badMethod[2] = 7;
    CHECK_FALSE(GzipHeaderCodec::parse(std::span<const std::uint8_t>(badMethod)).has_value());

    Bytes noNul = preamble(gzipfmt::kFName);
    append(noNul, "unterminated", false);
    CHECK_FALSE(GzipHeaderCodec::parse(std::span<const std::uint8_t>(noNul)).has_value());

    Bytes shortExtra = preamble(gzipfmt::kFExtra);
    shortExtra.push_back(50); shortExtra.push_back(0);
    append(shortExtra, "xy", false);
    CHECK_FALSE(GzipHeaderCodec::parse(std::span<const std::uint8_t>(shortExtra)).has_value());
}

TEST_CASE("GzipHeader: parse of a zlib stream has no optional fields") {
    auto h = GzipHeaderCodec::parse(std::span<const std::uint8_t>(native_hello()));
    REQUIRE(h.has_value());
    CHECK(h->flags == 0);
    CHECK(h->os == 255);
    CHECK_FALSE(h->fname.has_value());
}

TEST_CASE("GzipHeader: parse from a path") {
    TempDir dir("gzhdr");
    write_file(dir / "a.gz", full_stream());
    auto h = GzipHeaderCodec::parse(dir / "a.gz");
    REQUIRE(h.has_value());
    CHECK(*h->fname == bytes_of("hello.txt"));

    write_file(dir / "short.gz", Bytes{0x1f, 0x8b});
    CHECK_FALSE(GzipHeaderCodec::parse(dir / "short.gz").has_value());

    CHECK_THROWS_AS(GzipHeaderCodec::parse(dir / "absent.gz"), std::filesystem::filesystem_error);
}

// ---------- format ----------

TEST_CASE("GzipHeader: format lists every field") {
    auto h = GzipHeaderCodec::parse(std::span<const std::uint8_t>(full_stream()));
    REQUIRE(h.has_value());
    const auto text = GzipHeaderCodec::format(*h);
    CHECK(text.find("mtime: 1600000000") != std::string::npos);
    CHECK(text.find("OS: 3 (Unix)") != std::string::npos);
    CHECK(text.find("flags: 00011100") != std::string::npos);
    CHECK(text.find("flag_names: FEXTRA, FNAME, FCOMMENT") != std::string::npos);
    CHECK(text.find("extra: 3 bytes") != std::string::npos);
    CHECK(text.find("fname: hello.txt") != std::string::npos);
    CHECK(text.find("fcomment: a comment") != std::string::npos);
}

TEST_CASE("GzipHeader: format escapes non-printable bytes and shows empty flags") {
    GzipHeader h;
    h.os = 255;
    CHECK(GzipHeaderCodec::format(h).find("flag_names: (none)") != std::string::npos);

    h.flags = gzipfmt::kFName;
    h.fname = Bytes{'a', 0xff, 'b'};
    CHECK(GzipHeaderCodec::format(h).find("fname: a\\xffb") != std::string::npos);
}

TEST_CASE("GzipHeader: flag names include reserved bits") {
    const auto names = GzipHeaderCodec::flagNames(0xFF);
    REQUIRE(names.size() == 8);
    CHECK(names.front() == "FTEXT");
    CHECK(names.back() == "RESERVED3");
}

// ---------- patch ----------

TEST_CASE("GzipHeader: patching with the parsed header leaves the buffer unchanged") {
    for (const Bytes& buf : {full_stream(), native_hello()}) {
        auto h = GzipHeaderCodec::parse(std::span<const std::uint8_t>(buf));
        REQUIRE(h.has_value());
        CHECK(GzipHeaderCodec::patch(buf, *h) == buf);
    }
}

TEST_CASE("GzipHeader: patch is idempotent") {
    GzipHeader target;
    target.mtime = 42;
    target.os = 3;
    target.flags = gzipfmt::kFName | gzipfmt::kFComment;
    target.fname = bytes_of("x.tar");
    target.fcomment = bytes_of("c");

    const auto once = GzipHeaderCodec::patch(full_stream(), target);
    CHECK(GzipHeaderCodec::patch(once, target) == once);
}

TEST_CASE("GzipHeader: patch inserts fields the stream lacks") {
    const Bytes gz = native_hello();

    GzipHeader target;
    target.mtime = 1234;
    target.os = 3;
    target.flags = gzipfmt::kFName;
    target.fname = bytes_of("hello.txt");

    const auto patched = GzipHeaderCodec::patch(gz, target);
    CHECK(patched.size() == gz.size() + 10);
    CHECK(patched[gzipfmt::kXflPos] == 0);

    auto h = GzipHeaderCodec::parse(std::span<const std::uint8_t>(patched));
    REQUIRE(h.has_value());
    CHECK(*h == target);
    // payload and trailer follow untouched
    CHECK(std::equal(gz.begin() + 10, gz.end(), patched.begin() + 20));
}

TEST_CASE("GzipHeader: patch splices out fields the target omits") {
    const Bytes full = full_stream();
    GzipHeader target;
    target.mtime = 7;
    target.os = 0;
    target.flags = gzipfmt::kFComment;
    target.fcomment = bytes_of("a comment");

    const auto patched = GzipHeaderCodec::patch(full, target);
    auto h = GzipHeaderCodec::parse(std::span<const std::uint8_t>(patched));
    REQUIRE(h.has_value());
    CHECK(*h == target);

    const std::string tail(patched.end() - 20, patched.end());
    CHECK(tail == "PAYLOAD-AND-TRAILER!");
    CHECK(patched.size() == full.size() - 5 - 10);
}

TEST_CASE("GzipHeader: flagged field without a value keeps the existing one") {
    GzipHeader target;
    target.flags = gzipfmt::kFName;
    const auto patched = GzipHeaderCodec::patch(full_stream(), target);
    auto h = GzipHeaderCodec::parse(std::span<const std::uint8_t>(patched));
    REQUIRE(h.has_value());
    CHECK(*h->fname == bytes_of("hello.txt"));

    const auto inserted = GzipHeaderCodec::patch(native_hello(), target);
    auto h2 = GzipHeaderCodec::parse(std::span<const std::uint8_t>(inserted));
    REQUIRE(h2.has_value());
    CHECK(h2->fname->empty());
}

TEST_CASE("GzipHeader: patch forces XFL to zero") {
    Bytes buf = preamble(0);
    buf[gzipfmt::kXflPos] = 2;
    append(buf, "payload", false);
    GzipHeader target;
    const auto patched = GzipHeaderCodec::patch(buf, target);
    CHECK(patched[gzipfmt::kXflPos] == 0);
    CHECK(patched.size() == buf.size());
}

TEST_CASE("GzipHeader: existing header CRC survives only when the target flags it") {
    Bytes buf = preamble(gzipfmt::kFHcrc);
    buf.push_back(0xAB); buf.push_back(0xCD);
    append(buf, "data", false);

    GzipHeader keep;
    keep.flags = gzipfmt::kFHcrc;
    Bytes expected = buf;
    std::fill(expected.begin() + gzipfmt::kMtimePos, expected.begin() + gzipfmt::kMtimePos + 4, 0);
    expected[gzipfmt::kOsPos] = 0;
    CHECK(GzipHeaderCodec::patch(buf, keep) == expected);

    GzipHeader drop;
    const auto dropped = GzipHeaderCodec::patch(buf, drop);
    CHECK(dropped.size() == buf.size() - 2);

    // never synthesised for a stream that has none
    const auto plain = GzipHeaderCodec::patch(native_hello(), keep);
    CHECK(plain.size() == native_hello().size());
}

TEST_CASE("GzipHeader: undelimitable buffers come back unchanged") {
    const Bytes tiny{0x1f, 0x8b, 8, 0};
    GzipHeader target;
    target.mtime = 99;
    CHECK(GzipHeaderCodec::patch(tiny, target) == tiny);

    Bytes noNul = preamble(gzipfmt::kFName);
    append(noNul, "unterminated", false);
    CHECK(GzipHeaderCodec::patch(noNul, target) == noNul);
}
