#include <catch2/catch_all.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "../cli.hpp"
#include "../../recovery/include/hashing.hpp"
#include "../../recovery/include/native_compress.hpp"
#include "../../recovery/tests/test_helpers.hpp"
#include "../../../include/bencode/bencode.hpp"

using namespace healer::cli;
using namespace healer::recovery::testing;
using healer::recovery::Bytes;
using bencode::BencodeValue;

// ---------- Helpers ----------

static std::vector<std::string> positional(const TempDir& dir) {
    return {(dir / "t.torrent").string(), (dir / "raw").string(), (dir / "partial").string(), (dir / "target").string()};
}

static void write_torrent(const std::filesystem::path& p, const std::string& fileName, const Bytes& full) {
    const auto h = healer::recovery::sha1(full);
    BencodeValue::Dict info;
    info["name"] = BencodeValue(fileName);
    info["length"] = BencodeValue(static_cast<int64_t>(full.size()));
    info["piece length"] = BencodeValue(int64_t(524288));
    info["pieces"] = BencodeValue(std::string(h.begin(), h.end()));

    BencodeValue::Dict root;
    root["info"] = BencodeValue(std::move(info));
    const auto enc = bencode::BencodeParser::encode(BencodeValue(std::move(root)));
    write_file(p, Bytes(enc.begin(), enc.end()));
}

// ---------- Option parsing ----------

TEST_CASE("CLI: positional arguments and flags") {
    auto r = parseCliOptions({"a.torrent", "raw", "partial", "target", "--raw-fallback", "--dry-run",
                              "--log-level", "debug", "--log-file", "run.log"});
    REQUIRE(r.has_value());
    const auto& o = r.get();
    CHECK(o.torrent == "a.torrent");
    CHECK(o.targetDir == "target");
    CHECK(o.mode == Mode::recover);
    CHECK(o.rawFallback);
    CHECK(o.dryRun);
    CHECK_FALSE(o.overwrite);
    CHECK(o.logLevel == healer::logger::LogLevel::debug);
    CHECK(o.logFile == "run.log");
}

TEST_CASE("CLI: modes") {
    CHECK(parseCliOptions({"t", "r", "p", "o", "--header-info"}).get().mode == Mode::headerInfo);
    CHECK(parseCliOptions({"t", "r", "p", "o", "--verify-only"}).get().mode == Mode::verifyOnly);
    CHECK(parseCliOptions({"--help"}).get().mode == Mode::help);
}

TEST_CASE("CLI: usage errors") {
    CHECK_FALSE(parseCliOptions({"t", "r", "p"}).has_value());
    CHECK_FALSE(parseCliOptions({"t", "r", "p", "o", "extra"}).has_value());
    CHECK_FALSE(parseCliOptions({"t", "r", "p", "o", "--bogus"}).has_value());
    CHECK_FALSE(parseCliOptions({"t", "r", "p", "o", "--log-level"}).has_value());
    CHECK_FALSE(parseCliOptions({"t", "r", "p", "o", "--log-level", "loud"}).has_value());

    std::ostringstream out, err;
    CHECK(runCli({"only-one"}, out, err) == 1);
    CHECK(err.str().find("Usage:") != std::string::npos);
}

// ---------- Commands ----------

TEST_CASE("CLI: header info prints every compressed partial and needs no torrent") {
    TempDir dir("cli");
    Bytes gz{0x1f, 0x8b, 8, 0, 0, 0, 0, 0, 0, 3};
    const std::string data = "test data";
    gz.insert(gz.end(), data.begin(), data.end());
    write_file(dir / "partial/test.gz", gz);
    write_file(dir / "partial/sub/x.bz2", bytes_of("BZh9...."));
    write_file(dir / "partial/readme.txt", bytes_of("ignored"));

    auto args = positional(dir);
    args.emplace_back("--header-info");
    std::ostringstream out, err;
    CHECK(runCli(args, out, err) == 0);
    CHECK(out.str().find("== test.gz ==") != std::string::npos);
    CHECK(out.str().find("OS: 3 (Unix)") != std::string::npos);
    CHECK(out.str().find("== sub/x.bz2 ==") != std::string::npos);
    CHECK(out.str().find("compression level: 9") != std::string::npos);
    CHECK(out.str().find("readme") == std::string::npos);
}

TEST_CASE("CLI: verify-only exit status follows the results") {
    TempDir dir("cli");
    const auto raw = bytes_of("verify me");
    const auto full = healer::recovery::nativeGzip(raw, 9, 0).get();
    write_torrent(dir / "t.torrent", "v.txt.gz", full);
    write_file(dir / "raw/v.txt", raw);
    write_file(dir / "partial/v.txt.gz", full);

    auto args = positional(dir);
    args.emplace_back("--verify-only");
    std::ostringstream out, err;
    CHECK(runCli(args, out, err) == 0);
    CHECK(out.str().find("OK   v.txt.gz") != std::string::npos);

    write_file(dir / "raw/v.txt", bytes_of("tampered"));
    std::ostringstream out2, err2;
    CHECK(runCli(args, out2, err2) == 1);
    CHECK(out2.str().find("FAIL v.txt.gz") != std::string::npos);
}

TEST_CASE("CLI: recovery exit codes") {
    TempDir dir("cli");
    const auto raw = bytes_of("recover me");
    const auto full = healer::recovery::nativeGzip(raw, 9, 0).get();
    write_torrent(dir / "t.torrent", "r.txt.gz", full);
    std::filesystem::create_directories(dir / "raw");
    std::filesystem::create_directories(dir / "partial");

    auto args = positional(dir);
    args.emplace_back("--log-level");
    args.emplace_back("none");
    std::ostringstream out, err;
    CHECK(runCli(args, out, err) == 2);
    CHECK(out.str().find("missing:   1") != std::string::npos);

    // the complete partial is taken as is
    write_file(dir / "partial/r.txt.gz", full);
    std::ostringstream out2, err2;
    CHECK(runCli(args, out2, err2) == 0);
    CHECK(read_file(dir / "target/r.txt.gz/r.txt.gz") == full);
}

TEST_CASE("CLI: hard errors are reported and exit 1") {
    TempDir dir("cli");
    std::ostringstream out, err;
    CHECK(runCli(positional(dir), out, err) == 1);
    CHECK(err.str().rfind("Error: ", 0) == 0);
}
