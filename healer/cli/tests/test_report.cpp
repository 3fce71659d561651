#include <catch2/catch_all.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../cli.hpp"
#include "../report.hpp"
#include "../../recovery/include/native_compress.hpp"
#include "../../recovery/tests/test_helpers.hpp"

using namespace healer::cli;
using namespace healer::recovery::testing;
using healer::recovery::Bytes;
using nlohmann::json;

TEST_CASE("Report: recovery counts") {
    healer::recovery::RecoveryResult r;
    r.recovered = 3;
    r.gzipped = 1;
    r.missing = 2;

    const json j = toJson(r);
    CHECK(j["recovered"] == 3);
    CHECK(j["gzipped"] == 1);
    CHECK(j["skipped"] == 0);
    CHECK(j["missing"] == 2);
}

TEST_CASE("Report: gzip header fields") {
    healer::recovery::GzipHeader h;
    h.mtime = 1234567890;
    h.os = 3;
    h.flags = 0x08;
    h.fname = bytes_of("data.txt");

    const json j = toJson(h);
    CHECK(j["format"] == "gzip");
    CHECK(j["mtime"] == 1234567890u);
    CHECK(j["os"] == 3);
    CHECK(j["flag_names"] == json::array({"FNAME"}));
    CHECK(j["fname"] == "data.txt");
    CHECK_FALSE(j.contains("fcomment"));
    CHECK_FALSE(j.contains("extra_bytes"));
}

TEST_CASE("Report: non-UTF-8 names still dump") {
    healer::recovery::GzipHeader h;
    h.flags = 0x08;
    h.fname = Bytes{'a', 0xFF, 'b'};

    std::string text;
    REQUIRE_NOTHROW(text = dumpReport(toJson(h)));
    CHECK(text.find("\"fname\"") != std::string::npos);
}

TEST_CASE("Report: bzip2 header and verify map") {
    const json b = toJson(healer::recovery::Bzip2Header{5});
    CHECK(b["format"] == "bzip2");
    CHECK(b["block_size"] == 500000);

    const json v = verifyToJson({{"a.gz", true}, {"b.gz", false}});
    CHECK(v["a.gz"] == true);
    CHECK(v["b.gz"] == false);
}

TEST_CASE("CLI: --json header info parses as one document") {
    TempDir dir("cli_json");
    Bytes gz{0x1f, 0x8b, 8, 0, 0, 0, 0, 0, 0, 3};
    write_file(dir / "partial/a.gz", gz);
    write_file(dir / "partial/b.bz2", bytes_of("BZh7...."));
    write_file(dir / "partial/broken.gz", bytes_of("nope"));

    std::vector<std::string> args{(dir / "t.torrent").string(), (dir / "raw").string(),
                                  (dir / "partial").string(), (dir / "target").string(),
                                  "--header-info", "--json"};
    std::ostringstream out, err;
    REQUIRE(runCli(args, out, err) == 0);

    const json doc = json::parse(out.str());
    CHECK(doc["a.gz"]["os"] == 3);
    CHECK(doc["b.bz2"]["level"] == 7);
    CHECK(doc["broken.gz"].is_null());
}

TEST_CASE("CLI: --json recovery summary") {
    TempDir dir("cli_json");
    std::filesystem::create_directories(dir / "raw");
    std::filesystem::create_directories(dir / "partial");

    // a torrent with no .gz/.bz2 entries leaves every count at zero
    const std::string torrent =
        "d4:infod6:lengthi3e4:name5:a.txt12:piece lengthi16384e6:pieces20:aaaaaaaaaaaaaaaaaaaaee";
    write_file(dir / "t.torrent", Bytes(torrent.begin(), torrent.end()));

    std::vector<std::string> args{(dir / "t.torrent").string(), (dir / "raw").string(),
                                  (dir / "partial").string(), (dir / "target").string(),
                                  "--json", "--log-level", "none"};
    std::ostringstream out, err;
    REQUIRE(runCli(args, out, err) == 0);

    const json doc = json::parse(out.str());
    CHECK(doc == json{{"recovered", 0}, {"gzipped", 0}, {"skipped", 0}, {"missing", 0}});
}

TEST_CASE("CLI: --json keeps log lines off stdout") {
    TempDir dir("cli_json");
    std::filesystem::create_directories(dir / "raw");
    std::filesystem::create_directories(dir / "partial");

    // one .gz entry with neither raw nor partial: logged as missing
    const std::string torrent =
        "d4:infod6:lengthi3e4:name8:a.txt.gz12:piece lengthi16384e6:pieces20:aaaaaaaaaaaaaaaaaaaaee";
    write_file(dir / "t.torrent", Bytes(torrent.begin(), torrent.end()));

    std::vector<std::string> args{(dir / "t.torrent").string(), (dir / "raw").string(),
                                  (dir / "partial").string(), (dir / "target").string(), "--json"};

    std::ostringstream capOut, capErr;
    auto* oldOut = std::cout.rdbuf(capOut.rdbuf());
    auto* oldErr = std::cerr.rdbuf(capErr.rdbuf());
    const int rc = runCli(args, std::cout, std::cerr);
    std::cout.rdbuf(oldOut);
    std::cerr.rdbuf(oldErr);

    CHECK(rc == 2);
    json doc;
    REQUIRE_NOTHROW(doc = json::parse(capOut.str()));
    CHECK(doc["missing"] == 1);
    CHECK(capErr.str().find("outcome=missing") != std::string::npos);
}
