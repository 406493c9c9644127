#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace callgate;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: mixed case header name", "[util]") {
    REQUIRE(to_lower("User-Agent") == "user-agent");
    REQUIRE(to_lower("").empty());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/.callgate");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
}

// ── url_encode / form_encode ─────────────────────────────────────

TEST_CASE("url_encode: unreserved characters pass through", "[util]") {
    REQUIRE(url_encode("AZaz09-_.~") == "AZaz09-_.~");
}

TEST_CASE("url_encode: reserved and non-ASCII bytes are escaped", "[util]") {
    REQUIRE(url_encode("a b&c=d") == "a%20b%26c%3Dd");
    REQUIRE(url_encode("/?#") == "%2F%3F%23");
    REQUIRE(url_encode("\xC3\xA9") == "%C3%A9");
}

TEST_CASE("form_encode: joins pairs in the given order", "[util]") {
    REQUIRE(form_encode({{"q", "coffee shop"}, {"page", "2"}}) == "q=coffee%20shop&page=2");
    REQUIRE(form_encode({}).empty());
}

// ── sha256_hex ───────────────────────────────────────────────────

TEST_CASE("sha256_hex: known digests", "[util]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parents and replaces content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("callgate_util_" + std::to_string(getpid()));
    auto path = (dir / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("atomic_write_file: fails when parent is a file", "[util]") {
    auto blocker = std::filesystem::temp_directory_path() /
                   ("callgate_util_blocker_" + std::to_string(getpid()));
    { std::ofstream(blocker) << "x"; }

    REQUIRE_FALSE(atomic_write_file((blocker / "child.json").string(), "data"));

    std::filesystem::remove(blocker);
}

// ── epoch_seconds / timestamp_now ────────────────────────────────

TEST_CASE("epoch_seconds: is after 2020", "[util]") {
    REQUIRE(epoch_seconds() > 1577836800ULL);
}

TEST_CASE("timestamp_now: ISO 8601 UTC shape", "[util]") {
    std::string ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}
