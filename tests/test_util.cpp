#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace minim;

// ── Strings ──────────────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \n") == "hello");
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("split and join are inverse for simple lists", "[util]") {
    auto parts = split("a,b,,c", ',');
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[2].empty());
    REQUIRE(join(parts, ",") == "a,b,,c");
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("MiXeD 123") == "mixed 123");
}

TEST_CASE("generate_id: 16 hex chars, distinct", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a != b);
}

// ── Time ─────────────────────────────────────────────────────────

TEST_CASE("format_timestamp: UTC, second precision", "[util]") {
    REQUIRE(format_timestamp(0) == "1970-01-01T00:00:00Z");
    REQUIRE(format_timestamp(1700000000) == "2023-11-14T22:13:20Z");
}

TEST_CASE("epoch_micros tracks epoch_seconds", "[util]") {
    uint64_t s = epoch_seconds();
    uint64_t us = epoch_micros();
    REQUIRE(us / 1000000 >= s);
    REQUIRE(us / 1000000 <= s + 1);
}

// ── Encoding and digests ─────────────────────────────────────────

TEST_CASE("base64_encode: RFC 4648 vectors", "[util]") {
    REQUIRE(base64_encode("").empty());
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_decode: padded, unpadded and url-safe input", "[util]") {
    REQUIRE(base64_decode("Zm9vYmFy") == "foobar");
    REQUIRE(base64_decode("Zm8=") == "fo");
    REQUIRE(base64_decode("Zm8") == "fo");
    REQUIRE(base64_decode("YWJjMTIzc2VjcmV0") == "abc123secret");
}

TEST_CASE("base64url_encode: no padding, url alphabet", "[util]") {
    const unsigned char data[] = {0xfb, 0xff};
    REQUIRE(base64url_encode(data, 2) == "-_8");
}

TEST_CASE("md5_hex and sha256_hex: known digests", "[util]") {
    REQUIRE(md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ── Files ────────────────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent dir and replaces content", "[util]") {
    std::string dir = "/tmp/minim_test_util_" + std::to_string(getpid());
    std::string path = dir + "/nested/file.txt";

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("expand_home: replaces leading tilde only", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    }
    REQUIRE(expand_home("/abs/~x") == "/abs/~x");
}
