#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <unistd.h>

using namespace vigil;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace becomes empty", "[util]") {
    REQUIRE(trim(" \t\n ").empty());
}

// ── split / replace_all ──────────────────────────────────────────

TEST_CASE("split: splits on delimiter", "[util]") {
    auto parts = split("a,b,c", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[0] == "a");
    REQUIRE(parts[2] == "c");
}

TEST_CASE("replace_all: replaces every occurrence", "[util]") {
    REQUIRE(replace_all("a-b-c", "-", "+") == "a+b+c");
}

TEST_CASE("replace_all: empty pattern leaves input alone", "[util]") {
    REQUIRE(replace_all("abc", "", "x") == "abc");
}

// ── case helpers ─────────────────────────────────────────────────

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("Delete ALL Logs") == "delete all logs");
}

TEST_CASE("contains_ci: matches regardless of case", "[util]") {
    REQUIRE(contains_ci("Executive_Interaction", "EXECUTIVE"));
    REQUIRE_FALSE(contains_ci("file_scan", "admin"));
}

TEST_CASE("contains_ci: empty needle never matches", "[util]") {
    REQUIRE_FALSE(contains_ci("anything", ""));
}

// ── tokenize_words ───────────────────────────────────────────────

TEST_CASE("tokenize_words: lower-cases and drops punctuation", "[util]") {
    auto words = tokenize_words("Deleted logs, without BACKUP!");
    REQUIRE(words.size() == 4);
    REQUIRE(words[0] == "deleted");
    REQUIRE(words[1] == "logs");
    REQUIRE(words[3] == "backup");
}

TEST_CASE("tokenize_words: empty and symbol-only input", "[util]") {
    REQUIRE(tokenize_words("").empty());
    REQUIRE(tokenize_words("?!, ...").empty());
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex chars, distinct", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a != b);
}

TEST_CASE("generate_id: concurrent callers get distinct ids", "[util]") {
    std::vector<std::string> left, right;
    std::thread t1([&]() { for (int i = 0; i < 2000; ++i) left.push_back(generate_id()); });
    std::thread t2([&]() { for (int i = 0; i < 2000; ++i) right.push_back(generate_id()); });
    t1.join();
    t2.join();

    std::set<std::string> all(left.begin(), left.end());
    all.insert(right.begin(), right.end());
    REQUIRE(all.size() == 4000);
    for (const auto& id : all) REQUIRE(id.size() == 16);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/.vigil") == std::string(home) + "/.vigil");
    REQUIRE(expand_home("/abs/path") == "/abs/path");
}

// ── timestamps ───────────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 shape", "[util]") {
    auto ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}

TEST_CASE("timestamp_for_filename: compact shape", "[util]") {
    auto ts = timestamp_for_filename(epoch_seconds());
    REQUIRE(ts.size() == 15);
    REQUIRE(ts[8] == '_');
}

// ── SHA-256 ──────────────────────────────────────────────────────

TEST_CASE("sha256_hex: known vectors", "[util]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("sha256_file_hex: matches buffer digest", "[util]") {
    std::string path = "/tmp/vigil_test_sha_" + std::to_string(getpid()) + ".txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    auto digest = sha256_file_hex(path);
    REQUIRE(digest.has_value());
    REQUIRE(digest.value_or("") == sha256_hex("abc"));
    std::filesystem::remove(path);
}

TEST_CASE("sha256_file_hex: missing file is nullopt", "[util]") {
    REQUIRE_FALSE(sha256_file_hex("/tmp/vigil_definitely_missing_file").has_value());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parents and writes content", "[util]") {
    std::string dir = "/tmp/vigil_test_atomic_" + std::to_string(getpid());
    std::string path = dir + "/nested/file.json";
    REQUIRE(atomic_write_file(path, "{\"a\":1}"));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{\"a\":1}");
    std::filesystem::remove_all(dir);
}

// ── sanitize_excerpt ─────────────────────────────────────────────

TEST_CASE("sanitize_excerpt: truncates to max bytes", "[util]") {
    REQUIRE(sanitize_excerpt("abcdef", 3) == "abc");
}

TEST_CASE("sanitize_excerpt: never splits a multibyte character", "[util]") {
    std::string text = "h\xC3\xA9llo";                     // "héllo"
    REQUIRE(sanitize_excerpt(text, 2) == "h");
    REQUIRE(sanitize_excerpt(text, 3) == "h\xC3\xA9");
    std::string euro = "\xE2\x82\xAC\xE2\x82\xAC";      // two euro signs
    REQUIRE(sanitize_excerpt(euro, 5) == "\xE2\x82\xAC");
    REQUIRE(sanitize_excerpt(euro, 1).empty());
}

TEST_CASE("sanitize_excerpt: replaces control characters, keeps newline and tab", "[util]") {
    std::string input = std::string("a\x01") + "b\n\tc" + std::string(1, '\0') + "d";
    REQUIRE(sanitize_excerpt(input, 100) == "a b\n\tc d");
}
