#include "../framework/SimpleTest.hpp"
#include "../framework/Fixtures.hpp"
#include "util/BoyerMoore.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Platform.hpp"
#include "util/TimSort.hpp"
#include "util/UnicodeUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <random>
#include <utility>
#include <vector>

using namespace cadence::util;
using cadence::test::TempDir;

TEST_CASE(test_timsort_sorts) {
    std::vector<int> v = {5, 3, 9, 1, 4, 8, 2, 7, 6, 0};
    timsort(v, std::less<int>());
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(v[i], i);
    }
}

TEST_CASE(test_timsort_is_stable) {
    // Key, original position. Many equal keys over several runs.
    std::mt19937 rng(7);
    std::vector<std::pair<int, int>> v;
    for (int i = 0; i < 500; ++i) {
        v.push_back({static_cast<int>(rng() % 10), i});
    }
    auto expected = v;
    auto by_key = [](const auto& a, const auto& b) { return a.first < b.first; };
    std::stable_sort(expected.begin(), expected.end(), by_key);
    timsort(v, by_key);
    ASSERT_TRUE(v == expected);
}

TEST_CASE(test_timsort_descending_and_sorted_input) {
    std::vector<int> down;
    for (int i = 200; i > 0; --i) down.push_back(i);
    timsort(down, std::less<int>());
    ASSERT_TRUE(std::is_sorted(down.begin(), down.end()));

    std::vector<int> up = down;
    timsort(up, std::less<int>());
    ASSERT_TRUE(up == down);
}

TEST_CASE(test_min_run_length) {
    ASSERT_EQ(min_run_length(10), 10u);
    ASSERT_EQ(min_run_length(64), 32u);
    ASSERT_EQ(min_run_length(65), 33u);
}

TEST_CASE(test_boyer_moore_search) {
    BoyerMooreSearch bm("love", true);
    ASSERT_EQ(bm.search("all you need is love"), 16);
    ASSERT_EQ(bm.search("lovelove", 1), 4);
    ASSERT_EQ(bm.search("glove"), 1);
    ASSERT_EQ(bm.search("lov"), -1);
    ASSERT_FALSE(bm.matches("Love"));
}

TEST_CASE(test_boyer_moore_case_insensitive) {
    BoyerMooreSearch bm("LOVE");
    ASSERT_TRUE(bm.matches("Lovely Day"));
}

TEST_CASE(test_boyer_moore_empty_pattern_matches_all) {
    BoyerMooreSearch bm("", true);
    ASSERT_TRUE(bm.matches(""));
    ASSERT_TRUE(bm.matches("anything"));
}

TEST_CASE(test_normalize_for_search) {
    ASSERT_EQ(normalize_for_search("Björk"), std::string("bjork"));
    ASSERT_EQ(normalize_for_search("Sigur Rós"), std::string("sigur ros"));
    ASSERT_EQ(normalize_for_search("ABC"), std::string("abc"));
    ASSERT_EQ(normalize_for_search(""), std::string(""));
}

TEST_CASE(test_fold_case) {
    ASSERT_EQ(fold_case("Hello"), fold_case("hELLO"));
    ASSERT_EQ(fold_case("STRASSE"), std::string("strasse"));
}

TEST_CASE(test_pop_utf8_char) {
    std::string s = "aé";
    pop_utf8_char(s);
    ASSERT_EQ(s, std::string("a"));
    pop_utf8_char(s);
    ASSERT_EQ(s, std::string(""));
    pop_utf8_char(s);
    ASSERT_EQ(s, std::string(""));

    std::string cjk = "x日本";
    pop_utf8_char(cjk);
    ASSERT_EQ(cjk, std::string("x日"));
}

TEST_CASE(test_audio_extensions) {
    ASSERT_TRUE(DirectoryScanner::is_audio_extension("song.mp3"));
    ASSERT_TRUE(DirectoryScanner::is_audio_extension("Song.FLAC"));
    ASSERT_TRUE(DirectoryScanner::is_audio_extension("a.b.wav"));
    ASSERT_TRUE(DirectoryScanner::is_audio_extension("x.m4a"));
    ASSERT_FALSE(DirectoryScanner::is_audio_extension("cover.jpg"));
    ASSERT_FALSE(DirectoryScanner::is_audio_extension("mp3"));
    ASSERT_FALSE(DirectoryScanner::is_audio_extension("notes.txt"));
}

TEST_CASE(test_directory_scan_recursive_and_sorted) {
    TempDir dir("scan");
    dir.write("b.mp3", "x");
    dir.write("a.ogg", "x");
    dir.write("nested/deeper/c.flac", "x");
    dir.write("nested/readme.txt", "x");
    dir.write("cover.jpg", "x");

    auto result = DirectoryScanner::scan_directory(dir.path());
    ASSERT_EQ(result.audio_files.size(), 3u);
    ASSERT_TRUE(std::is_sorted(result.audio_files.begin(), result.audio_files.end()));
    ASSERT_EQ(result.audio_files[0], (dir.path() / "a.ogg").string());
    ASSERT_EQ(result.audio_files[2], (dir.path() / "nested/deeper/c.flac").string());
}

TEST_CASE(test_directory_scan_missing_root) {
    auto result = DirectoryScanner::scan_directory("/nonexistent/cadence/dir");
    ASSERT_TRUE(result.audio_files.empty());
}

TEST_CASE(test_expand_home) {
    ASSERT_EQ(Platform::expand_home("/abs/path").string(), std::string("/abs/path"));
    ASSERT_EQ(Platform::expand_home("~other/x").string(), std::string("~other/x"));
    if (const char* home = std::getenv("HOME"); home && *home) {
        auto expanded = Platform::expand_home("~/Music");
        ASSERT_EQ(expanded, std::filesystem::path(home) / "Music");
    }
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
