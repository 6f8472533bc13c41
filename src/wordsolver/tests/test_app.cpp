#include "wordsolver/app.h"
#include <gtest/gtest.h>
#include <sstream>

using namespace wps::app;
using wps::word_db::WordDB;

namespace {
	const char kWordList[] = "cat\ncot\ncut\ncast\nate\neat\ntea\neta\ntear\n";

	class AppRun : public ::testing::Test {
	protected:
		void SetUp() override {
			dir = std::filesystem::temp_directory_path() /
				(std::string("wps_app_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
			std::filesystem::remove_all(dir);
			std::filesystem::create_directories(dir);
			out = tmpfile();
			err = tmpfile();
			ASSERT_TRUE(out);
			ASSERT_TRUE(err);
		}

		void TearDown() override {
			if (out) {
				fclose(out);
			}
			if (err) {
				fclose(err);
			}
			std::error_code ec;
			std::filesystem::remove_all(dir, ec);
		}

		void write_file(const char* name, const std::string& contents) {
			File f((dir / name).string().c_str(), "wb");
			ASSERT_TRUE(f);
			if (!contents.empty()) {
				ASSERT_EQ(fwrite(contents.data(), contents.size(), 1, f), 1u);
			}
		}

		static std::string contents(FILE* f) {
			fflush(f);
			rewind(f);
			std::string text;
			char buf[4096];
			for (size_t n; (n = fread(buf, 1, sizeof(buf), f)) > 0; ) {
				text.append(buf, n);
			}
			return text;
		}

		int run_lines_of(const std::string& input, const Options& opts = Options()) {
			std::istringstream in(input);
			return run(opts, dir, in, out, err);
		}

		std::filesystem::path dir;
		FILE* out = nullptr;
		FILE* err = nullptr;
	};
}

TEST_F(AppRun, stdin_lines) {
	write_file(kDefaultListName, kWordList);
	ASSERT_EQ(run_lines_of("?c*t\n\n!!\naet\n"), 0);
	EXPECT_EQ(contents(out),
		"Hint: ca...\n"
		"4 possible words\n======================\n"
		"    ate\n    eat\n    tea\n    eta\n");
	EXPECT_EQ(contents(err), "");
}

TEST_F(AppRun, empty_patterns_print_nothing) {
	write_file(kDefaultListName, kWordList);
	Options opts;
	opts.patterns = { "", "123", "?!" };
	ASSERT_EQ(run_lines_of("", opts), 0);
	EXPECT_EQ(contents(out), "");

	ASSERT_EQ(run_lines_of("\n  \n?\n?12\n"), 0);
	EXPECT_EQ(contents(out), "");
}

TEST_F(AppRun, hint_flag_and_no_match) {
	write_file(kDefaultListName, kWordList);
	Options opts;
	opts.hint = true;
	opts.patterns = { "tae", "zzz" };
	ASSERT_EQ(run_lines_of("", opts), 0);
	EXPECT_EQ(contents(out), "Hint: at...\nHint: No hints available\n");
}

TEST_F(AppRun, limit_and_bounds) {
	write_file(kDefaultListName, kWordList);
	Options opts;
	opts.limit = 2;
	opts.bounds = wps::solver::LengthBounds::between(3, 3);
	opts.patterns = { "**t*" };
	ASSERT_EQ(run_lines_of("", opts), 0);
	EXPECT_EQ(contents(out),
		"7 possible words (showing 2)\n======================\n"
		"    cat\n    cot\n");
}

TEST_F(AppRun, builds_cache_from_word_list) {
	write_file(kDefaultListName, kWordList);
	ASSERT_EQ(run_lines_of("c*t\n"), 0);

	// no timing output without -t.
	EXPECT_EQ(contents(out), "3 possible words\n======================\n    cat\n    cot\n    cut\n");

	WordDB cached;
	ASSERT_TRUE(cached.load(dir / kDefaultCacheName));
	WordDB listed;
	ASSERT_TRUE(listed.load(dir / kDefaultListName));
	EXPECT_TRUE(cached.is_equivalent(listed));

	// the cache alone is enough from now on.
	std::filesystem::remove(dir / kDefaultListName);
	WordDB reloaded;
	EXPECT_TRUE(load_default_db(reloaded, dir, false));
	EXPECT_TRUE(reloaded.is_equivalent(listed));
}

TEST_F(AppRun, bad_cache_falls_back_to_word_list) {
	write_file(kDefaultListName, kWordList);
	write_file(kDefaultCacheName, "not a cache");

	WordDB db;
	ASSERT_TRUE(load_default_db(db, dir, false));
	EXPECT_EQ(db.size(), 9u);

	WordDB rewritten;
	ASSERT_TRUE(rewritten.load(dir / kDefaultCacheName));
	EXPECT_TRUE(rewritten.is_equivalent(db));
}

TEST_F(AppRun, missing_dictionary_fails) {
	ASSERT_EQ(run_lines_of("c*t\n"), 1);
	EXPECT_EQ(contents(out), "");
	const auto expected = "Failed to load dictionary " + (dir / kDefaultListName).string() + ".\n";
	EXPECT_EQ(contents(err), expected);
	EXPECT_FALSE(std::filesystem::exists(dir / kDefaultCacheName));
}

TEST_F(AppRun, missing_explicit_dictionary_fails) {
	write_file(kDefaultListName, kWordList);
	Options opts;
	opts.dict_path = dir / "other.txt";
	ASSERT_EQ(run_lines_of("c*t\n", opts), 1);
	EXPECT_EQ(contents(err), "Failed to load dictionary " + opts.dict_path.string() + ".\n");
}

TEST_F(AppRun, long_words_print_whole) {
	const std::string long_word(wps::word_db::Word::kMaxLength, 'a');
	write_file(kDefaultListName, long_word + "\n");
	Options opts;
	opts.patterns = { std::string(long_word.size() + 10, '*') };
	ASSERT_EQ(run_lines_of("", opts), 0);
	EXPECT_EQ(contents(out), "1 possible words\n======================\n    " + long_word + "\n");
}
