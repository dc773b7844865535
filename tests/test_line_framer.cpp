#include "line_framer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <vector>

using test_support::append_file;
using test_support::temp_dir;
using test_support::write_file;

TEST(line_framer, splits_complete_lines) {
    session_tail::line_framer framer;
    auto lines = framer.feed("a\nb\nc\n");

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[2], "c");
    EXPECT_TRUE(framer.pending().empty());
}

TEST(line_framer, holds_partial_line_until_terminated) {
    session_tail::line_framer framer;

    auto first = framer.feed("{\"a\":1}\n{\"b\":");
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(framer.pending(), "{\"b\":");

    EXPECT_TRUE(framer.feed("2").empty());

    auto second = framer.feed("}\n");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0], "{\"b\":2}");
    EXPECT_TRUE(framer.pending().empty());
}

TEST(line_framer, reassembles_multibyte_codepoint_split_across_chunks) {
    session_tail::line_framer framer;
    const std::string euro = "\xE2\x82\xAC";  // U+20AC

    EXPECT_TRUE(framer.feed("price " + euro.substr(0, 2)).empty());
    auto lines = framer.feed(euro.substr(2) + "5\n");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "price " + euro + "5");
}

TEST(line_framer, any_three_way_split_yields_the_same_lines) {
    // Two- three- and four-byte sequences, CRLF and a blank line
    const std::string text =
        "\xCE\xB1\xCE\xB2\n{\"k\":\"\xE2\x82\xAC\"}\r\n\nlast \xF0\x9F\x99\x82 line\n";
    const std::vector<std::string> expected = {
        "\xCE\xB1\xCE\xB2", "{\"k\":\"\xE2\x82\xAC\"}", "last \xF0\x9F\x99\x82 line"};

    for (std::size_t i = 0; i <= text.size(); ++i) {
        for (std::size_t j = i; j <= text.size(); ++j) {
            session_tail::line_framer framer;
            std::vector<std::string> lines;
            for (auto& piece : {text.substr(0, i), text.substr(i, j - i), text.substr(j)}) {
                auto out = framer.feed(piece);
                lines.insert(lines.end(), out.begin(), out.end());
            }
            EXPECT_EQ(lines, expected) << "split at " << i << ", " << j;
            EXPECT_TRUE(framer.pending().empty());
        }
    }
}

TEST(line_framer, strips_carriage_return_and_skips_blank_lines) {
    session_tail::line_framer framer;
    auto lines = framer.feed("one\r\n\n   \r\ntwo\n");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
}

TEST(line_framer, reset_discards_pending_tail) {
    session_tail::line_framer framer;
    framer.feed("stale");
    framer.reset();

    auto lines = framer.feed("fresh\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "fresh");
}

TEST(tail_cursor, reads_only_new_content) {
    temp_dir dir;
    auto path = dir.file("log.jsonl");
    write_file(path, "one\ntwo\n");

    session_tail::tail_cursor cursor;
    auto r1 = cursor.read_from(path, 1024);
    ASSERT_EQ(r1.lines.size(), 2u);
    EXPECT_EQ(r1.bytes_read, 8u);
    EXPECT_EQ(cursor.offset(), 8u);

    auto r2 = cursor.read_from(path, 1024);
    EXPECT_TRUE(r2.lines.empty());
    EXPECT_EQ(r2.bytes_read, 0u);

    append_file(path, "three\n");
    auto r3 = cursor.read_from(path, 1024);
    ASSERT_EQ(r3.lines.size(), 1u);
    EXPECT_EQ(r3.lines[0], "three");
}

TEST(tail_cursor, offset_advances_past_partial_line) {
    temp_dir dir;
    auto path = dir.file("log.jsonl");
    write_file(path, "done\npart");

    session_tail::tail_cursor cursor;
    auto r1 = cursor.read_from(path, 1024);
    ASSERT_EQ(r1.lines.size(), 1u);
    EXPECT_EQ(cursor.offset(), 9u);
    EXPECT_EQ(cursor.framer().pending(), "part");

    append_file(path, "ial\n");
    auto r2 = cursor.read_from(path, 1024);
    ASSERT_EQ(r2.lines.size(), 1u);
    EXPECT_EQ(r2.lines[0], "partial");
}

TEST(tail_cursor, respects_max_bytes_per_read) {
    temp_dir dir;
    auto path = dir.file("log.jsonl");
    write_file(path, "aaaa\nbbbb\ncccc\n");

    session_tail::tail_cursor cursor;
    auto r1 = cursor.read_from(path, 7);
    EXPECT_EQ(r1.bytes_read, 7u);
    ASSERT_EQ(r1.lines.size(), 1u);

    auto r2 = cursor.read_from(path, 7);
    ASSERT_EQ(r2.lines.size(), 1u);
    EXPECT_EQ(r2.lines[0], "bbbb");

    auto r3 = cursor.read_from(path, 7);
    ASSERT_EQ(r3.lines.size(), 1u);
    EXPECT_EQ(r3.lines[0], "cccc");
}

TEST(tail_cursor, truncation_restarts_from_beginning) {
    temp_dir dir;
    auto path = dir.file("log.jsonl");
    write_file(path, "first line\nsecond line\npending");

    session_tail::tail_cursor cursor;
    cursor.read_from(path, 1024);
    ASSERT_FALSE(cursor.framer().pending().empty());

    write_file(path, "new\n");
    auto r = cursor.read_from(path, 1024);
    EXPECT_TRUE(r.truncated);
    ASSERT_EQ(r.lines.size(), 1u);
    EXPECT_EQ(r.lines[0], "new");
    EXPECT_EQ(cursor.offset(), 4u);
}

TEST(tail_cursor, seek_to_end_skips_existing_content) {
    temp_dir dir;
    auto path = dir.file("log.jsonl");
    write_file(path, "old\n");

    session_tail::tail_cursor cursor;
    cursor.seek_to_end(path);
    EXPECT_TRUE(cursor.read_from(path, 1024).lines.empty());

    append_file(path, "new\n");
    auto r = cursor.read_from(path, 1024);
    ASSERT_EQ(r.lines.size(), 1u);
    EXPECT_EQ(r.lines[0], "new");
}

TEST(tail_cursor, missing_file_throws_no_such_file) {
    temp_dir dir;
    session_tail::tail_cursor cursor;

    try {
        cursor.read_from(dir.file("absent.jsonl"), 1024);
        FAIL() << "expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
    }
    EXPECT_EQ(cursor.offset(), 0u);
}
