/**
 * Copyright (c) 2026, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file test_log_reader.cc
 */

#include <string>

#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "log_reader.hh"
#include "test_log_file.hh"

using namespace logline;
using namespace std::string_literals;

static log_reader
open_reader(const test_log_file& tlf, const reader_config& cfg = reader_config{})
{
    auto open_res = log_reader::open(tlf.get_path(), cfg);

    if (open_res.isErr()) {
        FAIL(open_res.unwrapErr());
    }

    return open_res.unwrap();
}

TEST_CASE("log_reader::read_tail")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 10)));

    auto reader = open_reader(tlf);
    auto tail = reader.read_tail(5).unwrap();

    REQUIRE(tail.tr_entries.size() == 5);
    CHECK(tail.tr_entries.front().le_line_number == 6);
    CHECK(tail.tr_entries.front().le_content == "line 6");
    CHECK(tail.tr_entries.front().le_byte_offset == 35);
    CHECK(tail.tr_entries.back().le_line_number == 10);
    CHECK(tail.tr_entries.back().le_content == "line 10");
    CHECK(tail.tr_start_offset == 35);
    CHECK(tail.tr_total_lines == 10);
    CHECK(reader.get_offset() == 71);
    CHECK(reader.get_line_count() == 10);
    CHECK(std::string(reader.get_encoding_name()) == "UTF-8");

    SUBCASE("more lines than the file has")
    {
        auto all = reader.read_tail(100).unwrap();

        CHECK(all.tr_entries.size() == 10);
        CHECK(all.tr_start_offset == 0);
        CHECK(all.tr_total_lines == 10);
    }
}

TEST_CASE("log_reader::empty-file")
{
    test_log_file tlf;
    auto reader = open_reader(tlf);
    auto tail = reader.read_tail(5).unwrap();

    CHECK(tail.tr_entries.empty());
    CHECK(tail.tr_start_offset == 0);
    CHECK(tail.tr_total_lines == 0);
    CHECK_FALSE(reader.has_new_content().unwrap());

    REQUIRE(tlf.append("hello\n"));
    CHECK(reader.has_new_content().unwrap());

    auto new_lines = reader.read_new_lines().unwrap();
    CHECK_FALSE(new_lines.nlr_rotated);
    REQUIRE(new_lines.nlr_entries.size() == 1);
    CHECK(new_lines.nlr_entries[0].le_line_number == 1);
    CHECK(new_lines.nlr_entries[0].le_content == "hello");

    SUBCASE("nothing is read twice")
    {
        CHECK_FALSE(reader.has_new_content().unwrap());
        CHECK(reader.read_new_lines().unwrap().nlr_entries.empty());
    }
}

TEST_CASE("log_reader::partial-lines")
{
    test_log_file tlf;

    REQUIRE(tlf.write("first\nsec"));

    auto reader = open_reader(tlf);
    auto tail = reader.read_tail(5).unwrap();

    REQUIRE(tail.tr_entries.size() == 2);
    CHECK(tail.tr_entries[1].le_content == "sec");
    CHECK(reader.get_offset() == 9);

    REQUIRE(tlf.append("ond\nthird\n"));

    auto new_lines = reader.read_new_lines().unwrap();
    REQUIRE(new_lines.nlr_entries.size() == 2);
    CHECK(new_lines.nlr_entries[0].le_content == "ond");
    CHECK(new_lines.nlr_entries[0].le_line_number == 3);
    CHECK(new_lines.nlr_entries[1].le_content == "third");
}

TEST_CASE("log_reader::truncation")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 10)));

    auto reader = open_reader(tlf);
    reader.read_tail(5).unwrap();

    REQUIRE(tlf.write("new\n"));
    CHECK(reader.has_new_content().unwrap());

    auto new_lines = reader.read_new_lines().unwrap();
    CHECK(new_lines.nlr_rotated);
    REQUIRE(new_lines.nlr_entries.size() == 1);
    CHECK(new_lines.nlr_entries[0].le_line_number == 1);
    CHECK(new_lines.nlr_entries[0].le_content == "new");
    CHECK(reader.get_offset() == 4);
    CHECK(reader.get_line_count() == 1);
}

TEST_CASE("log_reader::replacement")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 3)));

    auto reader = open_reader(tlf);
    reader.read_tail(5).unwrap();

    // the new file is bigger than the old one, only the inode gives it away
    REQUIRE(tlf.replace(numbered_lines(100, 5)));
    CHECK(reader.has_new_content().unwrap());

    auto new_lines = reader.read_new_lines().unwrap();
    CHECK(new_lines.nlr_rotated);
    REQUIRE(new_lines.nlr_entries.size() == 5);
    CHECK(new_lines.nlr_entries[0].le_line_number == 1);
    CHECK(new_lines.nlr_entries[0].le_content == "line 100");

    REQUIRE(tlf.append("line 105\n"));
    new_lines = reader.read_new_lines().unwrap();
    CHECK_FALSE(new_lines.nlr_rotated);
    REQUIRE(new_lines.nlr_entries.size() == 1);
    CHECK(new_lines.nlr_entries[0].le_line_number == 6);
}

TEST_CASE("log_reader::rotation-then-read-error")
{
    test_log_file tlf;
    auto path = tlf.get_path().string();

    REQUIRE(tlf.write(numbered_lines(1, 10)));

    auto reader = open_reader(tlf);
    reader.read_tail(5).unwrap();

    // a directory at the path can be opened but not read
    REQUIRE(unlink(path.c_str()) == 0);
    REQUIRE(mkdir(path.c_str(), 0700) == 0);

    CHECK(reader.read_new_lines().isErr());
    CHECK(reader.is_reset_pending());
    CHECK(reader.has_new_content().unwrap());

    auto new_path = path + ".new";
    auto* file = fopen(new_path.c_str(), "w");
    REQUIRE(file != nullptr);
    fputs("fresh\n", file);
    fclose(file);
    REQUIRE(rmdir(path.c_str()) == 0);
    REQUIRE(rename(new_path.c_str(), path.c_str()) == 0);

    auto new_lines = reader.read_new_lines().unwrap();
    CHECK(new_lines.nlr_rotated);
    CHECK_FALSE(reader.is_reset_pending());
    REQUIRE(new_lines.nlr_entries.size() == 1);
    CHECK(new_lines.nlr_entries[0].le_line_number == 1);
    CHECK(new_lines.nlr_entries[0].le_content == "fresh");

    new_lines = reader.read_new_lines().unwrap();
    CHECK_FALSE(new_lines.nlr_rotated);
}

TEST_CASE("log_reader::anchors-are-bounded")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 600)));

    auto reader = open_reader(tlf);
    auto tail = reader.read_tail(1).unwrap();
    auto start_offset = tail.tr_start_offset;

    for (size_t line_number = 599; line_number > 0; line_number--) {
        auto chunk = reader.read_previous_chunk(start_offset, 1).unwrap();

        REQUIRE(chunk.cr_entries.size() == 1);
        CHECK(chunk.cr_entries[0].le_line_number == line_number);
        start_offset = chunk.cr_new_start_offset;
    }
    CHECK(start_offset == 0);
    CHECK(reader.get_anchor_count() <= log_reader::MAX_ANCHORS);

    auto lines = reader.read_line_range(300, 300).unwrap();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].le_content == "line 300");

    SUBCASE("following the file does not add anchors")
    {
        auto before = reader.get_anchor_count();

        for (size_t lpc = 601; lpc <= 700; lpc++) {
            REQUIRE(tlf.append(numbered_lines(lpc, 1)));
            REQUIRE(reader.read_new_lines().unwrap().nlr_entries.size() == 1);
        }
        CHECK(reader.get_anchor_count() == before);
        CHECK(reader.get_line_count() == 700);
    }
}

TEST_CASE("log_reader::read_previous_chunk")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 10)));

    auto reader = open_reader(tlf);
    auto tail = reader.read_tail(3).unwrap();

    REQUIRE(tail.tr_entries.front().le_line_number == 8);
    CHECK(tail.tr_start_offset == 49);

    auto chunk = reader.read_previous_chunk(tail.tr_start_offset, 3).unwrap();
    REQUIRE(chunk.cr_entries.size() == 3);
    CHECK(chunk.cr_entries.front().le_line_number == 5);
    CHECK(chunk.cr_entries.back().le_line_number == 7);
    CHECK(chunk.cr_entries.back().le_content == "line 7");
    CHECK(chunk.cr_new_start_offset == 28);

    chunk = reader.read_previous_chunk(chunk.cr_new_start_offset, 3).unwrap();
    REQUIRE(chunk.cr_entries.size() == 3);
    CHECK(chunk.cr_entries.front().le_line_number == 2);
    CHECK(chunk.cr_new_start_offset == 7);

    chunk = reader.read_previous_chunk(chunk.cr_new_start_offset, 3).unwrap();
    REQUIRE(chunk.cr_entries.size() == 1);
    CHECK(chunk.cr_entries.front().le_line_number == 1);
    CHECK(chunk.cr_entries.front().le_content == "line 1");
    CHECK(chunk.cr_new_start_offset == 0);

    chunk = reader.read_previous_chunk(chunk.cr_new_start_offset, 3).unwrap();
    CHECK(chunk.cr_entries.empty());
    CHECK(chunk.cr_new_start_offset == 0);

    SUBCASE("the cursor does not move")
    {
        CHECK(reader.get_offset() == 71);
        CHECK(reader.get_line_count() == 10);
    }

    SUBCASE("offsets past the cursor are ignored")
    {
        CHECK(reader.read_previous_chunk(1000, 3).unwrap().cr_entries.empty());
    }
}

TEST_CASE("log_reader::long-lines")
{
    test_log_file tlf;
    reader_config cfg;

    cfg.c_max_line_length = 10;

    SUBCASE("ascii")
    {
        REQUIRE(tlf.write("abcdefghijklmnopqrstuvwxyz\nshort\n"));

        auto reader = open_reader(tlf, cfg);
        auto tail = reader.read_tail(5).unwrap();

        REQUIRE(tail.tr_entries.size() == 2);
        CHECK(tail.tr_entries[0].le_content
              == "abcdefghij... [truncated, 26 bytes total]");
        CHECK(tail.tr_entries[1].le_content == "short");
    }

    SUBCASE("cut on a character boundary")
    {
        REQUIRE(tlf.write("a\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\n"));

        auto reader = open_reader(tlf, cfg);
        auto tail = reader.read_tail(5).unwrap();

        REQUIRE(tail.tr_entries.size() == 1);
        CHECK(tail.tr_entries[0].le_content
              == "a\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9"
                 "... [truncated, 11 bytes total]");
    }

    SUBCASE("much longer than the limit")
    {
        REQUIRE(tlf.write(std::string(1000, 'x') + "\n"));

        auto reader = open_reader(tlf, cfg);
        auto tail = reader.read_tail(5).unwrap();

        REQUIRE(tail.tr_entries.size() == 1);
        CHECK(tail.tr_entries[0].le_content
              == "xxxxxxxxxx... [truncated, 1000 bytes total]");
    }
}

TEST_CASE("log_reader::read_line_range")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 10)));

    auto reader = open_reader(tlf);
    reader.read_tail(2).unwrap();

    auto lines = reader.read_line_range(3, 5).unwrap();
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].le_line_number == 3);
    CHECK(lines[0].le_content == "line 3");
    CHECK(lines[2].le_content == "line 5");
    CHECK(reader.get_offset() == 71);

    lines = reader.read_line_range(10, 20).unwrap();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].le_content == "line 10");

    CHECK(reader.read_line_range(5, 4).unwrap().empty());
    CHECK(reader.read_line_range(0, 4).unwrap().empty());
}

TEST_CASE("log_reader::read_all")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 10)));

    auto reader = open_reader(tlf);
    auto all = reader.read_all().unwrap();

    REQUIRE(all.size() == 10);
    CHECK(all[9].le_line_number == 10);
    CHECK(reader.get_offset() == 71);
    CHECK(reader.get_line_count() == 10);
}

TEST_CASE("log_reader::seek_with_line_count")
{
    test_log_file tlf;

    REQUIRE(tlf.write(numbered_lines(1, 5)));

    auto reader = open_reader(tlf);

    reader.seek_with_line_count(14, 2);

    auto new_lines = reader.read_new_lines().unwrap();
    REQUIRE(new_lines.nlr_entries.size() == 3);
    CHECK(new_lines.nlr_entries[0].le_line_number == 3);
    CHECK(new_lines.nlr_entries[0].le_content == "line 3");
    CHECK(reader.get_line_count() == 5);
}

TEST_CASE("log_reader::utf16")
{
    test_log_file tlf;

    REQUIRE(tlf.write("\xff\xfeo\0n\0e\0\n\0t\0w\0o\0\n\0"s));

    auto reader = open_reader(tlf);
    auto tail = reader.read_tail(1).unwrap();

    CHECK(reader.get_encoding() == text_encoding::utf16le);
    REQUIRE(tail.tr_entries.size() == 1);
    CHECK(tail.tr_entries[0].le_content == "two");
    CHECK(tail.tr_entries[0].le_line_number == 2);
    CHECK(tail.tr_start_offset == 10);

    auto chunk = reader.read_previous_chunk(tail.tr_start_offset, 5).unwrap();
    REQUIRE(chunk.cr_entries.size() == 1);
    CHECK(chunk.cr_entries[0].le_content == "one");
}

TEST_CASE("log_reader::invalid-utf8")
{
    test_log_file tlf;
    reader_config cfg;

    cfg.c_encoding = text_encoding::utf8;
    REQUIRE(tlf.write("ok\nbad \xff byte\n"));

    auto reader = open_reader(tlf, cfg);
    auto tail = reader.read_tail(5).unwrap();

    REQUIRE(tail.tr_entries.size() == 2);
    CHECK(tail.tr_entries[1].le_content == "bad ? byte");
}

TEST_CASE("log_reader::open-errors")
{
    auto missing = log_reader::open("/non-existent/file.log", reader_config{});

    REQUIRE(missing.isErr());
    CHECK(missing.unwrapErr().find("Failed to open") != std::string::npos);

    auto dir = log_reader::open("/tmp", reader_config{});

    REQUIRE(dir.isErr());
    CHECK(dir.unwrapErr().find("not a regular file") != std::string::npos);
}
