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
 * @file test_line_scanner.cc
 */

#include <string>
#include <vector>

#include <fcntl.h>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "base/fs_util.hh"
#include "doctest/doctest.h"
#include "line_scanner.hh"
#include "test_log_file.hh"

using namespace logline;
using namespace std::string_literals;

static const std::string THREE_LINES = "one\ntwo\nthree\n";

static std::vector<raw_line>
collect_lines(const auto_fd& fd,
              file_range range,
              size_t block_size,
              size_t max_retained,
              const line_delimiter& delim,
              file_off_t* end_offset = nullptr)
{
    std::vector<raw_line> retval;

    auto end = scan_forward(fd,
                            range,
                            block_size,
                            max_retained,
                            delim,
                            [&retval](raw_line&& line) {
                                retval.emplace_back(std::move(line));
                                return true;
                            })
                   .unwrap();
    if (end_offset != nullptr) {
        *end_offset = end;
    }

    return retval;
}

static file_range
whole_range(file_off_t size)
{
    file_range retval;

    retval.fr_offset = 0;
    retval.fr_size = size;

    return retval;
}

TEST_CASE("line_delimiter::utf16")
{
    line_delimiter le_delim(text_encoding::utf16le);
    line_delimiter be_delim(text_encoding::utf16be);
    auto le_data = "a\0\n\0b\0"s;
    auto be_data = "\0a\0\n\0b"s;

    CHECK(le_delim.width() == 2);
    CHECK(le_delim.find_next(le_data.data(), le_data.size(), 0, 0).value()
          == 2);
    CHECK(be_delim.find_next(be_data.data(), be_data.size(), 0, 0).value()
          == 2);
    CHECK(le_delim.find_prev(le_data.data(), le_data.size(), 0).value() == 2);

    SUBCASE("a delimiter must start on a code unit boundary")
    {
        // U+0A00 followed by 'A', the bytes "\n\0" straddle two units
        auto misaligned = "\0\n\0A"s;

        CHECK_FALSE(le_delim.find_next(misaligned.data(), misaligned.size(), 0, 0)
                        .has_value());
        CHECK_FALSE(le_delim.find_prev(misaligned.data(), misaligned.size(), 0)
                        .has_value());
    }
}

TEST_CASE("scan_backward")
{
    test_log_file tlf;
    line_delimiter delim(text_encoding::utf8);

    REQUIRE(tlf.write(THREE_LINES));

    auto fd = filesystem::open_file(tlf.get_path(), O_RDONLY).unwrap();
    file_off_t size = THREE_LINES.size();

    SUBCASE("last lines")
    {
        auto res = scan_backward(fd, size, 2, 1024, delim).unwrap();

        CHECK(res.bsr_start_offset == 4);
        CHECK(res.bsr_line_count == 2);
    }

    SUBCASE("small chunks")
    {
        auto res = scan_backward(fd, size, 2, 3, delim).unwrap();

        CHECK(res.bsr_start_offset == 4);
        CHECK(res.bsr_line_count == 2);
    }

    SUBCASE("more lines than the file has")
    {
        auto res = scan_backward(fd, size, 10, 1024, delim).unwrap();

        CHECK(res.bsr_start_offset == 0);
        CHECK(res.bsr_line_count == 3);
    }

    SUBCASE("from the start of a line")
    {
        auto res = scan_backward(fd, 8, 1, 1024, delim).unwrap();

        CHECK(res.bsr_start_offset == 4);
        CHECK(res.bsr_line_count == 1);

        res = scan_backward(fd, 4, 5, 1024, delim).unwrap();
        CHECK(res.bsr_start_offset == 0);
        CHECK(res.bsr_line_count == 1);
    }

    SUBCASE("at the start of the file")
    {
        auto res = scan_backward(fd, 0, 5, 1024, delim).unwrap();

        CHECK(res.bsr_start_offset == 0);
        CHECK(res.bsr_line_count == 0);
    }
}

TEST_CASE("scan_backward::unterminated")
{
    test_log_file tlf;
    line_delimiter delim(text_encoding::utf8);

    REQUIRE(tlf.write("one\ntwo"));

    auto fd = filesystem::open_file(tlf.get_path(), O_RDONLY).unwrap();
    auto res = scan_backward(fd, 7, 1, 1024, delim).unwrap();

    CHECK(res.bsr_start_offset == 4);
    CHECK(res.bsr_line_count == 1);
}

TEST_CASE("scan_forward")
{
    test_log_file tlf;
    line_delimiter delim(text_encoding::utf8);

    REQUIRE(tlf.write(THREE_LINES));

    auto fd = filesystem::open_file(tlf.get_path(), O_RDONLY).unwrap();
    file_off_t end_offset = 0;

    SUBCASE("whole file")
    {
        auto lines = collect_lines(
            fd, whole_range(THREE_LINES.size()), 4, 100, delim, &end_offset);

        REQUIRE(lines.size() == 3);
        CHECK(lines[0].rl_data == "one\n");
        CHECK(lines[0].rl_range.fr_offset == 0);
        CHECK(lines[1].rl_data == "two\n");
        CHECK(lines[1].rl_range.fr_offset == 4);
        CHECK(lines[2].rl_data == "three\n");
        CHECK(lines[2].rl_range.fr_offset == 8);
        CHECK(lines[2].rl_range.fr_size == 6);
        CHECK(lines[2].rl_has_delimiter);
        CHECK(end_offset == 14);
    }

    SUBCASE("retention limit")
    {
        auto lines = collect_lines(
            fd, whole_range(THREE_LINES.size()), 1024, 2, delim);

        REQUIRE(lines.size() == 3);
        CHECK(lines[2].rl_data == "th");
        CHECK(lines[2].rl_truncated);
        CHECK(lines[2].rl_range.fr_size == 6);
    }

    SUBCASE("stop early")
    {
        size_t count = 0;
        auto end = scan_forward(fd,
                                whole_range(THREE_LINES.size()),
                                1024,
                                100,
                                delim,
                                [&count](raw_line&& line) {
                                    count += 1;
                                    return false;
                                })
                       .unwrap();

        CHECK(count == 1);
        CHECK(end == 4);
    }
}

TEST_CASE("scan_forward::partial")
{
    test_log_file tlf;
    line_delimiter delim(text_encoding::utf8);

    REQUIRE(tlf.write("one\ntw"));

    auto fd = filesystem::open_file(tlf.get_path(), O_RDONLY).unwrap();
    file_off_t end_offset = 0;
    auto lines = collect_lines(fd, whole_range(6), 1024, 100, delim, &end_offset);

    REQUIRE(lines.size() == 2);
    CHECK(lines[1].rl_data == "tw");
    CHECK_FALSE(lines[1].rl_has_delimiter);
    CHECK(end_offset == 6);
}

TEST_CASE("count_delimiters")
{
    test_log_file tlf;
    line_delimiter delim(text_encoding::utf8);

    REQUIRE(tlf.write(THREE_LINES));

    auto fd = filesystem::open_file(tlf.get_path(), O_RDONLY).unwrap();
    file_range range;

    CHECK(count_delimiters(fd, whole_range(14), 5, delim).unwrap() == 3);
    range.fr_offset = 4;
    range.fr_size = 10;
    CHECK(count_delimiters(fd, range, 1024, delim).unwrap() == 2);
    range.fr_size = 0;
    CHECK(count_delimiters(fd, range, 1024, delim).unwrap() == 0);
}
