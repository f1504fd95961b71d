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
 * @file test_log_buffer.cc
 */

#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "log_buffer.hh"

using namespace logline;

/** Entries for lines `first` through `first + count - 1`, ten bytes each. */
static entry_list
make_entries(size_t first, size_t count)
{
    entry_list retval;

    for (size_t lpc = 0; lpc < count; lpc++) {
        auto line_number = first + lpc;

        retval.emplace_back(log_entry::create(line_number,
                                              "line " + std::to_string(line_number),
                                              (line_number - 1) * 10));
    }

    return retval;
}

static buffer_config
small_config(size_t max_lines, bool auto_trim = true)
{
    buffer_config retval;

    retval.c_max_lines = max_lines;
    retval.c_auto_trim = auto_trim;
    retval.c_chunk_lines = 2;
    retval.c_history_factor = 2;

    return retval;
}

static void
check_contiguous(const log_buffer& lb)
{
    auto expected = lb.first_line_number();

    for (const auto& entry : lb) {
        CHECK(entry.le_line_number == expected);
        expected += 1;
    }
}

TEST_CASE("log_buffer::append")
{
    log_buffer lb(small_config(5));

    CHECK(lb.empty());
    CHECK(lb.first_line_number() == 1);
    CHECK(lb.last_line_number() == 0);

    lb.append(make_entries(1, 3));
    CHECK(lb.size() == 3);
    CHECK(lb.first_line_number() == 1);
    CHECK(lb.last_line_number() == 3);
    CHECK(lb.total_lines() == 3);
    CHECK(lb.get_lazy_state().lls_fully_loaded);

    SUBCASE("auto-trim evicts the oldest lines")
    {
        lb.append(make_entries(4, 5));
        CHECK(lb.size() == 5);
        CHECK(lb.first_line_number() == 4);
        CHECK(lb.last_line_number() == 8);
        CHECK(lb.total_lines() == 8);
        CHECK(lb[0].le_content == "line 4");
        CHECK_FALSE(lb.get_lazy_state().lls_fully_loaded);
        CHECK(lb.get_lazy_state().lls_loaded_start_offset == 30);
        check_contiguous(lb);
    }
}

TEST_CASE("log_buffer::append-without-trim")
{
    log_buffer lb(small_config(5, false));

    lb.append(make_entries(1, 8));
    CHECK(lb.size() == 8);
    CHECK(lb.first_line_number() == 1);
    check_contiguous(lb);
}

TEST_CASE("log_buffer::clear-and-reset")
{
    log_buffer lb(small_config(5));

    lb.append(make_entries(1, 8));

    SUBCASE("clear keeps counting")
    {
        lb.clear();
        CHECK(lb.empty());
        CHECK(lb.first_line_number() == 9);
        CHECK(lb.total_lines() == 8);
        CHECK_FALSE(lb.get_lazy_state().lls_enabled);

        lb.append(make_entries(9, 2));
        CHECK(lb.first_line_number() == 9);
        CHECK(lb.last_line_number() == 10);
    }

    SUBCASE("reset starts over")
    {
        lb.reset();
        CHECK(lb.empty());
        CHECK(lb.first_line_number() == 1);
        CHECK(lb.total_lines() == 0);
        CHECK(lb.get_lazy_state().lls_enabled);
        CHECK(lb.get_lazy_state().lls_fully_loaded);

        lb.append(make_entries(1, 2));
        CHECK(lb.first_line_number() == 1);
        CHECK(lb.last_line_number() == 2);
    }
}

TEST_CASE("log_buffer::lazy-loading")
{
    log_buffer lb(small_config(5));

    lb.init_with_tail(make_entries(6, 2), 50, 7);
    CHECK(lb.size() == 2);
    CHECK(lb.first_line_number() == 6);
    CHECK(lb.total_lines() == 7);

    const auto& lazy = lb.get_lazy_state();
    CHECK(lazy.lls_enabled);
    CHECK_FALSE(lazy.lls_fully_loaded);
    CHECK(lazy.lls_loaded_start_offset == 50);
    CHECK(lazy.lls_first_loaded_line == 6);
    CHECK(lb.should_load_more(0));

    lb.mark_loading();
    CHECK_FALSE(lb.should_load_more(0));
    lb.cancel_loading();
    CHECK(lb.should_load_more(0));

    SUBCASE("prepend extends the window backward")
    {
        lb.mark_loading();
        CHECK(lb.prepend(make_entries(3, 3)) == 3);
        CHECK(lb.size() == 5);
        CHECK(lb.first_line_number() == 3);
        CHECK(lazy.lls_loaded_start_offset == 20);
        CHECK(lazy.lls_first_loaded_line == 3);
        CHECK_FALSE(lazy.lls_loading_in_progress);
        check_contiguous(lb);
    }

    SUBCASE("chunks that do not touch the window are ignored")
    {
        CHECK(lb.prepend(make_entries(1, 2)) == 0);
        CHECK(lb.size() == 2);
        CHECK(lb.first_line_number() == 6);
    }

    SUBCASE("the start of the file")
    {
        lb.mark_loading();
        lb.mark_fully_loaded();
        CHECK(lazy.lls_fully_loaded);
        CHECK_FALSE(lazy.lls_loading_in_progress);
        CHECK(lazy.lls_loaded_start_offset == 0);
        CHECK_FALSE(lb.should_load_more(0));
    }
}

TEST_CASE("log_buffer::tail-of-small-file")
{
    log_buffer lb;

    lb.init_with_tail(make_entries(1, 3), 0, 3);
    CHECK_FALSE(lb.get_lazy_state().lls_enabled);
    CHECK(lb.get_lazy_state().lls_fully_loaded);
    CHECK_FALSE(lb.should_load_more(0));

    lb.init_with_tail({}, 0, 0);
    CHECK(lb.empty());
    CHECK(lb.first_line_number() == 1);
}

TEST_CASE("log_buffer::history-cap")
{
    log_buffer lb(small_config(2));

    lb.init_with_tail(make_entries(9, 2), 80, 10);
    lb.mark_loading();

    // the cap is four lines, so only the newest two of the chunk fit
    CHECK(lb.prepend(make_entries(5, 4)) == 2);
    CHECK(lb.size() == 4);
    CHECK(lb.first_line_number() == 7);
    CHECK_FALSE(lb.should_load_more(0));
    check_contiguous(lb);

    lb.append(make_entries(11, 1));
    CHECK(lb.size() == 2);
    CHECK(lb.first_line_number() == 10);
    CHECK(lb.last_line_number() == 11);
    CHECK(lb.get_lazy_state().lls_loaded_start_offset == 90);
    check_contiguous(lb);
}

TEST_CASE("log_buffer::should_load_more")
{
    log_buffer lb;

    lb.init_with_tail(make_entries(3001, 2000), 30000, 5000);
    CHECK(lb.should_load_more(199));
    CHECK_FALSE(lb.should_load_more(200));

    log_buffer small_lb;

    small_lb.init_with_tail(make_entries(91, 10), 900, 100);
    CHECK(small_lb.should_load_more(99));
    CHECK_FALSE(small_lb.should_load_more(100));
}

TEST_CASE("log_buffer::bookmarks")
{
    log_buffer lb;

    lb.append(make_entries(1, 10));

    CHECK(lb.toggle_bookmark(5));
    CHECK(lb[5].le_bookmarked);

    SUBCASE("a partly bookmarked group is bookmarked")
    {
        CHECK(lb.toggle_bookmarks({2, 5}) == 2);
        CHECK(lb[2].le_bookmarked);
        CHECK(lb[5].le_bookmarked);

        CHECK(lb.toggle_bookmarks({2, 5}) == 2);
        CHECK_FALSE(lb[2].le_bookmarked);
        CHECK_FALSE(lb[5].le_bookmarked);
    }

    SUBCASE("indexes outside the window are ignored")
    {
        CHECK(lb.toggle_bookmarks({2, 100}) == 1);
        CHECK(lb[2].le_bookmarked);
        CHECK_FALSE(lb.toggle_bookmark(100));
    }

    SUBCASE("bookmarks by line number")
    {
        CHECK(lb.set_bookmarks({1, 9, 42}) == 2);

        std::vector<size_t> expected = {1, 6, 9};
        CHECK(lb.bookmarked_line_numbers() == expected);

        auto marked = lb.bookmarked_entries();
        REQUIRE(marked.size() == 3);
        CHECK(marked[1].first == 5);
        CHECK(marked[1].second->le_line_number == 6);
    }
}

TEST_CASE("log_buffer::access")
{
    log_buffer lb;

    lb.append(make_entries(4, 5));

    CHECK(lb.at(0).le_line_number == 4);
    CHECK_THROWS_AS(lb.at(5), std::out_of_range);

    REQUIRE(lb.by_line_number(6) != nullptr);
    CHECK(lb.by_line_number(6)->le_content == "line 6");
    CHECK(lb.by_line_number(3) == nullptr);
    CHECK(lb.by_line_number(9) == nullptr);

    auto rng = lb.range(1, 3);
    CHECK(std::distance(rng.first, rng.second) == 2);
    CHECK(rng.first->le_line_number == 5);

    rng = lb.range(3, 100);
    CHECK(std::distance(rng.first, rng.second) == 2);
    rng = lb.range(10, 20);
    CHECK(rng.first == rng.second);
}

TEST_CASE("log_buffer::memory_usage")
{
    log_buffer lb;
    entry_list entries;

    entries.emplace_back(log_entry::create(1, "ab", 0));
    entries.emplace_back(log_entry::create(2, "cde", 3));
    lb.append(std::move(entries));

    CHECK(lb.memory_usage() == 2 * sizeof(log_entry) + 5);
}

TEST_CASE("log_buffer::tail-larger-than-window")
{
    log_buffer lb(small_config(5));

    lb.init_with_tail(make_entries(1, 20), 0, 20);
    CHECK(lb.size() == 5);
    CHECK(lb.first_line_number() == 16);
    CHECK(lb.last_line_number() == 20);
    CHECK(lb.total_lines() == 20);
    check_contiguous(lb);

    const auto& lazy = lb.get_lazy_state();
    CHECK(lazy.lls_enabled);
    CHECK_FALSE(lazy.lls_fully_loaded);
    CHECK(lazy.lls_loaded_start_offset == 150);
    CHECK(lazy.lls_first_loaded_line == 16);
    CHECK(lb.should_load_more(0));

    SUBCASE("without auto-trim everything is kept")
    {
        log_buffer untrimmed(small_config(5, false));

        untrimmed.init_with_tail(make_entries(1, 20), 0, 20);
        CHECK(untrimmed.size() == 20);
        CHECK(untrimmed.get_lazy_state().lls_fully_loaded);
    }
}
