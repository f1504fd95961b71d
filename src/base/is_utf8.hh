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
 * @file is_utf8.hh
 */

#ifndef logline_is_utf8_hh
#define logline_is_utf8_hh

#include <stddef.h>

struct utf8_scan_result {
    /** A description of the first problem found, or nullptr if valid. */
    const char* usr_message{nullptr};
    /** The length of the well-formed prefix of the input. */
    size_t usr_valid_end{0};
    /**
     * The number of bytes, starting at usr_valid_end, that make up the
     * ill-formed sequence.  Decoders should replace these bytes with a
     * single substitute character and resume after them.
     */
    size_t usr_faulty_bytes{0};
    /**
     * True if the problem is a sequence that was cut off by the end of the
     * input rather than a bad byte.
     */
    bool usr_truncated{false};

    bool is_valid() const { return this->usr_message == nullptr; }
};

/**
 * Check the input against Table 3-7 "Well-Formed UTF-8 Byte Sequences" of
 * the Unicode Standard, stopping at the first ill-formed sequence.
 */
utf8_scan_result is_utf8(const unsigned char* str, size_t len);

inline utf8_scan_result
is_utf8(const char* str, size_t len)
{
    return is_utf8(reinterpret_cast<const unsigned char*>(str), len);
}

#endif
