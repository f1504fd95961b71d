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
 * @file is_utf8.cc
 */

#include "is_utf8.hh"

/*
  Table 3-7. Well-Formed UTF-8 Byte Sequences
  -----------------------------------------------------------------------------
  |  Code Points        | First Byte | Second Byte | Third Byte | Fourth Byte |
  |  U+0000..U+007F     |     00..7F |             |            |             |
  |  U+0080..U+07FF     |     C2..DF |      80..BF |            |             |
  |  U+0800..U+0FFF     |         E0 |      A0..BF |     80..BF |             |
  |  U+1000..U+CFFF     |     E1..EC |      80..BF |     80..BF |             |
  |  U+D000..U+D7FF     |         ED |      80..9F |     80..BF |             |
  |  U+E000..U+FFFF     |     EE..EF |      80..BF |     80..BF |             |
  |  U+10000..U+3FFFF   |         F0 |      90..BF |     80..BF |      80..BF |
  |  U+40000..U+FFFFF   |     F1..F3 |      80..BF |     80..BF |      80..BF |
  |  U+100000..U+10FFFF |         F4 |      80..8F |     80..BF |      80..BF |
  -----------------------------------------------------------------------------

  Only the second byte has a range that depends on the first, the remaining
  continuation bytes are always 80..BF.
*/

namespace {

struct utf8_lead_range {
    unsigned char lr_first_low;
    unsigned char lr_first_high;
    unsigned char lr_second_low;
    unsigned char lr_second_high;
    size_t lr_length;
    const char* lr_message;
};

const utf8_lead_range LEAD_RANGES[] = {
    {0xC2,
     0xDF,
     0x80,
     0xBF,
     2,
     "After a first byte between C2 and DF, expecting a 2nd byte between 80 "
     "and BF."},
    {0xE0,
     0xE0,
     0xA0,
     0xBF,
     3,
     "After a first byte of E0, expecting a 2nd byte between A0 and BF."},
    {0xE1,
     0xEC,
     0x80,
     0xBF,
     3,
     "After a first byte between E1 and EC, expecting the 2nd byte between 80 "
     "and BF."},
    {0xED,
     0xED,
     0x80,
     0x9F,
     3,
     "After a first byte of ED, expecting 2nd byte between 80 and 9F."},
    {0xEE,
     0xEF,
     0x80,
     0xBF,
     3,
     "After a first byte between EE and EF, expecting 2nd byte between 80 and "
     "BF."},
    {0xF0,
     0xF0,
     0x90,
     0xBF,
     4,
     "After a first byte of F0, expecting 2nd byte between 90 and BF."},
    {0xF1,
     0xF3,
     0x80,
     0xBF,
     4,
     "After a first byte of F1, F2, or F3, expecting a 2nd byte between 80 "
     "and BF."},
    {0xF4,
     0xF4,
     0x80,
     0x8F,
     4,
     "After a first byte of F4, expecting 2nd byte between 80 and 8F."},
};

const utf8_lead_range*
find_lead_range(unsigned char lead)
{
    for (const auto& lr : LEAD_RANGES) {
        if (lr.lr_first_low <= lead && lead <= lr.lr_first_high) {
            return &lr;
        }
    }

    return nullptr;
}

}  // namespace

utf8_scan_result
is_utf8(const unsigned char* str, size_t len)
{
    utf8_scan_result retval;
    size_t i = 0;

    while (i < len) {
        if (str[i] <= 0x7F) {
            i += 1;
            continue;
        }

        const auto* lr = find_lead_range(str[i]);

        if (lr == nullptr) {
            retval.usr_message
                = "Expecting bytes in the following ranges: 00..7F C2..F4.";
            retval.usr_faulty_bytes = 1;
            break;
        }

        size_t good = 1;

        if (i + 1 < len) {
            if (str[i + 1] < lr->lr_second_low
                || str[i + 1] > lr->lr_second_high)
            {
                retval.usr_message = lr->lr_message;
                retval.usr_faulty_bytes = 1;
                break;
            }
            good += 1;
            while (good < lr->lr_length && i + good < len) {
                if (str[i + good] < 0x80 || str[i + good] > 0xBF) {
                    break;
                }
                good += 1;
            }
        }

        if (good < lr->lr_length) {
            retval.usr_faulty_bytes = good;
            if (i + good == len) {
                retval.usr_message = "Expecting more bytes to complete the "
                                     "sequence at the end of the input.";
                retval.usr_truncated = true;
            } else {
                retval.usr_message
                    = "Expecting a continuation byte between 80 and BF.";
            }
            break;
        }
        i += lr->lr_length;
    }

    retval.usr_valid_end = i;
    return retval;
}
