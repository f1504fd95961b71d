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
 * @file text_encoding.cc
 */

#include <algorithm>
#include <utility>

#include "text_encoding.hh"

#include <ctype.h>
#include <errno.h>
#include <string.h>

#include "base/is_utf8.hh"
#include "base/logline_log.hh"
#include "fmt/format.h"

namespace logline {

namespace {

const iconv_t NO_ICONV = reinterpret_cast<iconv_t>(-1);

const struct {
    const char* en_name;
    text_encoding en_encoding;
} ENCODING_ALIASES[] = {
    {"utf8", text_encoding::utf8},
    {"ascii", text_encoding::utf8},
    {"usascii", text_encoding::utf8},
    {"utf16", text_encoding::utf16le},
    {"utf16le", text_encoding::utf16le},
    {"ucs2", text_encoding::utf16le},
    {"utf16be", text_encoding::utf16be},
    {"gb18030", text_encoding::gb18030},
    {"gbk", text_encoding::gb18030},
    {"gb2312", text_encoding::gb18030},
    {"cp936", text_encoding::gb18030},
    {"windows1252", text_encoding::windows1252},
    {"cp1252", text_encoding::windows1252},
    {"latin1", text_encoding::windows1252},
    {"iso88591", text_encoding::windows1252},
};

bool
has_utf16_nul_pattern(const unsigned char* udata,
                      size_t len,
                      size_t nul_index)
{
    size_t pairs = len / 2;
    size_t expected_nuls = 0, other_nuls = 0;

    if (pairs < 2) {
        return false;
    }
    for (size_t lpc = 0; lpc < pairs; lpc++) {
        if (udata[lpc * 2 + nul_index] == 0) {
            expected_nuls += 1;
        }
        if (udata[lpc * 2 + (1 - nul_index)] == 0) {
            other_nuls += 1;
        }
    }

    return expected_nuls > 0 && expected_nuls * 4 >= pairs
        && other_nuls * 20 <= pairs;
}

bool
is_gb18030(const unsigned char* udata, size_t len)
{
    size_t i = 0;

    while (i < len) {
        auto lead = udata[i];

        if (lead <= 0x7f) {
            i += 1;
            continue;
        }
        if (lead == 0x80 || lead == 0xff) {
            return false;
        }
        if (i + 1 >= len) {
            // cut off by the end of the sample
            return true;
        }

        auto second = udata[i + 1];

        if ((0x40 <= second && second <= 0x7e)
            || (0x80 <= second && second <= 0xfe))
        {
            i += 2;
        } else if (0x30 <= second && second <= 0x39) {
            if (i + 3 >= len) {
                return true;
            }
            if (udata[i + 2] < 0x81 || udata[i + 2] > 0xfe
                || udata[i + 3] < 0x30 || udata[i + 3] > 0x39)
            {
                return false;
            }
            i += 4;
        } else {
            return false;
        }
    }

    return true;
}

}  // namespace

const char*
text_encoding_name(text_encoding enc)
{
    switch (enc) {
        case text_encoding::utf8:
            return "UTF-8";
        case text_encoding::utf16le:
            return "UTF-16LE";
        case text_encoding::utf16be:
            return "UTF-16BE";
        case text_encoding::gb18030:
            return "GB18030";
        case text_encoding::windows1252:
            return "WINDOWS-1252";
    }

    return "UTF-8";
}

std::optional<text_encoding>
text_encoding_from_name(const std::string& name)
{
    std::string normalized;

    for (const auto ch : name) {
        if (isalnum((unsigned char) ch)) {
            normalized.push_back(tolower((unsigned char) ch));
        }
    }

    for (const auto& alias : ENCODING_ALIASES) {
        if (normalized == alias.en_name) {
            return alias.en_encoding;
        }
    }

    return std::nullopt;
}

size_t
text_encoding_unit_width(text_encoding enc)
{
    switch (enc) {
        case text_encoding::utf16le:
        case text_encoding::utf16be:
            return 2;
        default:
            return 1;
    }
}

size_t
text_encoding_bom_size(text_encoding enc, const char* data, size_t len)
{
    const auto* udata = reinterpret_cast<const unsigned char*>(data);

    switch (enc) {
        case text_encoding::utf8:
            if (len >= 3 && udata[0] == 0xef && udata[1] == 0xbb
                && udata[2] == 0xbf)
            {
                return 3;
            }
            break;
        case text_encoding::utf16le:
            if (len >= 2 && udata[0] == 0xff && udata[1] == 0xfe) {
                return 2;
            }
            break;
        case text_encoding::utf16be:
            if (len >= 2 && udata[0] == 0xfe && udata[1] == 0xff) {
                return 2;
            }
            break;
        default:
            break;
    }

    return 0;
}

text_encoding
detect_text_encoding(const char* data, size_t len)
{
    const auto* udata = reinterpret_cast<const unsigned char*>(data);

    if (len == 0) {
        return text_encoding::utf8;
    }

    for (const auto enc : {text_encoding::utf8,
                           text_encoding::utf16le,
                           text_encoding::utf16be})
    {
        if (text_encoding_bom_size(enc, data, len) > 0) {
            return enc;
        }
    }

    if (has_utf16_nul_pattern(udata, len, 1)) {
        return text_encoding::utf16le;
    }
    if (has_utf16_nul_pattern(udata, len, 0)) {
        return text_encoding::utf16be;
    }

    auto scan_res = is_utf8(udata, len);
    if (scan_res.is_valid() || scan_res.usr_truncated) {
        return text_encoding::utf8;
    }

    if (is_gb18030(udata, len)) {
        return text_encoding::gb18030;
    }

    return text_encoding::windows1252;
}

Result<line_decoder, std::string>
line_decoder::create(text_encoding enc)
{
    if (enc == text_encoding::utf8) {
        return Ok(line_decoder(enc, NO_ICONV));
    }

    auto cd = iconv_open("UTF-8", text_encoding_name(enc));
    if (cd == NO_ICONV) {
        return Err(fmt::format(FMT_STRING("unable to convert from {} -- {}"),
                               text_encoding_name(enc),
                               strerror(errno)));
    }

    return Ok(line_decoder(enc, cd));
}

line_decoder::line_decoder(line_decoder&& other) noexcept
    : ld_encoding(other.ld_encoding),
      ld_iconv(std::exchange(other.ld_iconv, NO_ICONV))
{
}

line_decoder&
line_decoder::operator=(line_decoder&& other) noexcept
{
    if (this != &other) {
        if (this->ld_iconv != NO_ICONV) {
            iconv_close(this->ld_iconv);
        }
        this->ld_encoding = other.ld_encoding;
        this->ld_iconv = std::exchange(other.ld_iconv, NO_ICONV);
    }

    return *this;
}

line_decoder::~line_decoder()
{
    if (this->ld_iconv != NO_ICONV) {
        iconv_close(this->ld_iconv);
    }
}

std::string
line_decoder::decode(const char* data, size_t len, bool at_file_start)
{
    std::string retval;

    if (at_file_start) {
        auto bom_size = text_encoding_bom_size(this->ld_encoding, data, len);

        data += bom_size;
        len -= bom_size;
    }

    switch (this->ld_encoding) {
        case text_encoding::utf16le:
            if (len >= 2 && data[len - 2] == '\n' && data[len - 1] == '\0') {
                len -= 2;
            }
            if (len >= 2 && data[len - 2] == '\r' && data[len - 1] == '\0') {
                len -= 2;
            }
            break;
        case text_encoding::utf16be:
            if (len >= 2 && data[len - 2] == '\0' && data[len - 1] == '\n') {
                len -= 2;
            }
            if (len >= 2 && data[len - 2] == '\0' && data[len - 1] == '\r') {
                len -= 2;
            }
            break;
        default:
            if (len >= 1 && data[len - 1] == '\n') {
                len -= 1;
            }
            if (len >= 1 && data[len - 1] == '\r') {
                len -= 1;
            }
            break;
    }

    retval.reserve(len);
    if (this->ld_iconv == NO_ICONV) {
        this->decode_utf8(data, len, retval);
    } else {
        this->decode_iconv(data, len, retval);
    }

    return retval;
}

void
line_decoder::decode_utf8(const char* data, size_t len, std::string& dst) const
{
    while (len > 0) {
        auto scan_res = is_utf8(data, len);

        dst.append(data, scan_res.usr_valid_end);
        if (scan_res.is_valid()) {
            break;
        }
        dst.push_back('?');

        auto skip = scan_res.usr_valid_end + scan_res.usr_faulty_bytes;
        data += skip;
        len -= skip;
    }
}

void
line_decoder::decode_iconv(const char* data, size_t len, std::string& dst)
{
    auto* inbuf = const_cast<char*>(data);
    size_t inleft = len;
    auto unit_width = text_encoding_unit_width(this->ld_encoding);

    // reset any shift state left over from the previous line
    iconv(this->ld_iconv, nullptr, nullptr, nullptr, nullptr);
    while (inleft > 0) {
        char outbuf[4096];
        auto* outp = outbuf;
        size_t outleft = sizeof(outbuf);

        auto rc = iconv(this->ld_iconv, &inbuf, &inleft, &outp, &outleft);
        dst.append(outbuf, outp - outbuf);
        if (rc != (size_t) -1) {
            continue;
        }

        switch (errno) {
            case E2BIG:
                break;
            case EILSEQ: {
                auto skip = std::min(unit_width, inleft);

                dst.push_back('?');
                inbuf += skip;
                inleft -= skip;
                iconv(this->ld_iconv, nullptr, nullptr, nullptr, nullptr);
                break;
            }
            case EINVAL:
                // incomplete sequence at the end of the line
                dst.push_back('?');
                inleft = 0;
                break;
            default:
                log_error("iconv from %s failed -- %s",
                          text_encoding_name(this->ld_encoding),
                          strerror(errno));
                dst.push_back('?');
                inleft = 0;
                break;
        }
    }
}

}  // namespace logline
