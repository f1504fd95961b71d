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
 * @file text_encoding.hh
 */

#ifndef logline_text_encoding_hh
#define logline_text_encoding_hh

#include <optional>
#include <string>

#include <iconv.h>
#include <stddef.h>

#include "base/result.h"

namespace logline {

enum class text_encoding {
    utf8,
    utf16le,
    utf16be,
    gb18030,
    windows1252,
};

/** @return The canonical name of the encoding, as understood by iconv. */
const char* text_encoding_name(text_encoding enc);

/**
 * Map a user-supplied encoding name, like "utf-8", "UTF16LE", "gbk", or
 * "latin1", to an encoding.  Case and punctuation are ignored.
 */
std::optional<text_encoding> text_encoding_from_name(const std::string& name);

/**
 * @return The number of bytes in a line delimiter for the encoding.  The
 *   UTF-16 encodings use a two-byte newline code unit that must be aligned
 *   to the start of the file.
 */
size_t text_encoding_unit_width(text_encoding enc);

/**
 * @return The length of the byte-order mark for the encoding at the start of
 *   the given data, or zero if there is none.
 */
size_t text_encoding_bom_size(text_encoding enc,
                              const char* data,
                              size_t len);

/**
 * Guess the encoding of a file from a sample of its leading bytes.  The
 * checks are, in order: a byte-order mark, the NUL pattern of BOM-less
 * UTF-16, well-formed UTF-8, well-formed GB18030, and finally windows-1252,
 * which accepts any input.  An empty sample is treated as UTF-8.
 */
text_encoding detect_text_encoding(const char* data, size_t len);

/**
 * Converts raw lines in a given encoding to UTF-8.  Bytes that cannot be
 * decoded are replaced with a '?'.
 */
class line_decoder {
public:
    static Result<line_decoder, std::string> create(text_encoding enc);

    line_decoder(line_decoder&& other) noexcept;
    line_decoder& operator=(line_decoder&& other) noexcept;

    line_decoder(const line_decoder&) = delete;
    line_decoder& operator=(const line_decoder&) = delete;

    ~line_decoder();

    text_encoding get_encoding() const { return this->ld_encoding; }

    /**
     * Decode a single line.  A trailing newline and carriage return are
     * removed, as is a byte-order mark if the line starts the file.
     *
     * @param data The raw bytes of the line, including its delimiter.
     * @param len The number of bytes.
     * @param at_file_start True if the line begins at offset zero.
     */
    std::string decode(const char* data, size_t len, bool at_file_start);

private:
    explicit line_decoder(text_encoding enc, iconv_t cd)
        : ld_encoding(enc), ld_iconv(cd)
    {
    }

    void decode_utf8(const char* data, size_t len, std::string& dst) const;

    void decode_iconv(const char* data, size_t len, std::string& dst);

    text_encoding ld_encoding;
    iconv_t ld_iconv;
};

}  // namespace logline

#endif
