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
 * @file test_log_file.hh
 */

#ifndef logline_test_log_file_hh
#define logline_test_log_file_hh

#include <filesystem>
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

/**
 * A temporary file that the tests write log lines into.  The file is removed
 * when the object goes out of scope.
 */
class test_log_file {
public:
    test_log_file()
    {
        char path_tmpl[] = "/tmp/logline.test.XXXXXX";
        auto fd = mkstemp(path_tmpl);

        if (fd != -1) {
            ::close(fd);
        }
        this->tlf_path = path_tmpl;
    }

    test_log_file(const test_log_file&) = delete;
    test_log_file& operator=(const test_log_file&) = delete;

    ~test_log_file() { ::unlink(this->tlf_path.c_str()); }

    const std::filesystem::path& get_path() const { return this->tlf_path; }

    /** Replace the contents of the file without changing its inode. */
    bool write(const std::string& data) const
    {
        return this->write_with_mode(data, "w");
    }

    bool append(const std::string& data) const
    {
        return this->write_with_mode(data, "a");
    }

    /** Replace the file with a new one by renaming over the path. */
    bool replace(const std::string& data) const
    {
        auto tmp_path = this->tlf_path.string() + ".new";
        auto* file = fopen(tmp_path.c_str(), "w");

        if (file == nullptr) {
            return false;
        }
        auto rc = fwrite(data.data(), 1, data.size(), file);
        fclose(file);
        if (rc != data.size()) {
            return false;
        }

        return rename(tmp_path.c_str(), this->tlf_path.c_str()) == 0;
    }

private:
    bool write_with_mode(const std::string& data, const char* mode) const
    {
        auto* file = fopen(this->tlf_path.c_str(), mode);

        if (file == nullptr) {
            return false;
        }
        auto rc = fwrite(data.data(), 1, data.size(), file);
        fclose(file);

        return rc == data.size();
    }

    std::filesystem::path tlf_path;
};

/** @return "line 1\n" through "line <count>\n". */
inline std::string
numbered_lines(size_t first, size_t count)
{
    std::string retval;

    for (size_t lpc = 0; lpc < count; lpc++) {
        retval += "line " + std::to_string(first + lpc) + "\n";
    }

    return retval;
}

#endif
