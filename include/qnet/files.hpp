// Copyright (c) 2024-2025 Lars-Christian Schulz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include "qnet/error_codes.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>


namespace qnet {

constexpr auto DEFAULT_FILE_PERMS = std::filesystem::perms::owner_read
    | std::filesystem::perms::owner_write
    | std::filesystem::perms::group_read
    | std::filesystem::perms::others_read;

/// \brief Replace the contents of `path` with `content`. The data is written
/// to a temporary file in the same directory first and then renamed over the
/// target, so readers see either the old or the new file.
std::error_code writeFileAtomic(
    const std::filesystem::path& path,
    std::string_view content,
    std::filesystem::perms perms = DEFAULT_FILE_PERMS);

/// \brief Write `content` to an existing file in place. Used for procfs and
/// sysfs attributes which cannot be replaced.
std::error_code writeFileInPlace(const std::filesystem::path& path, std::string_view content);

/// \brief Delete a file. A file that does not exist is not an error.
std::error_code removeFile(const std::filesystem::path& path);

/// \brief Read a file and return its first line without the line break.
Maybe<std::string> readFirstLine(const std::filesystem::path& path);

/// \brief Format resolver configuration with one nameserver line for each
/// non-empty entry of `servers`.
std::string formatResolvConf(const std::vector<std::string>& servers);

/// \brief Format the DNS server record consumed by the DNAT-to-DNS redirector.
std::string formatNsRecord(std::string_view primary, std::string_view secondary);

} // namespace qnet
