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

#include "qnet/files.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <format>
#include <fstream>


namespace qnet {

static std::error_code lastError()
{
    return std::error_code(errno, std::generic_category());
}

static std::error_code writeAll(int fd, std::string_view content)
{
    while (!content.empty()) {
        ssize_t n = ::write(fd, content.data(), content.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return lastError();
        }
        content.remove_prefix((std::size_t)n);
    }
    return QnetError::Ok;
}

std::error_code writeFileAtomic(
    const std::filesystem::path& path, std::string_view content, std::filesystem::perms perms)
{
    std::string tmpl = path.string() + ".XXXXXX";
    int fd = mkstemp(tmpl.data());
    if (fd < 0) return lastError();

    auto ec = writeAll(fd, content);
    if (!ec && fchmod(fd, static_cast<mode_t>(perms)) < 0) ec = lastError();
    if (!ec && fsync(fd) < 0) ec = lastError();
    if (::close(fd) < 0 && !ec) ec = lastError();
    if (!ec && std::rename(tmpl.c_str(), path.c_str()) < 0) ec = lastError();

    if (ec) ::unlink(tmpl.c_str());
    return ec;
}

std::error_code writeFileInPlace(const std::filesystem::path& path, std::string_view content)
{
    int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
    if (fd < 0) return lastError();
    auto ec = writeAll(fd, content);
    if (::close(fd) < 0 && !ec) ec = lastError();
    return ec;
}

std::error_code removeFile(const std::filesystem::path& path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return ec;
}

Maybe<std::string> readFirstLine(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) return Error(QnetError::NotFound);
    std::string line;
    std::getline(file, line);
    if (file.bad()) return Error(lastError());
    return line;
}

std::string formatResolvConf(const std::vector<std::string>& servers)
{
    std::string conf;
    for (const auto& server : servers) {
        if (!server.empty()) conf += std::format("nameserver {}\n", server);
    }
    return conf;
}

std::string formatNsRecord(std::string_view primary, std::string_view secondary)
{
    return std::format("NS1={}\nNS2={}\n", primary, secondary);
}

} // namespace qnet
