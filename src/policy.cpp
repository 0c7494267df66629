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

#include "qnet/policy.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <string>
#include <system_error>


namespace qnet {

bool isServiceEnabled(const std::filesystem::path& flagDir, std::string_view name)
{
    std::error_code ec;
    return std::filesystem::exists(flagDir / name, ec);
}

Policy loadPolicy(const std::filesystem::path& flagDir)
{
    return Policy{
        .disableDefaultRoute = isServiceEnabled(flagDir, "disable-default-route"),
        .disableDnsServer = isServiceEnabled(flagDir, "disable-dns-server"),
        .networkManager = isServiceEnabled(flagDir, "network-manager"),
    };
}

bool isProtectedFile(const std::filesystem::path& confDir, const std::filesystem::path& file)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::directory_iterator dir(confDir, ec);
    if (ec) return false;

    for (const auto& entry : dir) {
        if (entry.path().extension() != ".conf") continue;
        if (!entry.is_regular_file(ec)) continue;
        std::ifstream list(entry.path());
        std::string line;
        while (std::getline(list, line)) {
            boost::algorithm::trim(line);
            if (line == file.string()) return true;
        }
    }
    return false;
}

} // namespace qnet
