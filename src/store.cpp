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

#include "qnet/store.hpp"

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>


namespace qnet {

/////////////////
// ConfigStore //
/////////////////

std::string ConfigStore::readOrEmpty(const std::string& key)
{
    auto value = read(key);
    if (value.has_value()) return std::move(*value);
    if (value.error() != QnetError::NotFound)
        spdlog::warn("Reading '{}' failed: {}", key, fmtError(value.error()));
    return std::string();
}

//////////////////
// QubesDbStore //
//////////////////

Maybe<std::string> QubesDbStore::read(const std::string& key)
{
    auto res = runner.capture({program, key});
    if (isError(res)) return Error(res.error());
    // qubesdb-read exits with a non-zero status if the key does not exist
    if (res->status != 0) return Error(QnetError::NotFound);
    auto& value = res->output;
    if (!value.empty() && value.back() == '\n') value.pop_back();
    return std::move(value);
}

Maybe<std::vector<std::string>> QubesDbStore::list(const std::string& prefix)
{
    auto res = runner.capture({listProgram, prefix});
    if (isError(res)) return Error(res.error());
    std::vector<std::string> keys;
    if (res->status != 0) return keys;

    // qubesdb-list prints the key names relative to the prefix
    std::istringstream stream(res->output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) keys.push_back(prefix + line);
    }
    std::ranges::sort(keys);
    return keys;
}

/////////////////
// MemoryStore //
/////////////////

Maybe<std::string> MemoryStore::read(const std::string& key)
{
    if (auto i = values.find(key); i != values.end())
        return i->second;
    else
        return Error(QnetError::NotFound);
}

Maybe<std::vector<std::string>> MemoryStore::list(const std::string& prefix)
{
    std::vector<std::string> keys;
    for (const auto& [key, value] : values) {
        if (key.starts_with(prefix)) keys.push_back(key);
    }
    std::ranges::sort(keys);
    return keys;
}

std::error_code MemoryStore::loadFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) return QnetError::NotFound;

    std::string line;
    unsigned int lineno = 0;
    while (std::getline(file, line)) {
        ++lineno;
        boost::algorithm::trim(line);
        if (line.empty() || line.front() == '#') continue;
        auto sep = line.find('=');
        if (sep == std::string::npos || sep == 0) {
            spdlog::error("{}:{}: expected key=value", path.string(), lineno);
            return QnetError::SyntaxError;
        }
        auto key = boost::algorithm::trim_copy(line.substr(0, sep));
        auto value = boost::algorithm::trim_copy(line.substr(sep + 1));
        values[key] = value;
    }
    return QnetError::Ok;
}

} // namespace qnet
