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
#include "qnet/process.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace qnet {

/// \brief Read-only view of the VM configuration database.
class ConfigStore
{
public:
    virtual ~ConfigStore() = default;

    /// \brief Read the value of `key`. Fails with QnetError::NotFound if the
    /// key does not exist.
    virtual Maybe<std::string> read(const std::string& key) = 0;

    /// \brief List the full names of all keys starting with `prefix` in
    /// lexicographic order. An empty list is not an error.
    virtual Maybe<std::vector<std::string>> list(const std::string& prefix) = 0;

    /// \brief Read the value of `key`. Returns an empty string if the key
    /// does not exist or cannot be read.
    std::string readOrEmpty(const std::string& key);
};

/// \brief Reads QubesDB through the qubesdb-read and qubesdb-list utilities.
class QubesDbStore : public ConfigStore
{
public:
    QubesDbStore(CommandRunner& runner,
        std::string program = "qubesdb-read", std::string listProgram = "qubesdb-list")
        : runner(runner), program(std::move(program)), listProgram(std::move(listProgram))
    {}

    Maybe<std::string> read(const std::string& key) override;
    Maybe<std::vector<std::string>> list(const std::string& prefix) override;

private:
    CommandRunner& runner;
    std::string program;
    std::string listProgram;
};

/// \brief In-memory store. Can be populated from a file of `key=value` lines
/// for running the tools without access to QubesDB.
class MemoryStore : public ConfigStore
{
public:
    Maybe<std::string> read(const std::string& key) override;
    Maybe<std::vector<std::string>> list(const std::string& prefix) override;

    void set(const std::string& key, std::string value) { values[key] = std::move(value); }
    void erase(const std::string& key) { values.erase(key); }
    void clear() { values.clear(); }

    /// \brief Add all entries from the given file. Empty lines and lines
    /// starting with '#' are ignored.
    std::error_code loadFile(const std::filesystem::path& path);

private:
    std::unordered_map<std::string, std::string> values;
};

} // namespace qnet
