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

#include <string>
#include <string_view>
#include <vector>


namespace qnet {

struct CommandResult
{
    int status = 0;
    std::string output;
};

/// \brief Runs helper programs. The first element of `argv` is either an
/// absolute path or a program name that is looked up in PATH.
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    /// \brief Run a program with stdin connected to /dev/null and wait for it
    /// to exit. Returns the exit status of the program.
    virtual Maybe<int> run(const std::vector<std::string>& argv) = 0;

    /// \brief Run a program and collect everything it writes to stdout.
    /// Output to stderr is discarded.
    virtual Maybe<CommandResult> capture(const std::vector<std::string>& argv) = 0;

    /// \brief Run a program with `input` written to its stdin. Collects
    /// stdout and stderr together, for error messages of tools like nft.
    virtual Maybe<CommandResult> runWithInput(
        const std::vector<std::string>& argv, std::string_view input) = 0;
};

/// \brief CommandRunner spawning child processes with Boost.Process. Programs
/// that cannot be started are reported as QnetError::CommandFailed.
class ProcessRunner : public CommandRunner
{
public:
    Maybe<int> run(const std::vector<std::string>& argv) override;
    Maybe<CommandResult> capture(const std::vector<std::string>& argv) override;
    Maybe<CommandResult> runWithInput(
        const std::vector<std::string>& argv, std::string_view input) override;
};

} // namespace qnet
