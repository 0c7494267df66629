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

#include "qnet/process.hpp"

#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <iterator>


namespace bp = boost::process;

namespace qnet {

static Maybe<std::string> findExecutable(const std::string& name)
{
    if (name.empty()) return Error(QnetError::InvalidArgument);
    if (name.find('/') != std::string::npos) return name;
    auto path = bp::search_path(name);
    if (path.empty()) {
        spdlog::debug("{} not found in PATH", name);
        return Error(QnetError::CommandFailed);
    }
    return path.string();
}

static std::error_code launchFailed(const std::string& program, std::error_code ec)
{
    spdlog::debug("Can't start {}: {}", program, ec.message());
    return QnetError::CommandFailed;
}

Maybe<int> ProcessRunner::run(const std::vector<std::string>& argv)
{
    if (argv.empty()) return Error(QnetError::InvalidArgument);
    auto exe = findExecutable(argv.front());
    if (isError(exe)) return Error(exe.error());

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    std::error_code ec;
    bp::child child(bp::exe = *exe, bp::args = args, bp::std_in < bp::null, ec);
    if (ec) return Error(launchFailed(*exe, ec));
    child.wait(ec);
    if (ec) return Error(ec);

    spdlog::debug("{} exited with status {}", argv.front(), child.exit_code());
    return child.exit_code();
}

Maybe<CommandResult> ProcessRunner::capture(const std::vector<std::string>& argv)
{
    if (argv.empty()) return Error(QnetError::InvalidArgument);
    auto exe = findExecutable(argv.front());
    if (isError(exe)) return Error(exe.error());

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    std::error_code ec;
    bp::ipstream out;
    bp::child child(bp::exe = *exe, bp::args = args,
        bp::std_in < bp::null, bp::std_out > out, bp::std_err > bp::null, ec);
    if (ec) return Error(launchFailed(*exe, ec));

    CommandResult result;
    result.output.assign(std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>());
    child.wait(ec);
    if (ec) return Error(ec);
    result.status = child.exit_code();
    return result;
}

Maybe<CommandResult> ProcessRunner::runWithInput(
    const std::vector<std::string>& argv, std::string_view input)
{
    if (argv.empty()) return Error(QnetError::InvalidArgument);
    auto exe = findExecutable(argv.front());
    if (isError(exe)) return Error(exe.error());

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    std::error_code ec;
    bp::opstream in;
    bp::ipstream out;
    bp::child child(bp::exe = *exe, bp::args = args,
        bp::std_in < in, (bp::std_out & bp::std_err) > out, ec);
    if (ec) return Error(launchFailed(*exe, ec));

    // Rule sets are small enough to fit into the pipe buffers, so writing all
    // input before reading the output does not block.
    in.write(input.data(), (std::streamsize)input.size());
    in.flush();
    in.pipe().close();

    CommandResult result;
    result.output.assign(std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>());
    child.wait(ec);
    if (ec) return Error(ec);
    result.status = child.exit_code();
    return result;
}

} // namespace qnet
