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
#include "qnet/store.hpp"

#include "gtest/gtest.h"
#include "utilities.hpp"


TEST(ProcessRunner, Capture)
{
    using namespace qnet;
    ProcessRunner runner;

    auto res = unwrap(runner.capture({"/bin/echo", "hello"}));
    EXPECT_EQ(res.status, 0);
    EXPECT_EQ(res.output, "hello\n");
}

TEST(ProcessRunner, ExitStatus)
{
    using namespace qnet;
    ProcessRunner runner;

    // "sh" is looked up in PATH
    EXPECT_EQ(unwrap(runner.run({"sh", "-c", "exit 3"})), 3);
    EXPECT_EQ(unwrap(runner.run({"sh", "-c", "exit 0"})), 0);
}

TEST(ProcessRunner, MissingProgram)
{
    using namespace qnet;
    ProcessRunner runner;

    auto status = runner.run({"/nonexistent/qnet-missing-program"});
    EXPECT_TRUE(isError(status) || *status != 0);
    if (isError(status)) EXPECT_EQ(status.error(), QnetError::CommandFailed);

    auto res = runner.capture({"qnet-missing-program"});
    ASSERT_TRUE(isError(res));
    EXPECT_EQ(res.error(), QnetError::CommandFailed);

    EXPECT_EQ(runner.run({}).error(), QnetError::InvalidArgument);
}

TEST(ProcessRunner, RunWithInput)
{
    using namespace qnet;
    ProcessRunner runner;

    auto res = unwrap(runner.runWithInput({"cat"}, "table ip qubes-firewall {}\n"));
    EXPECT_EQ(res.status, 0);
    EXPECT_EQ(res.output, "table ip qubes-firewall {}\n");

    // stderr is collected as well
    res = unwrap(runner.runWithInput({"sh", "-c", "cat >&2; exit 1"}, "error"));
    EXPECT_EQ(res.status, 1);
    EXPECT_EQ(res.output, "error");
}

TEST(ProcessRunner, QubesDbUnavailable)
{
    using namespace qnet;
    ProcessRunner runner;
    QubesDbStore store(runner, "/bin/false", "/bin/false");

    auto value = store.read("/qubes-ip");
    ASSERT_TRUE(isError(value));
    EXPECT_EQ(value.error(), QnetError::NotFound);
    EXPECT_EQ(store.readOrEmpty("/qubes-ip"), "");
    EXPECT_TRUE(unwrap(store.list("/qubes-firewall/")).empty());
}
