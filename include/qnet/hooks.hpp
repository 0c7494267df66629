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

#include "qnet/process.hpp"

#include <filesystem>
#include <vector>


namespace qnet {

/// \brief List the hooks to run after an IP address change: the executable
/// regular files of each directory in `dirs` sorted by name, followed by
/// `userHook` if it is executable. Missing directories are skipped.
std::vector<std::filesystem::path> collectHooks(
    const std::vector<std::filesystem::path>& dirs, const std::filesystem::path& userHook);

/// \brief Run all hooks returned by collectHooks() without arguments. The exit
/// status of the hooks is ignored.
void runHooks(
    CommandRunner& runner,
    const std::vector<std::filesystem::path>& dirs,
    const std::filesystem::path& userHook);

} // namespace qnet
