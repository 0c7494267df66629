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

#include "qnet/hooks.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <algorithm>


namespace qnet {

static bool isExecutableFile(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::filesystem::path> collectHooks(
    const std::vector<std::filesystem::path>& dirs, const std::filesystem::path& userHook)
{
    namespace fs = std::filesystem;
    std::vector<fs::path> hooks;

    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::directory_iterator iter(dir, ec);
        if (ec) continue;
        std::vector<fs::path> scripts;
        for (const auto& entry : iter) {
            if (isExecutableFile(entry.path())) scripts.push_back(entry.path());
        }
        std::ranges::sort(scripts, {}, [] (const fs::path& p) { return p.filename(); });
        hooks.insert(hooks.end(), scripts.begin(), scripts.end());
    }

    if (!userHook.empty() && isExecutableFile(userHook))
        hooks.push_back(userHook);
    return hooks;
}

void runHooks(
    CommandRunner& runner,
    const std::vector<std::filesystem::path>& dirs,
    const std::filesystem::path& userHook)
{
    for (const auto& hook : collectHooks(dirs, userHook)) {
        auto res = runner.run({hook.string()});
        if (isError(res))
            spdlog::warn("Can't run hook {}: {}", hook.string(), fmtError(res.error()));
        else
            spdlog::debug("Hook {} exited with status {}", hook.string(), *res);
    }
}

} // namespace qnet
