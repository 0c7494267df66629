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

#include "qnet/paths.hpp"
#include "qnet/process.hpp"
#include "qnet/store.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>


struct CommonArguments
{
    qnet::Paths paths;
    std::filesystem::path storeFile;
    spdlog::level::level_enum logLevel = spdlog::level::info;
    std::filesystem::path logFile;
};

/// \brief Add options shared by all tools: logging, an alternative
/// configuration store, and overrides for every path in qnet::Paths.
void addCommonOptions(CLI::App& app, CommonArguments& args);

/// \brief Install the default logger.
void setupLogging(const CommonArguments& args);

/// \brief Open QubesDB or the file given with --store.
std::unique_ptr<qnet::ConfigStore> openStore(const CommonArguments& args, qnet::CommandRunner& runner);
