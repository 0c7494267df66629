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

#include <filesystem>
#include <string_view>


namespace qnet {

/// \brief Service flags altering how interfaces are configured.
struct Policy
{
    // Do not install default routes
    bool disableDefaultRoute = false;
    // Do not publish DNS servers in the resolver configuration
    bool disableDnsServer = false;
    // Let NetworkManager configure the interface
    bool networkManager = false;
};

/// \brief Check whether the service flag `name` is set. A flag is set if a
/// file of the same name exists in `flagDir`.
bool isServiceEnabled(const std::filesystem::path& flagDir, std::string_view name);

/// \brief Read all flags of Policy from `flagDir`.
Policy loadPolicy(const std::filesystem::path& flagDir);

/// \brief Check whether `file` is listed in any of the *.conf files in
/// `confDir`. Each line of a list names one protected file by its absolute
/// path.
bool isProtectedFile(const std::filesystem::path& confDir, const std::filesystem::path& file);

} // namespace qnet
