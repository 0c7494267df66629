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

#include "utilities.hpp"

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>


std::filesystem::path TEST_BASE_PATH;

void setTestBasePath(int argc, char* argv[])
{
    namespace fs = std::filesystem;

    char* env = std::getenv("TEST_BASE_PATH");
    if (argc > 1) {
        TEST_BASE_PATH = fs::path(argv[1]);
    } else if (env) {
        TEST_BASE_PATH = fs::path(env);
    } else {
        TEST_BASE_PATH = fs::current_path();
    }
}

std::string readTextFile(const std::filesystem::path& path)
{
    using namespace std::literals;
    std::ifstream file(path, std::ios_base::binary);
    if (!file.is_open()) throw std::runtime_error("file not found: "s + path.string());
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void writeTextFile(const std::filesystem::path& path, std::string_view content)
{
    using namespace std::literals;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios_base::binary | std::ios_base::trunc);
    if (!file.is_open()) throw std::runtime_error("can't create file: "s + path.string());
    file.write(content.data(), content.size());
}

void makeExecutable(const std::filesystem::path& path)
{
    using std::filesystem::perms;
    std::filesystem::permissions(path,
        perms::owner_exec | perms::group_exec | perms::others_exec,
        std::filesystem::perm_options::add);
}

/////////////////
// TempDirTest //
/////////////////

void TempDirTest::SetUp()
{
    auto name = (std::filesystem::temp_directory_path() / "qnet-test-XXXXXX").string();
    if (!::mkdtemp(name.data())) throw std::runtime_error("mkdtemp failed");
    root = name;
}

void TempDirTest::TearDown()
{
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}
