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

#include <expected>
#include <string>
#include <system_error>
#include <type_traits>


namespace qnet {

enum class QnetError : int
{
    Ok = 0,
    LogicError,
    InvalidArgument,
    SyntaxError,
    NotFound,
    NoAddress,
    SocketClosed,
    InterfaceNotFound,
    CommandFailed,
};

const std::error_category& qnet_error_category();
std::error_code make_error_code(QnetError code);

/// \brief Result of an operation that either returns a value or fails with
/// an error code.
template <typename T>
using Maybe = std::expected<T, std::error_code>;

inline std::unexpected<std::error_code> Error(std::error_code ec)
{
    return std::unexpected<std::error_code>(ec);
}

template <typename T>
inline bool isError(const Maybe<T>& maybe)
{
    return !maybe.has_value();
}

/// \brief Format an error code as "<message> (<category>:<value>)".
std::string fmtError(std::error_code ec);

} // namespace qnet

template <>
struct std::is_error_code_enum<qnet::QnetError> : std::true_type {};
