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

#include "qnet/error_codes.hpp"

#include <format>


namespace qnet {

struct QnetErrorCategory : public std::error_category
{
    const char* name() const noexcept override
    {
        return "qnet";
    }

    std::string message(int code) const override
    {
        switch (static_cast<QnetError>(code)) {
            case QnetError::Ok:
                return "ok";
            case QnetError::LogicError:
                return "expected precondition failed";
            case QnetError::InvalidArgument:
                return "invalid argument";
            case QnetError::SyntaxError:
                return "syntax error in input";
            case QnetError::NotFound:
                return "key or file not found";
            case QnetError::NoAddress:
                return "no IP address configured for interface";
            case QnetError::SocketClosed:
                return "socket closed";
            case QnetError::InterfaceNotFound:
                return "interface not found";
            case QnetError::CommandFailed:
                return "external command failed";
            default:
                return "unexpected error code";
        }
    }

    bool equivalent(int code, const std::error_condition& cond) const noexcept override
    {
        if (cond.category() == std::generic_category()) {
            switch (static_cast<std::errc>(cond.value())) {
            case std::errc::invalid_argument:
                return code == (int)QnetError::InvalidArgument
                    || code == (int)QnetError::SyntaxError;
            case std::errc::no_such_file_or_directory:
                return code == (int)QnetError::NotFound;
            case std::errc::no_such_device:
                return code == (int)QnetError::InterfaceNotFound;
            case std::errc::bad_file_descriptor:
                return code == (int)QnetError::SocketClosed;
            default:
                return false;
            }
        }
        return false;
    }
};

static QnetErrorCategory qnetErrorCategory;

const std::error_category& qnet_error_category()
{
    return qnetErrorCategory;
}

std::error_code make_error_code(QnetError code)
{
    return {static_cast<int>(code), qnetErrorCategory};
}

std::string fmtError(std::error_code ec)
{
    return std::format("{} ({}:{})", ec.message(), ec.category().name(), ec.value());
}

} // namespace qnet
