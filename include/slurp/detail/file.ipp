/* Copyright 2017 https://github.com/mandreyel
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this
 * software and associated documentation files (the "Software"), to deal in the Software
 * without restriction, including without limitation the rights to use, copy, modify,
 * merge, publish, distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be included in all copies
 * or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 * INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A
 * PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF
 * CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
 * OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef SLURP_FILE_IMPL
#define SLURP_FILE_IMPL

// -----------------------------------------------------------------------------
// file.ipp - Platform implementation of slurp::file
// -----------------------------------------------------------------------------
//
// - Windows: CreateFileW / GetFileSizeEx / ReadFile with an OVERLAPPED offset
// - POSIX: open / fstat / pread, falling back to read for unseekable handles
//
// -----------------------------------------------------------------------------

#include "slurp/file.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>

#ifndef _WIN32
# include <climits>
# include <unistd.h>
# include <fcntl.h>
# include <sys/stat.h>
# include <sys/types.h>
#endif

namespace slurp {
namespace detail {

#ifdef _WIN32
namespace win {

/** Upper 32 bits of a 64-bit value, for APIs taking split DWORD pairs. */
inline DWORD int64_high(uint64_t n) noexcept
{
    return static_cast<DWORD>(n >> 32);
}

/** Lower 32 bits of a 64-bit value. */
inline DWORD int64_low(uint64_t n) noexcept
{
    return static_cast<DWORD>(n & 0xffffffff);
}

} // namespace win
#endif // _WIN32

/**
 * Returns the last system error as a std::error_code.
 *
 * Must be called immediately after the failed system call, before anything
 * else has a chance to overwrite errno / GetLastError().
 */
inline std::error_code last_error() noexcept
{
    std::error_code error;
#ifdef _WIN32
    error.assign(static_cast<int>(GetLastError()), std::system_category());
#else
    error.assign(errno, std::system_category());
#endif
    return error;
}

} // namespace detail

inline void file::open(const std::filesystem::path& path, std::error_code& error)
{
    error.clear();

    if(path.empty())
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }

#ifdef _WIN32
    const handle_type handle = ::CreateFileW(
            path.c_str(),
            GENERIC_READ,
            FILE_SHARE_READ | FILE_SHARE_WRITE,
            0,
            OPEN_EXISTING,
            FILE_ATTRIBUTE_NORMAL,
            0);
#else // POSIX
    const handle_type handle = ::open(path.c_str(), O_RDONLY);
#endif

    if(handle == invalid_handle)
    {
        error = detail::last_error();
        return;
    }

    close();
    handle_ = handle;
}

inline void file::close() noexcept
{
    if(!is_open()) { return; }
#ifdef _WIN32
    ::CloseHandle(handle_);
#else
    ::close(handle_);
#endif
    handle_ = invalid_handle;
}

inline std::optional<uint64_t> file::length() const noexcept
{
    if(!is_open()) { return std::nullopt; }

#ifdef _WIN32
    if(::GetFileType(handle_) != FILE_TYPE_DISK) { return std::nullopt; }
    LARGE_INTEGER file_size;
    if(::GetFileSizeEx(handle_, &file_size) == 0) { return std::nullopt; }
    return static_cast<uint64_t>(file_size.QuadPart);
#else // POSIX
    struct stat sbuf;
    if(::fstat(handle_, &sbuf) == -1 || !S_ISREG(sbuf.st_mode))
    {
        return std::nullopt;
    }
    return static_cast<uint64_t>(sbuf.st_size);
#endif
}

inline size_t file::read_at(const uint64_t offset, char* buffer, const size_t count,
        std::error_code& error) const
{
    error.clear();

    if(!is_open())
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    if(count == 0) { return 0; }

#ifdef _WIN32
    const DWORD to_read = static_cast<DWORD>(
            (std::min<size_t>)(count, (std::numeric_limits<DWORD>::max)()));
    DWORD bytes_read = 0;

    if(::GetFileType(handle_) == FILE_TYPE_DISK)
    {
        OVERLAPPED overlapped{};
        overlapped.Offset = detail::win::int64_low(offset);
        overlapped.OffsetHigh = detail::win::int64_high(offset);
        if(::ReadFile(handle_, buffer, to_read, &bytes_read, &overlapped) == 0)
        {
            if(::GetLastError() == ERROR_HANDLE_EOF) { return 0; }
            error = detail::last_error();
            return 0;
        }
    }
    else if(::ReadFile(handle_, buffer, to_read, &bytes_read, nullptr) == 0)
    {
        // The writing end of a pipe was closed: that is end of input.
        if(::GetLastError() == ERROR_BROKEN_PIPE) { return 0; }
        error = detail::last_error();
        return 0;
    }
    return static_cast<size_t>(bytes_read);
#else // POSIX
    if(offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max()))
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return 0;
    }

    const size_t to_read = std::min(count, static_cast<size_t>(SSIZE_MAX));
    bool positional = true;
    for(;;)
    {
        const ssize_t n = positional
            ? ::pread(handle_, buffer, to_read, static_cast<off_t>(offset))
            : ::read(handle_, buffer, to_read);
        if(n >= 0) { return static_cast<size_t>(n); }
        if(errno == EINTR) { continue; }
        if(errno == ESPIPE && positional)
        {
            positional = false;
            continue;
        }
        error = detail::last_error();
        return 0;
    }
#endif
}

} // namespace slurp

#endif // SLURP_FILE_IMPL
