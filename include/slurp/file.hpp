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

#ifndef SLURP_FILE_HEADER
#define SLURP_FILE_HEADER

// -----------------------------------------------------------------------------
// file.hpp - Owned, read-only OS file handle
// -----------------------------------------------------------------------------
//
// slurp::file is the input every read in this library starts from. It owns a
// POSIX file descriptor or a Windows HANDLE and closes it on destruction. It
// knows how to do exactly three things: report the file's length (if the file
// has one), read bytes at a given offset, and hand its handle to the mapping
// backend.
//
//   std::error_code error;
//   slurp::file f;
//   f.open("data.bin", error);
//   if (error) { ... }
//   std::optional<uint64_t> len = f.length();   // nullopt for pipes, ttys, ...
//
// -----------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>

#ifdef _WIN32
# ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
# endif // WIN32_LEAN_AND_MEAN
# include <windows.h>
#endif // _WIN32

namespace slurp {

#ifdef _WIN32
using file_handle_type = HANDLE;
#else
using file_handle_type = int;
#endif

/**
 * Sentinel value representing an invalid file handle.
 *
 * On Windows this is `const` rather than `constexpr` because
 * INVALID_HANDLE_VALUE involves a cast that MSVC doesn't allow in constexpr.
 */
#ifdef _WIN32
inline const file_handle_type invalid_handle = INVALID_HANDLE_VALUE;
#else
inline constexpr file_handle_type invalid_handle = -1;
#endif

/**
 * An exclusively owned, read-only file handle.
 *
 * Move-only. The handle is closed when the object is destroyed, closed
 * explicitly, or replaced by another open() call. A handle obtained through
 * release() is no longer owned and must be closed by the caller.
 *
 * Reads are positional: they never depend on or change the handle's own file
 * pointer, so the same file can be read at arbitrary offsets in any order.
 * Handles that do not support positional reads (pipes, character devices)
 * are read sequentially instead, and the offset passed to read_at() is then
 * purely logical.
 */
class file
{
public:
    using handle_type = file_handle_type;

    file() = default;

    /** Takes ownership of an already open, readable handle. */
    explicit file(const handle_type handle) noexcept : handle_(handle) {}

#ifdef __cpp_exceptions
    /**
     * Opens `path` for reading. Throws std::system_error on failure.
     */
    explicit file(const std::filesystem::path& path)
    {
        std::error_code error;
        open(path, error);
        if(error) { throw std::system_error(error); }
    }
#endif // __cpp_exceptions

    file(const file&) = delete;
    file& operator=(const file&) = delete;

    file(file&& other) noexcept : handle_(other.handle_)
    {
        other.handle_ = invalid_handle;
    }

    file& operator=(file&& other) noexcept
    {
        if(this != &other)
        {
            close();
            handle_ = other.handle_;
            other.handle_ = invalid_handle;
        }
        return *this;
    }

    ~file() { close(); }

    /**
     * Opens `path` read-only, replacing (and closing) any handle held so far.
     * On failure the previous handle is kept and `error` is set.
     */
    void open(const std::filesystem::path& path, std::error_code& error);

    /** Closes the handle, if any. Safe to call repeatedly. */
    void close() noexcept;

    /** Gives up ownership of the handle without closing it. */
    [[nodiscard]] handle_type release() noexcept
    {
        const handle_type handle = handle_;
        handle_ = invalid_handle;
        return handle;
    }

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }
    [[nodiscard]] bool is_open() const noexcept { return handle_ != invalid_handle; }

    /**
     * Queries the current length of the file.
     *
     * Only regular files have a meaningful length; for everything else
     * (pipes, sockets, terminals, devices) and on any query failure this
     * returns std::nullopt and readers must stream until end of input.
     */
    [[nodiscard]] std::optional<uint64_t> length() const noexcept;

    /**
     * Reads up to `count` bytes at `offset` into `buffer` with a single call
     * to the OS.
     *
     * Returns the number of bytes read, which is 0 at end of input and may be
     * less than `count` even before the end (short reads are not errors).
     * Interrupted calls are restarted.
     */
    size_t read_at(uint64_t offset, char* buffer, size_t count,
            std::error_code& error) const;

private:
    handle_type handle_ = invalid_handle;
};

} // namespace slurp

#include "slurp/detail/file.ipp"

#endif // SLURP_FILE_HEADER
