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

#ifndef SLURP_MAPPED_VIEW_IMPL
#define SLURP_MAPPED_VIEW_IMPL

// -----------------------------------------------------------------------------
// mapped_view.ipp - Platform implementation of slurp::mapped_view
// -----------------------------------------------------------------------------
//
// - Windows: CreateFileMapping / MapViewOfFile / UnmapViewOfFile
// - POSIX: mmap(PROT_READ, MAP_PRIVATE) / munmap
//
// The requested offset is rounded down to a page boundary before mapping and
// the returned data pointer is moved forward by the difference.
//
// -----------------------------------------------------------------------------

#include "slurp/mapped_view.hpp"
#include "slurp/page.hpp"

#include <limits>
#include <utility>

#ifndef _WIN32
# include <sys/mman.h>
# include <sys/stat.h>
# include <sys/types.h>
#endif

namespace slurp {
namespace detail {

/**
 * Returns the size in bytes of the file behind `handle`, or 0 with `error`
 * set if it cannot be queried.
 */
inline uint64_t query_file_size(const file_handle_type handle, std::error_code& error)
{
    error.clear();

#ifdef _WIN32
    LARGE_INTEGER file_size;
    if(::GetFileSizeEx(handle, &file_size) == 0)
    {
        error = detail::last_error();
        return 0;
    }
    return static_cast<uint64_t>(file_size.QuadPart);
#else // POSIX
    struct stat sbuf;
    if(::fstat(handle, &sbuf) == -1)
    {
        error = detail::last_error();
        return 0;
    }
    return static_cast<uint64_t>(sbuf.st_size);
#endif
}

struct mmap_context
{
    char* data = nullptr;
    size_t length = 0;
    size_t mapped_length = 0;
};

/**
 * Maps `length` bytes at `offset` read-only. Returns an empty context with
 * `error` set on failure.
 */
inline mmap_context memory_map(const file_handle_type file_handle, const uint64_t offset,
    const size_t length, std::error_code& error)
{
    const uint64_t aligned_offset = make_offset_page_aligned(offset);
    const size_t padding = static_cast<size_t>(offset - aligned_offset);

    if(length > max_mappable_length() - padding)
    {
        error = std::make_error_code(std::errc::value_too_large);
        return {};
    }
    const size_t length_to_map = padding + length;

#ifdef _WIN32
    // A maximum size of 0 makes the mapping object span the whole file.
    const auto file_mapping_handle = ::CreateFileMapping(
            file_handle, 0, PAGE_READONLY, 0, 0, 0);
    if(file_mapping_handle == 0)
    {
        error = detail::last_error();
        return {};
    }

    char* mapping_start = static_cast<char*>(::MapViewOfFile(
            file_mapping_handle,
            FILE_MAP_READ,
            win::int64_high(aligned_offset),
            win::int64_low(aligned_offset),
            static_cast<SIZE_T>(length_to_map)));

    // The view holds its own reference to the mapping object.
    const auto map_error = detail::last_error();
    ::CloseHandle(file_mapping_handle);
    if(mapping_start == nullptr)
    {
        error = map_error;
        return {};
    }
#else // POSIX
    if(aligned_offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max()))
    {
        error = std::make_error_code(std::errc::value_too_large);
        return {};
    }

    char* mapping_start = static_cast<char*>(::mmap(
            0,
            length_to_map,
            PROT_READ,
            MAP_PRIVATE,
            file_handle,
            static_cast<off_t>(aligned_offset)));

    if(mapping_start == MAP_FAILED)
    {
        error = detail::last_error();
        return {};
    }
#endif

    mmap_context ctx;
    ctx.data = mapping_start + padding;
    ctx.length = length;
    ctx.mapped_length = length_to_map;
    return ctx;
}

} // namespace detail

inline mapped_view::mapped_view(mapped_view&& other) noexcept
    : data_(other.data_)
    , length_(other.length_)
    , mapped_length_(other.mapped_length_)
{
    other.data_ = nullptr;
    other.length_ = other.mapped_length_ = 0;
}

inline mapped_view& mapped_view::operator=(mapped_view&& other) noexcept
{
    if(this != &other)
    {
        unmap();
        data_ = other.data_;
        length_ = other.length_;
        mapped_length_ = other.mapped_length_;
        other.data_ = nullptr;
        other.length_ = other.mapped_length_ = 0;
    }
    return *this;
}

inline mapped_view::~mapped_view()
{
    unmap();
}

inline void mapped_view::map(const handle_type handle, const uint64_t offset,
        const size_type length, std::error_code& error)
{
    error.clear();

    if(handle == invalid_handle)
    {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }

    // Zero-length mappings are rejected by the OS; the region must also be
    // backed by the file, since touching pages past its end raises SIGBUS.
    if(length == 0)
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    const uint64_t file_size = detail::query_file_size(handle, error);
    if(error) { return; }

    if(offset > file_size || length > file_size - offset)
    {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    const auto ctx = detail::memory_map(handle, offset, length, error);
    if(!error)
    {
        unmap();
        data_ = ctx.data;
        length_ = ctx.length;
        mapped_length_ = ctx.mapped_length;
    }
}

inline void mapped_view::unmap() noexcept
{
    if(!is_mapped()) { return; }

    const auto mapping_start = data_ - mapping_offset();
#ifdef _WIN32
    ::UnmapViewOfFile(mapping_start);
#else // POSIX
    ::munmap(const_cast<char*>(mapping_start), mapped_length_);
#endif

    data_ = nullptr;
    length_ = mapped_length_ = 0;
}

inline void mapped_view::swap(mapped_view& other) noexcept
{
    if(this != &other)
    {
        using std::swap;
        swap(data_, other.data_);
        swap(length_, other.length_);
        swap(mapped_length_, other.mapped_length_);
    }
}

} // namespace slurp

#endif // SLURP_MAPPED_VIEW_IMPL
