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

#ifndef SLURP_PAGE_HEADER
#define SLURP_PAGE_HEADER

// -----------------------------------------------------------------------------
// page.hpp - Page granularity and mapping limits
// -----------------------------------------------------------------------------
//
// The OS maps files in whole pages, so a mapping of an arbitrary byte range
// starts at the page boundary at or below the requested offset. On top of the
// page helpers this header defines the largest byte count slurp will ever ask
// the OS to map.
//
// Usage:
//   size_t ps = slurp::page_size();
//   uint64_t aligned = slurp::make_offset_page_aligned(offset);
//
// -----------------------------------------------------------------------------

#ifdef _WIN32
# ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
# endif // WIN32_LEAN_AND_MEAN
# include <windows.h>
#else
# include <unistd.h>
#endif

#include <cstddef>
#include <cstdint>
#include <limits>

namespace slurp {

/**
 * Returns the granularity, in bytes, at which file offsets can be mapped.
 *
 * On Windows this is the allocation granularity (typically 64KiB), which is
 * what MapViewOfFile() requires offsets to be aligned to. On POSIX it is the
 * page size reported by sysconf(_SC_PAGE_SIZE).
 *
 * The value is queried once and cached.
 */
[[nodiscard]] inline size_t page_size()
{
    static const size_t page_size = []
    {
#ifdef _WIN32
        SYSTEM_INFO SystemInfo;
        GetSystemInfo(&SystemInfo);
        return static_cast<size_t>(SystemInfo.dwAllocationGranularity);
#else
        return static_cast<size_t>(sysconf(_SC_PAGE_SIZE));
#endif
    }();
    return page_size;
}

/**
 * Rounds `offset` down to the nearest mappable boundary.
 *
 * File offsets are 64-bit even on 32-bit targets, so unlike the length of a
 * mapping the offset is never narrowed to size_t.
 */
[[nodiscard]] inline uint64_t make_offset_page_aligned(uint64_t offset) noexcept
{
    const uint64_t page_size_ = page_size();
    return offset / page_size_ * page_size_;
}

/**
 * The largest byte count slurp will map or buffer in one piece.
 *
 * A region whose length does not fit a signed pointer-sized integer cannot be
 * addressed as a single object (pointer differences over it would overflow),
 * so this is an absolute ceiling for every resolved length.
 */
[[nodiscard]] constexpr size_t max_mappable_length() noexcept
{
    return static_cast<size_t>(std::numeric_limits<std::ptrdiff_t>::max());
}

} // namespace slurp

#endif // SLURP_PAGE_HEADER
