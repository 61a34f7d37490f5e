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

#ifndef SLURP_MAPPED_VIEW_HEADER
#define SLURP_MAPPED_VIEW_HEADER

// -----------------------------------------------------------------------------
// mapped_view.hpp - Read-only memory mapping of a file region
// -----------------------------------------------------------------------------
//
// A mapped_view makes `length` bytes of a file, starting at an arbitrary
// `offset`, visible as a contiguous read-only array. The mapping is private
// (copy-on-write) and read-only, so no write through it can ever reach the
// file. Once created, the view does not depend on the file handle it was
// created from: the handle may be closed while the view is still in use.
//
// mapped_view is the "Mapped" backend of slurp::file_contents. Most callers
// never create one directly; the reading functions ask a mapper (see
// mapper.hpp) for one and fall back to buffered reads if mapping fails.
//
//   std::error_code error;
//   slurp::mapped_view view;
//   view.map(f.handle(), 4000, 100, error);
//   if (!error) { std::string_view bytes = view.as_string_view(); }
//
// Thread safety:
//   The mapped bytes are immutable and may be read from any number of threads.
//   The view object itself (map(), unmap(), moves) needs external
//   synchronization.
//
// -----------------------------------------------------------------------------

#include "slurp/file.hpp"
#include "slurp/page.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <system_error>

namespace slurp {

/**
 * A read-only, copy-on-write memory mapping of a byte range of a file.
 *
 * Ownership semantics:
 * - Move-only. The mapping is released on destruction or unmap().
 * - The file handle is never owned or retained.
 *
 * Memory layout:
 * - The OS maps pages starting at a page-aligned offset.
 * - data() points at the requested offset inside the first page.
 * - length() is the requested length; mapped_length() includes the
 *   alignment padding in front of data().
 */
class mapped_view
{
public:
    using value_type = char;
    using size_type = size_t;
    using const_reference = const value_type&;
    using const_pointer = const value_type*;
    using difference_type = std::ptrdiff_t;
    using const_iterator = const_pointer;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;
    using handle_type = file_handle_type;

private:
    // First requested byte, offset from the page-aligned mapping start.
    const_pointer data_ = nullptr;

    // Requested length.
    size_type length_ = 0;

    // Length actually mapped, including the alignment padding. Always >= length_.
    size_type mapped_length_ = 0;

public:
    /** Creates an unmapped view. */
    mapped_view() = default;

#ifdef __cpp_exceptions
    /**
     * Maps `length` bytes of the file behind `handle`, starting at `offset`.
     *
     * @throws std::system_error If the region cannot be mapped.
     */
    mapped_view(const handle_type handle, const uint64_t offset, const size_type length)
    {
        std::error_code error;
        map(handle, offset, length, error);
        if(error) { throw std::system_error(error); }
    }
#endif // __cpp_exceptions

    mapped_view(const mapped_view&) = delete;
    mapped_view& operator=(const mapped_view&) = delete;

    mapped_view(mapped_view&& other) noexcept;
    mapped_view& operator=(mapped_view&& other) noexcept;

    ~mapped_view();

    [[nodiscard]] bool is_mapped() const noexcept { return data_ != nullptr; }
    [[nodiscard]] bool empty() const noexcept { return length() == 0; }

    [[nodiscard]] size_type size() const noexcept { return length(); }
    [[nodiscard]] size_type length() const noexcept { return length_; }
    [[nodiscard]] size_type mapped_length() const noexcept { return mapped_length_; }

    /**
     * Number of bytes between the page-aligned start of the mapping and
     * data(). For example, with 4KiB pages a view requested at offset 4100
     * maps from offset 4096 and mapping_offset() is 4.
     */
    [[nodiscard]] size_type mapping_offset() const noexcept
    {
        return mapped_length_ - length_;
    }

    [[nodiscard]] const_pointer data() const noexcept { return data_; }

    [[nodiscard]] const_iterator begin() const noexcept { return data(); }
    [[nodiscard]] const_iterator cbegin() const noexcept { return data(); }
    [[nodiscard]] const_iterator end() const noexcept { return data() + length(); }
    [[nodiscard]] const_iterator cend() const noexcept { return data() + length(); }

    [[nodiscard]] const_reverse_iterator rbegin() const noexcept
    { return const_reverse_iterator(end()); }
    [[nodiscard]] const_reverse_iterator rend() const noexcept
    { return const_reverse_iterator(begin()); }

    [[nodiscard]] const_reference operator[](const size_type i) const noexcept { return data_[i]; }

    [[nodiscard]] std::string_view as_string_view() const noexcept
    {
        return {data(), length()};
    }

    /**
     * Maps `length` bytes of the file behind `handle`, starting at `offset`.
     *
     * The region must lie within the file's current length, `length` must be
     * non-zero and not exceed max_mappable_length(). The handle must be
     * readable; it is not retained.
     *
     * Strong guarantee: if mapping fails, `error` is set and any mapping this
     * view already holds is kept.
     */
    void map(const handle_type handle, const uint64_t offset,
            const size_type length, std::error_code& error);

    /** Releases the mapping. No-op on an unmapped view. */
    void unmap() noexcept;

    void swap(mapped_view& other) noexcept;
};

inline void swap(mapped_view& a, mapped_view& b) noexcept
{
    a.swap(b);
}

} // namespace slurp

#include "slurp/detail/mapped_view.ipp"

#endif // SLURP_MAPPED_VIEW_HEADER
