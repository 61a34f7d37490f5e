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

#ifndef SLURP_FILE_CONTENTS_HEADER
#define SLURP_FILE_CONTENTS_HEADER

// -----------------------------------------------------------------------------
// file_contents.hpp - Uniform handle over mapped or buffered bytes
// -----------------------------------------------------------------------------
//
// Every read in slurp produces a file_contents. It holds either a mapped_view
// or an owned byte buffer and presents both the same way, as a read-only
// contiguous range of chars:
//
//   slurp::file_contents contents = slurp::read_whole_file("data.bin");
//   std::string_view bytes = contents.as_string_view();
//   if (contents.is_mapped()) { ... }   // only if the backend matters
//
// -----------------------------------------------------------------------------

#include "slurp/mapped_view.hpp"

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace slurp {

/**
 * The bytes produced by a read, backed either by a memory mapping or by an
 * owned buffer.
 *
 * Move-only. The object exclusively owns its mapping or buffer; nothing else
 * refers to them, and they are released when the object is destroyed. The
 * bytes never change for the lifetime of the object.
 *
 * A default-constructed file_contents is an empty buffer.
 */
class file_contents
{
public:
    using value_type = char;
    using size_type = size_t;
    using buffer_type = std::vector<char>;
    using const_pointer = const value_type*;
    using const_iterator = const_pointer;
    using const_reference = const value_type&;

private:
    std::variant<buffer_type, mapped_view> storage_;

public:
    file_contents() = default;

    explicit file_contents(mapped_view view) noexcept
        : storage_(std::in_place_type<mapped_view>, std::move(view))
    {}

    explicit file_contents(buffer_type buffer) noexcept
        : storage_(std::in_place_type<buffer_type>, std::move(buffer))
    {}

    file_contents(const file_contents&) = delete;
    file_contents& operator=(const file_contents&) = delete;
    file_contents(file_contents&&) = default;
    file_contents& operator=(file_contents&&) = default;

    /** True if the bytes are a memory mapping, false if they are buffered. */
    [[nodiscard]] bool is_mapped() const noexcept
    {
        return std::holds_alternative<mapped_view>(storage_);
    }

    [[nodiscard]] const_pointer data() const noexcept
    {
        if(const auto* view = std::get_if<mapped_view>(&storage_))
        {
            return view->data();
        }
        return std::get<buffer_type>(storage_).data();
    }

    [[nodiscard]] size_type size() const noexcept
    {
        if(const auto* view = std::get_if<mapped_view>(&storage_))
        {
            return view->size();
        }
        return std::get<buffer_type>(storage_).size();
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] const_iterator begin() const noexcept { return data(); }
    [[nodiscard]] const_iterator end() const noexcept { return data() + size(); }

    [[nodiscard]] const_reference operator[](const size_type i) const noexcept
    {
        return data()[i];
    }

    /** The contents as one read-only byte slice. */
    [[nodiscard]] std::string_view as_string_view() const noexcept
    {
        return {data(), size()};
    }
};

} // namespace slurp

#endif // SLURP_FILE_CONTENTS_HEADER
