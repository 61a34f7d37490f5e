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

#ifndef SLURP_MAPPER_HEADER
#define SLURP_MAPPER_HEADER

// -----------------------------------------------------------------------------
// mapper.hpp - Mapping backends
// -----------------------------------------------------------------------------
//
// A mapper is the primitive the reading functions use to map a byte range of
// a file. Anything callable as
//
//   mapped_view operator()(const file& f, uint64_t offset, size_t length,
//                          std::error_code& error) const;
//
// can be used. A mapper reports failure through `error`; callers treat every
// failure as a request to read the range into a buffer instead, so a mapper
// never has to decide whether a failure is fatal.
//
// -----------------------------------------------------------------------------

#include "slurp/file.hpp"
#include "slurp/mapped_view.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace slurp {

/** Maps through the operating system. The default backend. */
struct os_mapper
{
    mapped_view operator()(const file& f, const uint64_t offset, const size_t length,
            std::error_code& error) const
    {
        mapped_view view;
        view.map(f.handle(), offset, length, error);
        return view;
    }
};

/** Never maps, so every read is buffered. */
struct no_mapper
{
    mapped_view operator()(const file&, const uint64_t, const size_t,
            std::error_code& error) const
    {
        error = std::make_error_code(std::errc::not_supported);
        return {};
    }
};

} // namespace slurp

#endif // SLURP_MAPPER_HEADER
