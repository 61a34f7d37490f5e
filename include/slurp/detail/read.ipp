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

#ifndef SLURP_READ_IMPL
#define SLURP_READ_IMPL

// -----------------------------------------------------------------------------
// read.ipp - Backend selection and buffered reads
// -----------------------------------------------------------------------------

#include "slurp/read.hpp"

#include <algorithm>
#include <utility>

namespace slurp {
namespace detail {

// Initial capacity when reading an input of unknown length.
inline constexpr size_t initial_stream_buffer_size = 8 * 1024;

/**
 * Grows `buffer` so that it can take more bytes past `filled`, doubling from
 * initial_stream_buffer_size but never beyond `limit`.
 */
inline void grow_stream_buffer(file_contents::buffer_type& buffer,
        const size_t filled, const size_t limit)
{
    if(filled < buffer.size()) { return; }
    const size_t wanted = buffer.size() > limit / 2
        ? limit : std::max(initial_stream_buffer_size, buffer.size() * 2);
    buffer.resize(std::min(wanted, limit));
}

inline file_contents finish_buffer(file_contents::buffer_type& buffer, const size_t filled)
{
    buffer.resize(filled);
    buffer.shrink_to_fit();
    return file_contents(std::move(buffer));
}

/**
 * Reads up to `count` bytes at `offset` into a new buffer.
 *
 * `Source` is anything with a `read_at(offset, buffer, count, error)` member
 * that behaves like file::read_at, which may return fewer bytes than asked.
 *
 * Exact reads keep reading until all `count` bytes are in and fail with
 * errc::unexpected_eof if the input ends first.
 *
 * Non-exact reads of an input whose length is known keep reading until
 * `count` bytes are in or a read returns 0, as a positional file only ever
 * reads short because of a per-call cap.
 *
 * Non-exact reads of an input of unknown length (a pipe, a socket) accept
 * the first short read and return what it produced. The buffer grows in
 * steps, so a large `count` costs no more memory than the bytes that arrive.
 * A read that fails after bytes were obtained returns those bytes.
 */
template<typename Source>
file_contents read_bounded(const Source& source, const uint64_t offset, const size_t count,
        const bool is_exact, const bool length_known, std::error_code& error)
{
    file_contents::buffer_type buffer;
    size_t filled = 0;

    if(length_known)
    {
        buffer.resize(count);
    }

    while(filled < count)
    {
        grow_stream_buffer(buffer, filled, count);
        const size_t wanted = buffer.size() - filled;
        const size_t n = source.read_at(offset + filled, buffer.data() + filled,
                wanted, error);
        if(error)
        {
            if(is_exact || length_known || filled == 0) { return {}; }
            error.clear();
            break;
        }
        if(n == 0)
        {
            if(is_exact)
            {
                error = make_error_code(errc::unexpected_eof);
                return {};
            }
            break;
        }
        filled += n;
        if(!is_exact && !length_known && n < wanted) { break; }
    }

    return finish_buffer(buffer, filled);
}

/**
 * Reads from `offset` until end of input into a growing buffer.
 *
 * A read error fails the call if `is_exact` is set or nothing was read yet.
 * Otherwise the bytes read before the error are returned as a success.
 */
template<typename Source>
file_contents read_until_eof(const Source& source, const uint64_t offset,
        const bool is_exact, std::error_code& error)
{
    file_contents::buffer_type buffer;
    size_t filled = 0;

    for(;;)
    {
        grow_stream_buffer(buffer, filled, buffer.max_size());

        const size_t n = source.read_at(offset + filled, buffer.data() + filled,
                buffer.size() - filled, error);
        if(error)
        {
            if(is_exact || filled == 0) { return {}; }
            error.clear();
            break;
        }
        if(n == 0) { break; }
        filled += n;
    }

    return finish_buffer(buffer, filled);
}

template<typename Mapper>
file_contents read_range(const file& f, const uint64_t offset, const length_spec& spec,
        const std::optional<uint64_t> length_hint, const Mapper& mapper, std::error_code& error)
{
    error.clear();

    const auto file_length = length_hint ? length_hint : f.length();
    const evaluated_length length = evaluate_length(offset, spec, file_length);

    switch(length.kind)
    {
    case length_kind::impossible:
        error = make_error_code(errc::length_unsatisfiable);
        return {};

    case length_kind::bounded:
        if(length.count == 0) { return {}; }
        {
            // Any mapping failure just means the range is read instead.
            std::error_code map_error;
            mapped_view view = mapper(f, offset, length.count, map_error);
            if(!map_error) { return file_contents(std::move(view)); }
        }
        return read_bounded(f, offset, length.count, spec.is_exact,
                file_length.has_value(), error);

    case length_kind::unknown:
        // Never map: a mapping needs its length up front.
        break;
    }

    return read_until_eof(f, offset, spec.is_exact, error);
}

} // namespace detail
} // namespace slurp

#endif // SLURP_READ_IMPL
