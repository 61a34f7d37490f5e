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

#ifndef SLURP_CHUNKED_READER_HEADER
#define SLURP_CHUNKED_READER_HEADER

// -----------------------------------------------------------------------------
// chunked_reader.hpp - A file as a sequence of chunks
// -----------------------------------------------------------------------------
//
// A chunked_reader applies the same length_spec over and over, from the
// cursor's position onwards, and yields each result as one chunk. The
// sequence ends at the first read that produces no bytes; that empty read is
// not a chunk.
//
//   slurp::chunked_reader chunks = slurp::cursor("data.bin")
//       .chunks(slurp::length_spec::at_most(1 << 20));
//   for (const slurp::file_contents& chunk : chunks) { consume(chunk); }
//
// Without exceptions, or to handle errors without them, call next():
//
//   std::error_code error;
//   while (auto chunk = chunks.next(error)) { consume(*chunk); }
//   if (error) { ... }
//
// The sequence is single-pass: it consumes the cursor's position as it goes.
//
// -----------------------------------------------------------------------------

#include "slurp/cursor.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <system_error>
#include <utility>

namespace slurp {

/**
 * An estimate of how many chunks are left. `upper` is std::nullopt when no
 * upper bound is known.
 */
struct size_estimate
{
    size_t lower = 0;
    std::optional<size_t> upper;
};

/**
 * Reads a file as consecutive chunks of the same length_spec.
 *
 * @tparam Mapper The mapping backend, see mapper.hpp.
 *
 * Owns its cursor and is therefore move-only. Obtain one through
 * basic_cursor::chunks().
 */
template<typename Mapper = os_mapper>
class basic_chunked_reader
{
public:
    using cursor_type = basic_cursor<Mapper>;

private:
    cursor_type cursor_;
    length_spec spec_;

    // Set once a read came back empty or failed; cleared by a seek.
    bool finished_ = false;

    // The chunk an iterator currently points at.
    std::optional<file_contents> current_;

#ifdef __cpp_exceptions
public:
    /**
     * Single-pass input iterator over the chunks. Incrementing reads the next
     * chunk and invalidates references to the previous one.
     */
    class iterator
    {
        friend class basic_chunked_reader;

        basic_chunked_reader* reader_ = nullptr;

        explicit iterator(basic_chunked_reader* reader) noexcept : reader_(reader) {}

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = file_contents;
        using difference_type = std::ptrdiff_t;
        using pointer = file_contents*;
        using reference = file_contents&;

        iterator() = default;

        [[nodiscard]] reference operator*() const noexcept { return *reader_->current_; }
        [[nodiscard]] pointer operator->() const noexcept { return &*reader_->current_; }

        /** @throws std::system_error If the read fails. */
        iterator& operator++()
        {
            reader_->advance();
            if(!reader_->current_) { reader_ = nullptr; }
            return *this;
        }

        [[nodiscard]] friend bool operator==(const iterator& a, const iterator& b) noexcept
        {
            return a.reader_ == b.reader_;
        }

        [[nodiscard]] friend bool operator!=(const iterator& a, const iterator& b) noexcept
        {
            return !(a == b);
        }
    };
#endif // __cpp_exceptions

public:
    /**
     * @param cursor The cursor to read from; chunking starts at its position.
     * @param spec The length of every chunk.
     */
    basic_chunked_reader(cursor_type cursor, const length_spec& spec)
        : cursor_(std::move(cursor))
        , spec_(spec)
    {}

    basic_chunked_reader(const basic_chunked_reader&) = delete;
    basic_chunked_reader& operator=(const basic_chunked_reader&) = delete;
    basic_chunked_reader(basic_chunked_reader&&) = default;
    basic_chunked_reader& operator=(basic_chunked_reader&&) = default;

    /**
     * Reads the next chunk.
     *
     * Returns std::nullopt at the end of the sequence. If the read failed,
     * `error` is set as well; the failure ends the sequence and is reported
     * only once. Once ended, the reader does no more I/O until seek() is
     * called.
     *
     * @param error Cleared, then set if the read failed.
     * @return The next chunk, or std::nullopt when the sequence has ended.
     */
    [[nodiscard]] std::optional<file_contents> next(std::error_code& error)
    {
        error.clear();
        if(finished_) { return std::nullopt; }

        auto contents = cursor_.next(spec_, error);
        if(error || contents.empty())
        {
            finished_ = true;
            return std::nullopt;
        }
        return std::optional<file_contents>(std::move(contents));
    }

    /**
     * Whether the sequence has ended, either at the end of the input or on a
     * failed read.
     *
     * @return true if next() will return std::nullopt without reading.
     */
    [[nodiscard]] bool is_finished() const noexcept { return finished_; }

    /**
     * Estimates the number of chunks left.
     *
     * With a cached file length and a bounded spec, the lower bound is the
     * number of whole chunks between the position and the cached length.
     * There is never an upper bound, since the cached length may be stale.
     *
     * @return {0, 0} for zero-length chunks, {0, std::nullopt} when nothing is
     * known or the sequence has ended.
     */
    [[nodiscard]] size_estimate size_hint() const noexcept
    {
        const auto length = cursor_.cached_length();
        if(finished_ || !length || !spec_.bound) { return {}; }
        if(*spec_.bound == 0) { return {0, size_t(0)}; }

        const uint64_t position = cursor_.position();
        const uint64_t remaining = position < *length ? *length - position : 0;
        const uint64_t whole_chunks = remaining / *spec_.bound;
        if(whole_chunks > std::numeric_limits<size_t>::max())
        {
            return {std::numeric_limits<size_t>::max(), std::nullopt};
        }
        return {static_cast<size_t>(whole_chunks), std::nullopt};
    }

    /**
     * Seeks the underlying cursor, see basic_cursor::seek(). A successful
     * seek resumes a finished sequence from the new position.
     *
     * @param origin What `delta` is relative to.
     * @param delta The signed distance to move.
     * @param error Set to errc::seek_out_of_range on failure.
     * @return The position after the call.
     */
    uint64_t seek(const seek_origin origin, const int64_t delta, std::error_code& error)
    {
        const uint64_t position = cursor_.seek(origin, delta, error);
        if(!error) { finished_ = false; }
        return position;
    }

    /**
     * The cursor the chunks are read through. Moving it does not re-arm a
     * finished sequence; use seek() for that.
     *
     * @return A reference valid for the lifetime of this reader.
     */
    [[nodiscard]] cursor_type& get_cursor() noexcept { return cursor_; }
    [[nodiscard]] const cursor_type& get_cursor() const noexcept { return cursor_; }

    /**
     * Gives back the cursor, positioned after the last chunk read.
     *
     * @return The cursor; this reader is left without a file.
     */
    [[nodiscard]] cursor_type release() && { return std::move(cursor_); }

    /** @return The length_spec applied to every chunk. */
    [[nodiscard]] const length_spec& spec() const noexcept { return spec_; }

#ifdef __cpp_exceptions
    /** Throwing version of seek(). @throws std::system_error */
    uint64_t seek(const seek_origin origin, const int64_t delta)
    {
        std::error_code error;
        const uint64_t position = seek(origin, delta, error);
        if(error) { throw std::system_error(error); }
        return position;
    }

    /**
     * Reads the first chunk and returns an iterator to it.
     * @throws std::system_error If the read fails.
     */
    [[nodiscard]] iterator begin()
    {
        advance();
        return current_ ? iterator(this) : iterator();
    }

    /** @return The iterator every finished sequence compares equal to. */
    [[nodiscard]] iterator end() noexcept { return iterator(); }

private:
    void advance()
    {
        current_.reset();
        std::error_code error;
        current_ = next(error);
        if(error) { throw std::system_error(error); }
    }
#endif // __cpp_exceptions
};

using chunked_reader = basic_chunked_reader<os_mapper>;

template<typename Mapper>
basic_chunked_reader<Mapper> basic_cursor<Mapper>::chunks(const length_spec& spec) &&
{
    return basic_chunked_reader<Mapper>(std::move(*this), spec);
}

} // namespace slurp

#endif // SLURP_CHUNKED_READER_HEADER
