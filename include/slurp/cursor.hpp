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

#ifndef SLURP_CURSOR_HEADER
#define SLURP_CURSOR_HEADER

// -----------------------------------------------------------------------------
// cursor.hpp - Sequential reads through a file
// -----------------------------------------------------------------------------
//
// A cursor owns a file, remembers the file's length, and keeps a logical
// offset that each read starts from and advances past:
//
//   slurp::cursor c("data.bin");
//   auto magic = c.next(slurp::length_spec::exactly(4));
//   c.seek(slurp::seek_origin::current, 12);
//   auto rest = c.next(slurp::length_spec::until_eof());
//
// The file length is queried when the cursor is created and again only when
// sync_length() is called. It goes stale if the file changes underneath.
//
// Thread safety:
//   None. A cursor and the file it owns must only be used by one thread at a
//   time.
//
// -----------------------------------------------------------------------------

#include "slurp/error.hpp"
#include "slurp/file.hpp"
#include "slurp/file_contents.hpp"
#include "slurp/length_spec.hpp"
#include "slurp/mapper.hpp"
#include "slurp/read.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <system_error>
#include <utility>

namespace slurp {

/** Reference point of a seek, like SEEK_SET, SEEK_CUR and SEEK_END. */
enum class seek_origin
{
    begin,
    current,
    end,
};

namespace detail {

/**
 * Applies a signed `delta` to `offset`, or returns std::nullopt if the result
 * would be negative or would not fit in uint64_t.
 */
[[nodiscard]] constexpr std::optional<uint64_t> checked_offset_add(const uint64_t offset,
        const int64_t delta) noexcept
{
    if(delta < 0)
    {
        // Negate without overflowing on INT64_MIN.
        const uint64_t magnitude = static_cast<uint64_t>(-(delta + 1)) + 1;
        if(magnitude > offset) { return std::nullopt; }
        return offset - magnitude;
    }

    const uint64_t increment = static_cast<uint64_t>(delta);
    if(increment > std::numeric_limits<uint64_t>::max() - offset) { return std::nullopt; }
    return offset + increment;
}

} // namespace detail

template<typename Mapper>
class basic_chunked_reader;

/**
 * A file plus a read position.
 *
 * @tparam Mapper The mapping backend, see mapper.hpp.
 *
 * Move-only, since it owns its file.
 */
template<typename Mapper = os_mapper>
class basic_cursor
{
public:
    using mapper_type = Mapper;

private:
    file file_;
    std::optional<uint64_t> length_;
    uint64_t offset_ = 0;
    Mapper mapper_;

public:
    /**
     * Takes ownership of `f` and caches its length. The cursor starts at
     * offset 0.
     *
     * @param f An open file, or a closed one, in which case every read fails
     * with the error file::read_at reports for an invalid handle.
     * @param mapper The mapping backend tried for every bounded read.
     */
    explicit basic_cursor(file f, Mapper mapper = Mapper())
        : file_(std::move(f))
        , mapper_(std::move(mapper))
    {
        sync_length();
    }

#ifdef __cpp_exceptions
    /**
     * Opens `path` for reading.
     *
     * @param path The file to open.
     * @param mapper The mapping backend tried for every bounded read.
     * @throws std::system_error if the file cannot be opened.
     */
    explicit basic_cursor(const std::filesystem::path& path, Mapper mapper = Mapper())
        : basic_cursor(file(path), std::move(mapper))
    {}
#endif // __cpp_exceptions

    basic_cursor(const basic_cursor&) = delete;
    basic_cursor& operator=(const basic_cursor&) = delete;
    basic_cursor(basic_cursor&&) = default;
    basic_cursor& operator=(basic_cursor&&) = default;

    /**
     * Reads the range described by `spec` starting at position() and moves
     * position() past the bytes returned.
     *
     * The cached length stands in for the file length; the file is only
     * asked when no length is cached. On failure `error` is set and
     * position() does not change. See read_range() for the error codes.
     *
     * @param spec How many bytes to read and whether fewer are acceptable.
     * @param error Cleared on success, set to the failure otherwise.
     * @return The bytes read, mapped or buffered. Empty on failure and at the
     * end of the input.
     */
    [[nodiscard]] file_contents next(const length_spec& spec, std::error_code& error)
    {
        auto contents = detail::read_range(file_, offset_, spec, length_, mapper_, error);
        if(!error) { offset_ += contents.size(); }
        return contents;
    }

    /**
     * Moves the position and returns the new one.
     *
     * - seek_origin::begin sets the position to `delta`, which must not be
     *   negative. Positions past the end of the file are allowed; reads there
     *   produce nothing (or fail, if exact).
     * - seek_origin::current moves by `delta` from position().
     * - seek_origin::end moves by `delta` (<= 0) from the cached length, and
     *   requires one.
     *
     * Relative seeks fail with errc::seek_out_of_range if the result would be
     * negative or past the cached length. On failure the position is
     * unchanged and returned.
     *
     * @param origin What `delta` is relative to.
     * @param delta The signed distance to move.
     * @param error Set to errc::seek_out_of_range on failure.
     * @return The position after the call.
     */
    uint64_t seek(const seek_origin origin, const int64_t delta, std::error_code& error)
    {
        error.clear();

        std::optional<uint64_t> target;
        switch(origin)
        {
        case seek_origin::begin:
            if(delta >= 0) { target = static_cast<uint64_t>(delta); }
            break;
        case seek_origin::current:
            target = detail::checked_offset_add(offset_, delta);
            if(target && length_ && *target > *length_) { target.reset(); }
            break;
        case seek_origin::end:
            if(length_ && delta <= 0)
            {
                target = detail::checked_offset_add(*length_, delta);
            }
            break;
        }

        if(!target)
        {
            error = make_error_code(errc::seek_out_of_range);
            return offset_;
        }
        offset_ = *target;
        return offset_;
    }

    /** The offset the next read starts at. */
    [[nodiscard]] uint64_t position() const noexcept { return offset_; }

    /** The file length cached at construction or by the last sync_length(). */
    [[nodiscard]] std::optional<uint64_t> cached_length() const noexcept { return length_; }

    /**
     * The cached file length.
     *
     * @param error Set to errc::length_unknown if the file has no known
     * length, as for a pipe.
     * @return The length, or 0 on failure.
     */
    uint64_t stream_length(std::error_code& error) const noexcept
    {
        error.clear();
        if(!length_)
        {
            error = make_error_code(errc::length_unknown);
            return 0;
        }
        return *length_;
    }

    /** Re-queries the file length, e.g. after the file was appended to. */
    void sync_length() noexcept { length_ = file_.length(); }

    /**
     * The file being read. Reads through it do not move position().
     *
     * @return A reference valid for the lifetime of this cursor.
     */
    [[nodiscard]] const file& get_file() const noexcept { return file_; }

    /** @return The mapping backend this cursor was built with. */
    [[nodiscard]] const Mapper& mapper() const noexcept { return mapper_; }

    /**
     * Turns the cursor into a reader that repeats `spec` from the current
     * position until the input is exhausted.
     *
     * @param spec The length of every chunk. An exact spec fails on the last
     * chunk if the remaining length is not a multiple of its bound.
     * @return A reader that owns this cursor's file and position.
     */
    [[nodiscard]] basic_chunked_reader<Mapper> chunks(const length_spec& spec) &&;

#ifdef __cpp_exceptions
    /** Throwing version of next(). @throws std::system_error */
    [[nodiscard]] file_contents next(const length_spec& spec)
    {
        std::error_code error;
        auto contents = next(spec, error);
        if(error) { throw std::system_error(error); }
        return contents;
    }

    /** Throwing version of seek(). @throws std::system_error */
    uint64_t seek(const seek_origin origin, const int64_t delta)
    {
        std::error_code error;
        const uint64_t position = seek(origin, delta, error);
        if(error) { throw std::system_error(error); }
        return position;
    }

    /** Throwing version of stream_length(). @throws std::system_error */
    [[nodiscard]] uint64_t stream_length() const
    {
        std::error_code error;
        const uint64_t length = stream_length(error);
        if(error) { throw std::system_error(error); }
        return length;
    }
#endif // __cpp_exceptions
};

using cursor = basic_cursor<os_mapper>;

/**
 * Opens `path` and returns a cursor at its start. On failure `error` is set
 * and the returned cursor holds no file.
 */
template<typename Mapper = os_mapper>
basic_cursor<Mapper> make_cursor(const std::filesystem::path& path, std::error_code& error)
{
    file f;
    f.open(path, error);
    return basic_cursor<Mapper>(std::move(f));
}

} // namespace slurp

#include "slurp/chunked_reader.hpp"

#endif // SLURP_CURSOR_HEADER
