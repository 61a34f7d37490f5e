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

#ifndef SLURP_READ_HEADER
#define SLURP_READ_HEADER

// -----------------------------------------------------------------------------
// read.hpp - One-shot reads of a file or a byte range of it
// -----------------------------------------------------------------------------
//
// read_range() reads the bytes described by a length_spec starting at a file
// offset and returns them as a file_contents. It maps the range when it can
// and reads it into a buffer otherwise; the caller sees the same result
// either way. A failed mapping is never an error by itself.
//
//   std::error_code error;
//   slurp::file f("data.bin");
//   auto header = slurp::read_range(f, 0, slurp::length_spec::exactly(16), error);
//   auto body = slurp::read_range(f, 16, slurp::length_spec::until_eof(), error);
//
// read_range() keeps no state between calls. For sequential reads, see
// slurp::cursor and slurp::chunked_reader.
//
// -----------------------------------------------------------------------------

#include "slurp/error.hpp"
#include "slurp/file.hpp"
#include "slurp/file_contents.hpp"
#include "slurp/length_spec.hpp"
#include "slurp/mapper.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>

namespace slurp {
namespace detail {

/**
 * Resolves `spec` at `offset` and performs the read.
 *
 * `length_hint` is used as the file length when set; otherwise the file is
 * asked for its length.
 */
template<typename Mapper>
file_contents read_range(const file& f, uint64_t offset, const length_spec& spec,
        std::optional<uint64_t> length_hint, const Mapper& mapper, std::error_code& error);

} // namespace detail

/**
 * Reads the range described by `spec`, starting at `offset`, using `mapper`
 * to map it.
 *
 * On failure `error` is set and the returned contents are empty:
 * - errc::length_unsatisfiable if `spec` demands more bytes than the file
 *   has past `offset` (no I/O is attempted);
 * - errc::unexpected_eof if an exact read ran out of input;
 * - the OS error if reading failed.
 */
template<typename Mapper>
[[nodiscard]] file_contents read_range(const file& f, const uint64_t offset,
        const length_spec& spec, const Mapper& mapper, std::error_code& error)
{
    return detail::read_range(f, offset, spec, std::nullopt, mapper, error);
}

/** Reads the range described by `spec`, starting at `offset`. */
template<typename Mapper = os_mapper>
[[nodiscard]] file_contents read_range(const file& f, const uint64_t offset,
        const length_spec& spec, std::error_code& error)
{
    return read_range(f, offset, spec, Mapper(), error);
}

/** Reads all of `f`, from offset 0 to its end. */
[[nodiscard]] inline file_contents read_whole_file(const file& f, std::error_code& error)
{
    return read_range(f, 0, length_spec::until_eof(true), error);
}

/** Opens `path` and reads all of it. The file is closed before returning. */
[[nodiscard]] inline file_contents read_whole_file(const std::filesystem::path& path,
        std::error_code& error)
{
    file f;
    f.open(path, error);
    if(error) { return {}; }
    return read_whole_file(f, error);
}

#ifdef __cpp_exceptions
/** Throwing version of read_range(). @throws std::system_error */
template<typename Mapper = os_mapper>
[[nodiscard]] file_contents read_range(const file& f, const uint64_t offset,
        const length_spec& spec)
{
    std::error_code error;
    auto contents = read_range<Mapper>(f, offset, spec, error);
    if(error) { throw std::system_error(error); }
    return contents;
}

/** Throwing version of read_whole_file(). @throws std::system_error */
[[nodiscard]] inline file_contents read_whole_file(const file& f)
{
    std::error_code error;
    auto contents = read_whole_file(f, error);
    if(error) { throw std::system_error(error); }
    return contents;
}

/** Throwing version of read_whole_file(). @throws std::system_error */
[[nodiscard]] inline file_contents read_whole_file(const std::filesystem::path& path)
{
    std::error_code error;
    auto contents = read_whole_file(path, error);
    if(error) { throw std::system_error(error); }
    return contents;
}
#endif // __cpp_exceptions

} // namespace slurp

#include "slurp/detail/read.ipp"

#endif // SLURP_READ_HEADER
