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

#ifndef SLURP_ERROR_HEADER
#define SLURP_ERROR_HEADER

// -----------------------------------------------------------------------------
// error.hpp - Error codes reported by slurp
// -----------------------------------------------------------------------------
//
// Operating system failures are reported in std::system_category(), verbatim.
// Failures detected by slurp itself use the codes below, which compare equal
// to the closest portable std::errc condition:
//
//   std::error_code error;
//   auto contents = slurp::read_range(file, 0, slurp::length_spec::exactly(64), error);
//   if (error == std::errc::invalid_argument) { ... }   // portable check
//   if (error == slurp::errc::length_unsatisfiable) { ... }  // precise check
//
// -----------------------------------------------------------------------------

#include <string>
#include <system_error>
#include <type_traits>

namespace slurp {

enum class errc
{
    /// An exact byte count was requested that the file cannot provide.
    length_unsatisfiable = 1,
    /// A seek would move the offset below zero or past the known file length.
    seek_out_of_range,
    /// The file length is required but could not be determined.
    length_unknown,
    /// The input ended before an exact read was satisfied.
    unexpected_eof,
};

namespace detail {

class error_category_impl final : public std::error_category
{
public:
    const char* name() const noexcept override { return "slurp"; }

    std::string message(int ev) const override
    {
        switch(static_cast<errc>(ev))
        {
        case errc::length_unsatisfiable: return "length is too big";
        case errc::seek_out_of_range: return "seek out of range";
        case errc::length_unknown: return "file length is unknown";
        case errc::unexpected_eof: return "unexpected end of file";
        }
        return "unknown slurp error";
    }

    std::error_condition default_error_condition(int ev) const noexcept override
    {
        switch(static_cast<errc>(ev))
        {
        case errc::length_unsatisfiable:
        case errc::seek_out_of_range:
        case errc::length_unknown:
            return std::make_error_condition(std::errc::invalid_argument);
        case errc::unexpected_eof:
            return std::make_error_condition(std::errc::io_error);
        }
        return std::error_condition(ev, *this);
    }
};

} // namespace detail

/** Returns the category of all slurp::errc codes. */
inline const std::error_category& error_category() noexcept
{
    static const detail::error_category_impl instance{};
    return instance;
}

// Found by ADL when an errc is converted to std::error_code.
inline std::error_code make_error_code(errc e) noexcept
{
    return std::error_code(static_cast<int>(e), error_category());
}

} // namespace slurp

namespace std {

template<>
struct is_error_code_enum<slurp::errc> : public true_type {};

} // namespace std

#endif // SLURP_ERROR_HEADER
