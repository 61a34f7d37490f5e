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

#ifndef SLURP_LENGTH_SPEC_HEADER
#define SLURP_LENGTH_SPEC_HEADER

// -----------------------------------------------------------------------------
// length_spec.hpp - Requested byte ranges and how they resolve
// -----------------------------------------------------------------------------
//
// A length_spec says how many bytes a read should produce: at most `bound`
// bytes (or everything up to end of input when there is no bound), and
// whether that count is a hard requirement (`is_exact`) or an upper limit.
//
// evaluate_length() turns a length_spec, a starting offset and what is known
// about the file's length into the byte count a read must attempt. It is pure
// and does no I/O. Its result decides the backend:
//
//   bounded(0)  -> nothing to read, the result is empty
//   bounded(n)  -> map exactly n bytes, or read them into a buffer
//   unknown     -> read into a growing buffer until end of input
//   impossible  -> the exact count cannot be delivered; fail without I/O
//
// -----------------------------------------------------------------------------

#include "slurp/page.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace slurp {

struct length_spec
{
    /// Maximum number of bytes to read; std::nullopt reads until end of input.
    std::optional<size_t> bound;

    /// If true, the resolved count must be delivered in full or the read
    /// fails. If false, the read returns whatever could be read up to the
    /// resolved count.
    bool is_exact = false;

    /** Reads as much as possible. */
    constexpr length_spec() noexcept = default;

    constexpr length_spec(const std::optional<size_t> bound_, const bool is_exact_) noexcept
        : bound(bound_)
        , is_exact(is_exact_)
    {}

    /**
     * Reads until end of input. With `exact` set, a read that cannot reach
     * the end (an I/O error part way through) fails instead of returning the
     * bytes read so far.
     */
    [[nodiscard]] static constexpr length_spec until_eof(const bool exact = false) noexcept
    {
        return length_spec(std::nullopt, exact);
    }

    /** Reads at most `n` bytes. */
    [[nodiscard]] static constexpr length_spec at_most(const size_t n) noexcept
    {
        return length_spec(n, false);
    }

    /** Reads exactly `n` bytes or fails. */
    [[nodiscard]] static constexpr length_spec exactly(const size_t n) noexcept
    {
        return length_spec(n, true);
    }
};

[[nodiscard]] constexpr bool operator==(const length_spec& a, const length_spec& b) noexcept
{
    return a.bound == b.bound && a.is_exact == b.is_exact;
}

[[nodiscard]] constexpr bool operator!=(const length_spec& a, const length_spec& b) noexcept
{
    return !(a == b);
}

enum class length_kind
{
    unknown,
    impossible,
    bounded,
};

/** The outcome of evaluate_length(). `count` is only meaningful when bounded. */
struct evaluated_length
{
    length_kind kind = length_kind::unknown;
    size_t count = 0;

    [[nodiscard]] static constexpr evaluated_length unknown() noexcept
    {
        return {length_kind::unknown, 0};
    }

    [[nodiscard]] static constexpr evaluated_length impossible() noexcept
    {
        return {length_kind::impossible, 0};
    }

    [[nodiscard]] static constexpr evaluated_length bounded(const size_t n) noexcept
    {
        return {length_kind::bounded, n};
    }
};

[[nodiscard]] constexpr bool operator==(const evaluated_length& a, const evaluated_length& b) noexcept
{
    return a.kind == b.kind && (a.kind != length_kind::bounded || a.count == b.count);
}

[[nodiscard]] constexpr bool operator!=(const evaluated_length& a, const evaluated_length& b) noexcept
{
    return !(a == b);
}

/**
 * Resolves how many bytes a read starting at `offset` must attempt.
 *
 * The available length is the remaining file length (`file_length - offset`,
 * or 0 when the offset is past the end) capped at max_mappable_length(). An
 * unknown file length counts as the cap itself. A missing bound requests the
 * cap.
 *
 * - request <= available: an unbounded request is `unknown` (the end has to
 *   be found by reading), a bounded one resolves to its bound.
 * - request > available, not exact: clamped down to the available length.
 * - request > available, exact, bounded: `impossible`.
 * - request > available, exact, unbounded: the available length if the file
 *   length is what limits it; `unknown` if only the cap does.
 */
[[nodiscard]] constexpr evaluated_length evaluate_length(const uint64_t offset,
        const length_spec& spec, const std::optional<uint64_t> file_length) noexcept
{
    const size_t maxlen_i = max_mappable_length();

    size_t maxlen = maxlen_i;
    if(file_length)
    {
        const uint64_t remaining = offset < *file_length ? *file_length - offset : 0;
        if(remaining < static_cast<uint64_t>(maxlen_i))
        {
            maxlen = static_cast<size_t>(remaining);
        }
    }

    const bool until_eof = !spec.bound;
    const size_t requested = spec.bound.value_or(maxlen_i);

    if(requested > maxlen)
    {
        if(!spec.is_exact) { return evaluated_length::bounded(maxlen); }
        if(!until_eof) { return evaluated_length::impossible(); }
        if(maxlen == maxlen_i) { return evaluated_length::unknown(); }
        return evaluated_length::bounded(maxlen);
    }

    return until_eof ? evaluated_length::unknown() : evaluated_length::bounded(requested);
}

} // namespace slurp

#endif // SLURP_LENGTH_SPEC_HEADER
