#include <slurp/cursor.hpp>

#include "test_util.hpp"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

#ifndef _WIN32
#include <unistd.h>
#endif

using slurp::length_spec;
using slurp::seek_origin;
using slurp::detail::checked_offset_add;

static_assert(checked_offset_add(10, -10) == uint64_t(0));
static_assert(!checked_offset_add(10, -11));

int main()
{
    std::error_code error;
    const char* path = "cursor-test-file";
    const std::string buffer = make_pattern(1000);
    write_file(path, buffer);

    // Offset arithmetic.
    {
        constexpr auto u64_max = std::numeric_limits<uint64_t>::max();
        constexpr auto i64_min = std::numeric_limits<int64_t>::min();
        constexpr auto i64_max = std::numeric_limits<int64_t>::max();

        assert(checked_offset_add(5, 3) == uint64_t(8));
        assert(checked_offset_add(5, -3) == uint64_t(2));
        assert(checked_offset_add(0, 0) == uint64_t(0));
        assert(!checked_offset_add(0, -1));
        assert(!checked_offset_add(0, i64_min));
        assert(!checked_offset_add(u64_max, 1));
        assert(checked_offset_add(u64_max, -1) == u64_max - 1);
        assert(checked_offset_add(u64_max, i64_min) == u64_max - uint64_t(i64_max) - 1);
        assert(checked_offset_add(uint64_t(i64_max) + 1, i64_min) == uint64_t(0));
        assert(checked_offset_add(0, i64_max) == uint64_t(i64_max));
    }

    // Reads advance the position by what they returned.
    {
        slurp::cursor c(path);
        assert(c.position() == 0);
        assert(c.cached_length() == uint64_t(buffer.size()));
        assert(c.get_file().is_open());

        auto head = c.next(length_spec::exactly(10));
        assert(head.as_string_view() == buffer.substr(0, 10));
        assert(c.position() == 10);

        auto more = c.next(length_spec::at_most(100), error);
        assert(!error);
        assert(more.as_string_view() == buffer.substr(10, 100));
        assert(c.position() == 110);

        auto rest = c.next(length_spec::until_eof(true));
        assert(rest.as_string_view() == buffer.substr(110));
        assert(c.position() == buffer.size());

        auto nothing = c.next(length_spec::at_most(1));
        assert(nothing.empty());
        assert(c.position() == buffer.size());
    }

    // A failed read leaves the position alone.
    {
        slurp::cursor c(path);
        c.seek(seek_origin::begin, 990);
        auto contents = c.next(length_spec::exactly(11), error);
        assert(error == slurp::errc::length_unsatisfiable);
        assert(contents.empty());
        assert(c.position() == 990);
        error.clear();
    }

    // Seeking relative to the end.
    {
        slurp::cursor c(path);
        assert(c.seek(seek_origin::end, 0) == buffer.size());
        auto contents = c.next(length_spec::at_most(1));
        assert(contents.empty());

        assert(c.seek(seek_origin::end, -3) == buffer.size() - 3);
        contents = c.next(length_spec::until_eof());
        assert(contents.as_string_view() == buffer.substr(buffer.size() - 3));

        assert(c.seek(seek_origin::end, -static_cast<int64_t>(buffer.size())) == 0);

        c.seek(seek_origin::begin, 50);
        c.seek(seek_origin::end, 1, error);
        assert(error == slurp::errc::seek_out_of_range);
        assert(c.position() == 50);
        c.seek(seek_origin::end, -static_cast<int64_t>(buffer.size()) - 1, error);
        assert(error == std::errc::invalid_argument);
        assert(c.position() == 50);
        c.seek(seek_origin::end, std::numeric_limits<int64_t>::min(), error);
        assert(error);
        assert(c.position() == 50);
        error.clear();
    }

    // Seeking relative to the current position.
    {
        slurp::cursor c(path);
        assert(c.seek(seek_origin::current, 100) == 100);
        assert(c.seek(seek_origin::current, -40) == 60);

        const uint64_t returned = c.seek(seek_origin::current, -61, error);
        assert(error == slurp::errc::seek_out_of_range);
        assert(returned == 60);
        assert(c.position() == 60);

        c.seek(seek_origin::current, static_cast<int64_t>(buffer.size()), error);
        assert(error == slurp::errc::seek_out_of_range);
        assert(c.position() == 60);
        error.clear();

        assert(c.seek(seek_origin::current, static_cast<int64_t>(buffer.size()) - 60) == buffer.size());

        bool thrown = false;
        try { c.seek(seek_origin::current, std::numeric_limits<int64_t>::min()); }
        catch(const std::system_error& e) { thrown = e.code() == slurp::errc::seek_out_of_range; }
        assert(thrown);
        assert(c.position() == buffer.size());
    }

    // Absolute seeks may go past the end.
    {
        slurp::cursor c(path);
        assert(c.seek(seek_origin::begin, 5000) == 5000);
        assert(c.position() == 5000);

        auto contents = c.next(length_spec::at_most(10), error);
        assert(!error);
        assert(contents.empty());
        contents = c.next(length_spec::until_eof(true), error);
        assert(!error);
        assert(contents.empty());
        assert(c.position() == 5000);

        c.seek(seek_origin::begin, -1, error);
        assert(error == slurp::errc::seek_out_of_range);
        assert(c.position() == 5000);
        error.clear();
    }

    // The cached length only changes on request.
    {
        const char* growing_path = "cursor-test-growing-file";
        write_file(growing_path, "0123456789");

        slurp::cursor c(growing_path);
        assert(c.stream_length() == 10);
        {
            std::ofstream out(growing_path, std::ios::binary | std::ios::app);
            out << "abcde";
        }
        assert(c.stream_length() == 10);
        auto contents = c.next(length_spec::until_eof(true));
        assert(contents.as_string_view() == "0123456789");

        c.sync_length();
        assert(c.stream_length() == 15);
        contents = c.next(length_spec::until_eof(true));
        assert(contents.as_string_view() == "abcde");
        assert(c.position() == 15);
        std::remove(growing_path);
    }

    // Cursors can be moved.
    {
        slurp::cursor a(path);
        a.seek(seek_origin::begin, 7);
        slurp::cursor b = std::move(a);
        assert(b.position() == 7);
        assert(b.next(length_spec::exactly(3)).as_string_view() == buffer.substr(7, 3));
    }

    // A forced-buffered cursor produces the same bytes.
    {
        slurp::basic_cursor<slurp::no_mapper> c{slurp::file(path)};
        auto contents = c.next(length_spec::exactly(500));
        assert(!contents.is_mapped());
        assert(contents.as_string_view() == buffer.substr(0, 500));
        contents = c.next(length_spec::until_eof());
        assert(contents.as_string_view() == buffer.substr(500));
    }

    // Opening problems.
    {
        auto c = slurp::make_cursor("garbage-that-hopefully-doesnt-exist", error);
        assert(error);
        assert(!c.get_file().is_open());
        assert(!c.cached_length());
        error.clear();

        auto ok = slurp::make_cursor(path, error);
        assert(!error);
        assert(ok.cached_length() == uint64_t(buffer.size()));
    }

#ifndef _WIN32
    // Without a length, end-relative seeks are impossible.
    {
        int fds[2];
        [[maybe_unused]] const int rc = ::pipe(fds);
        assert(rc == 0);
        [[maybe_unused]] const auto written = ::write(fds[1], "0123456789", 10);
        ::close(fds[1]);

        slurp::cursor c{slurp::file(fds[0])};
        assert(!c.cached_length());
        c.stream_length(error);
        assert(error == slurp::errc::length_unknown);
        c.seek(seek_origin::end, 0, error);
        assert(error == slurp::errc::seek_out_of_range);
        assert(c.position() == 0);
        error.clear();

        auto contents = c.next(length_spec::at_most(4));
        assert(contents.as_string_view() == "0123");
        contents = c.next(length_spec::until_eof());
        assert(contents.as_string_view() == "456789");
        assert(c.position() == 10);
    }

    // A bound far beyond what a pipe holds.
    {
        int fds[2];
        [[maybe_unused]] const int rc = ::pipe(fds);
        assert(rc == 0);
        [[maybe_unused]] const auto written = ::write(fds[1], "abc", 3);
        ::close(fds[1]);

        slurp::cursor c{slurp::file(fds[0])};
        auto contents = c.next(length_spec::at_most(size_t(1) << 40), error);
        assert(!error);
        assert(contents.as_string_view() == "abc");
        assert(c.position() == 3);
    }
#endif

    std::printf("all tests passed!\n");
}
