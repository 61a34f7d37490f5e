#ifndef SLURP_TEST_UTIL_HEADER
#define SLURP_TEST_UTIL_HEADER

#include <slurp/file.hpp>
#include <slurp/mapped_view.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

// Printable ASCII, cycling, so that any misplaced byte shows up in a diff.
inline std::string make_pattern(const size_t size)
{
    std::string buffer(size, 0);
    char v = 33;
    for(auto& b : buffer)
    {
        b = v;
        ++v;
        v %= 126;
        if(v == 0) { v = 33; }
    }
    return buffer;
}

inline void write_file(const char* path, const std::string& contents)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << contents;
}

inline std::string read_file_with_stream(const char* path)
{
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Forwards to the OS mapper and counts how often it was asked.
struct counting_mapper
{
    int* calls;

    slurp::mapped_view operator()(const slurp::file& f, const uint64_t offset,
            const size_t length, std::error_code& error) const
    {
        ++*calls;
        slurp::mapped_view view;
        view.map(f.handle(), offset, length, error);
        return view;
    }
};

// Reads through a file but hands out at most `cap` bytes per call, like a
// pread that stops at its per-call limit.
struct capped_source
{
    const slurp::file* f;
    size_t cap;
    int* calls;

    size_t read_at(const uint64_t offset, char* buffer, const size_t count,
            std::error_code& error) const
    {
        ++*calls;
        return f->read_at(offset, buffer, (std::min)(count, cap), error);
    }
};

// Serves `contents` in pieces of at most `piece` bytes, then fails every
// further read with EIO, like a connection that is reset mid-stream.
struct failing_source
{
    std::string contents;
    size_t piece;

    size_t read_at(const uint64_t offset, char* buffer, const size_t count,
            std::error_code& error) const
    {
        if(offset >= contents.size())
        {
            error = std::error_code(EIO, std::system_category());
            return 0;
        }
        const size_t n = (std::min)({count, piece, size_t(contents.size() - offset)});
        std::memcpy(buffer, contents.data() + offset, n);
        return n;
    }
};

#endif // SLURP_TEST_UTIL_HEADER
