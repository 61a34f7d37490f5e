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

#ifndef SLURP_HEADER
#define SLURP_HEADER

// -----------------------------------------------------------------------------
// slurp.hpp - Everything in one include
// -----------------------------------------------------------------------------
//
// slurp reads files into memory, mapping them where possible and buffering
// them where not, behind one read-only handle (slurp::file_contents):
//
//   slurp::read_whole_file / slurp::read_range   one-shot reads
//   slurp::cursor                                 reads from a moving position
//   slurp::chunked_reader                         a file as a sequence of chunks
//
// -----------------------------------------------------------------------------

#include "slurp/page.hpp"
#include "slurp/error.hpp"
#include "slurp/file.hpp"
#include "slurp/mapped_view.hpp"
#include "slurp/mapper.hpp"
#include "slurp/length_spec.hpp"
#include "slurp/file_contents.hpp"
#include "slurp/read.hpp"
#include "slurp/cursor.hpp"
#include "slurp/chunked_reader.hpp"

#endif // SLURP_HEADER
