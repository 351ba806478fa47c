/*
 * Copyright (c) 2003-2023, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <system.hh>

#include "layout.h"
#include "unistring.h"

namespace beautifier {

void layout_t::print(const string& str)
{
  if (str.empty())
    return;

  sink.write(str);

  string::size_type nl = str.rfind('\n');
  if (nl == string::npos) {
    col += unicode_length(str);
  } else {
    // Verbatim blocks may span several lines
    row += static_cast<std::size_t>(std::count(str.begin(), str.end(), '\n'));
    col  = unicode_length(string(str, nl + 1));
  }
}

void layout_t::println(const string& str)
{
  print(str);
  sink.write("\n");
  col = 0;
  row++;
}

void layout_t::indent()
{
  std::size_t width = level * num_spaces + extra_indentation;
  if (width > 0)
    print(string(width, ' '));
}

void layout_t::pad_to(std::size_t column, std::size_t minimum)
{
  std::size_t spaces = column > col ? column - col : 0;
  if (spaces < minimum)
    spaces = minimum;
  if (spaces > 0)
    print(string(spaces, ' '));
}

} // namespace beautifier
