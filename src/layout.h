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

/**
 * @addtogroup report
 */

/**
 * @file   layout.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief The cursor that formatted output is written through.
 *
 * A layout_t tracks where the next character will land (column and
 * row), how deeply the current construct is nested, and forwards every
 * piece of text to an output_sink_t.  Columns are counted in Unicode
 * code points.
 */
#ifndef _LAYOUT_H
#define _LAYOUT_H

#include "stream.h"

namespace beautifier {

// Postings align their amounts against this column
const std::size_t AMOUNT_COLUMN = 60;

// Spaces per level of indentation
const std::size_t INDENT_WIDTH = 2;

class layout_t : public noncopyable
{
  output_sink_t& sink;

public:
  std::size_t col;
  std::size_t row;
  std::size_t level;
  std::size_t extra_indentation;
  std::size_t num_spaces;

  explicit layout_t(output_sink_t& _sink, std::size_t _num_spaces = INDENT_WIDTH)
    : sink(_sink), col(0), row(0), level(0), extra_indentation(0),
      num_spaces(_num_spaces) {
    TRACE(3, "layout_t: " << num_spaces << " spaces per level");
  }

  void print(const string& str);
  void println(const string& str = empty_string);

  void indent();

  /**
   * Write spaces until the cursor reaches \p column, but never fewer
   * than \p minimum of them.
   */
  void pad_to(std::size_t column, std::size_t minimum = 0);

  void flush() {
    sink.flush();
  }
};

/**
 * @brief Raises the indentation level for the lifetime of the object
 */
class indented_t : public noncopyable
{
  layout_t& layout;

public:
  explicit indented_t(layout_t& _layout) : layout(_layout) {
    layout.level++;
  }
  ~indented_t() {
    layout.level--;
  }
};

} // namespace beautifier

#endif // _LAYOUT_H
