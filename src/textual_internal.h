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

#ifndef _TEXTUAL_INTERNAL_H
#define _TEXTUAL_INTERNAL_H

#include <system.hh>

#include "textual.h"

namespace beautifier::detail {

class instance_t : public noncopyable {
public:
  syntax_tree_t& tree;
  const string&  text;

  std::size_t pos;       // offset of the next unread line
  std::size_t linenum;   // row of the next unread line

  std::size_t line_beg;  // the line most recently read
  std::size_t line_end;  // excludes the line terminator and trailing blanks
  std::size_t line_row;

  instance_t(syntax_tree_t& _tree)
      : tree(_tree), text(tree.text()), pos(0), linenum(0),
        line_beg(0), line_end(0), line_row(0) {}

  void parse();

  bool read_line();
  bool peek_whitespace_line() const;

  bool blank_line() const {
    return line_beg == line_end;
  }
  char at(std::size_t offset) const {
    return offset < line_end ? text[offset] : '\0';
  }
  std::size_t skip_ws(std::size_t offset) const {
    while (offset < line_end && (text[offset] == ' ' || text[offset] == '\t'))
      offset++;
    return offset;
  }
  std::size_t next_word(std::size_t offset) const {
    while (offset < line_end && text[offset] != ' ' && text[offset] != '\t')
      offset++;
    return offset;
  }
  bool starts_with(std::size_t offset, const char * word) const;

  node_t * make(symbol_t kind, std::size_t beg, std::size_t end, bool named = true);
  node_t * token(node_t * parent, std::size_t beg, std::size_t end,
                 symbol_t kind = SYMBOL_TOKEN);
  node_t * child(node_t * parent, symbol_t kind, std::size_t beg, std::size_t end);
  node_t * error(std::size_t beg, std::size_t end, const char * reason);

  std::size_t whitespace(node_t * parent, std::size_t offset);

  node_t * read_journal_item();
  node_t * block_directive(symbol_t kind, const char * terminator);
  node_t * option_directive();
  node_t * general_directive(std::size_t beg);

  node_t * account_directive(std::size_t beg, std::size_t keyword_end);
  node_t * commodity_directive(std::size_t beg, std::size_t keyword_end);
  node_t * tag_directive(std::size_t beg, std::size_t keyword_end);
  node_t * payee_directive(std::size_t beg, std::size_t keyword_end);
  node_t * word_directive(std::size_t beg, std::size_t keyword_end);
  node_t * char_directive(std::size_t beg);

  node_t * argument_subdirective(symbol_t kind, std::size_t beg, std::size_t keyword_end);
  node_t * keyword_subdirective(symbol_t kind, std::size_t beg, std::size_t keyword_end);

  node_t * xact_directive();
  node_t * period_xact_directive();
  node_t * automated_xact_directive();
  void parse_xact_body(node_t * xact);

  node_t * parse_post(std::size_t beg);
  node_t * parse_amount(std::size_t& offset);
  std::size_t parse_quantity(std::size_t offset) const;
  std::size_t parse_commodity(std::size_t offset) const;

  std::size_t trailing_note(std::size_t beg) const;
};

} // namespace beautifier::detail

#endif // _TEXTUAL_INTERNAL_H
