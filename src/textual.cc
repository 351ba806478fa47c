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

#include "textual_internal.h"

namespace beautifier {

using detail::instance_t;

void instance_t::parse()
{
  TRACE_START(instance_parse, 1, "Done building syntax tree");

  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0)
    pos = 3;

  node_t * root = tree.create_node(SYMBOL_SOURCE_FILE, true, 0, text.length(),
                                   point_t(0, 0));
  tree.set_root(root);

  while (read_line()) {
    if (blank_line()) {
      root->add_child(make(SYMBOL_BLANK_LINE, line_beg, line_end, false));
      continue;
    }
    root->add_child(read_journal_item());
  }

  TRACE_FINISH(instance_parse, 1);
}

bool instance_t::read_line()
{
  if (pos >= text.length())
    return false;

  line_beg = pos;
  line_row = linenum++;

  string::size_type nl = text.find('\n', pos);
  std::size_t end = nl == string::npos ? text.length() : nl;
  pos = nl == string::npos ? text.length() : nl + 1;

  // strip the carriage return and any trailing whitespace
  while (end > line_beg && std::isspace(static_cast<unsigned char>(text[end - 1])))
    end--;
  line_end = end;

  return true;
}

bool instance_t::peek_whitespace_line() const
{
  if (pos >= text.length() || (text[pos] != ' ' && text[pos] != '\t'))
    return false;

  for (std::size_t i = pos; i < text.length() && text[i] != '\n'; i++)
    if (! std::isspace(static_cast<unsigned char>(text[i])))
      return true;
  return false;
}

bool instance_t::starts_with(std::size_t offset, const char * word) const
{
  std::size_t len = std::strlen(word);
  if (offset + len > line_end || text.compare(offset, len, word) != 0)
    return false;
  char next = at(offset + len);
  return next == '\0' || next == ' ' || next == '\t';
}

node_t * instance_t::make(symbol_t kind, std::size_t beg, std::size_t end, bool named)
{
  assert(beg >= line_beg);
  return tree.create_node(kind, named, beg, end, point_t(line_row, beg - line_beg));
}

node_t * instance_t::token(node_t * parent, std::size_t beg, std::size_t end, symbol_t kind)
{
  node_t * node = make(kind, beg, end, false);
  parent->add_child(node);
  return node;
}

node_t * instance_t::child(node_t * parent, symbol_t kind, std::size_t beg, std::size_t end)
{
  node_t * node = make(kind, beg, end);
  parent->add_child(node);
  return node;
}

node_t * instance_t::error(std::size_t beg, std::size_t end, const char * reason)
{
  DEBUG("textual.parse", "line " << (line_row + 1) << ": " << reason);
  return make(SYMBOL_ERROR, beg, end);
}

std::size_t instance_t::whitespace(node_t * parent, std::size_t offset)
{
  std::size_t end = skip_ws(offset);
  if (end > offset)
    token(parent, offset, end, SYMBOL_WHITESPACE);
  return end;
}

node_t * instance_t::read_journal_item()
{
  switch (text[line_beg]) {
  case ' ':
  case '\t':
    return error(line_beg, line_end, "Unexpected whitespace at beginning of line");

  case ';':                     // comments
  case '#':
  case '%':
  case '|':
  case '*': {
    node_t * item = make(SYMBOL_JOURNAL_ITEM, line_beg, line_end);
    child(item, SYMBOL_COMMENT, line_beg, line_end);
    return item;
  }

  case '-':                     // option setting
    return option_directive();

  case '0':
  case '1':
  case '2':
  case '3':
  case '4':
  case '5':
  case '6':
  case '7':
  case '8':
  case '9':
    return xact_directive();
  case '=':                     // automated xact
    return automated_xact_directive();
  case '~':                     // period xact
    return period_xact_directive();

  case '@':
  case '!':
    return general_directive(line_beg + 1);

  default:                      // some other directive
    return general_directive(line_beg);
  }
}

node_t * instance_t::block_directive(symbol_t kind, const char * terminator)
{
  std::size_t beg     = line_beg;
  std::size_t beg_row = line_row;

  while (read_line()) {
    if (starts_with(line_beg, terminator)) {
      node_t * item  = tree.create_node(SYMBOL_JOURNAL_ITEM, true, beg, line_end,
                                        point_t(beg_row, 0));
      node_t * block = tree.create_node(kind, true, beg, line_end,
                                        point_t(beg_row, 0));
      item->add_child(block);
      return item;
    }
  }

  DEBUG("textual.parse", "line " << (beg_row + 1) << ": "
        << "Missing '" << terminator << "'");
  return tree.create_node(SYMBOL_ERROR, true, beg, line_end, point_t(beg_row, 0));
}

node_t * instance_t::option_directive()
{
  node_t * item      = make(SYMBOL_JOURNAL_ITEM, line_beg, line_end);
  node_t * directive = child(item, SYMBOL_DIRECTIVE, line_beg, line_end);
  child(directive, SYMBOL_OPTION, line_beg, line_end);
  return item;
}

node_t * instance_t::general_directive(std::size_t beg)
{
  std::size_t keyword_end = next_word(beg);
  string      keyword(text, beg, keyword_end - beg);

  DEBUG("textual.parse", "line " << (line_row + 1) << ": "
        << "directive '" << keyword << "'");

  if (beg == line_beg) {
    if (keyword == "comment")
      return block_directive(SYMBOL_BLOCK_COMMENT, "end comment");
    if (keyword == "test")
      return block_directive(SYMBOL_BLOCK_TEST, "end test");
  }

  node_t * item      = make(SYMBOL_JOURNAL_ITEM, line_beg, line_end);
  node_t * directive = child(item, SYMBOL_DIRECTIVE, line_beg, line_end);
  node_t * node      = NULL;

  if (keyword == "account")
    node = account_directive(line_beg, keyword_end);
  else if (keyword == "commodity")
    node = commodity_directive(line_beg, keyword_end);
  else if (keyword == "tag")
    node = tag_directive(line_beg, keyword_end);
  else if (keyword == "payee")
    node = payee_directive(line_beg, keyword_end);
  else if (keyword == "include" || keyword == "apply" || keyword == "end" ||
           keyword == "alias" || keyword == "bucket" || keyword == "year" ||
           keyword == "define" || keyword == "def" || keyword == "eval" ||
           keyword == "expr" || keyword == "import" || keyword == "python" ||
           keyword == "value" || keyword == "assert" ||
           keyword == "check")
    node = word_directive(line_beg, keyword_end);
  else if (beg == line_beg && std::strchr("ACDNPYhbiIoO", text[beg]) &&
           (beg + 1 == line_end || std::isspace(static_cast<unsigned char>(text[beg + 1])) ||
            std::isdigit(static_cast<unsigned char>(text[beg + 1]))))
    node = char_directive(line_beg);
  else
    return error(line_beg, line_end, "Unknown directive");

  directive->add_child(node);
  directive->set_end_pos(node->end_pos());
  item->set_end_pos(node->end_pos());
  return item;
}

unique_ptr<syntax_tree_t> parse_journal(const string& text)
{
  if (text.find('\0') != string::npos)
    throw_(parse_error,
           _f("Could not parse file: NUL byte at offset %1%") % text.find('\0'));

  string::const_iterator invalid = utf8::find_invalid(text.begin(), text.end());
  if (invalid != text.end())
    throw_(parse_error,
           _f("Could not parse file: invalid UTF-8 at offset %1%")
           % (invalid - text.begin()));

  unique_ptr<syntax_tree_t> tree(new syntax_tree_t(text));

  instance_t instance(*tree.get());
  instance.parse();

  INFO("Parsed " << instance.linenum << " lines into " << tree->size() << " nodes");

  return tree;
}

} // namespace beautifier
