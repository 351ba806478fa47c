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

#include "tree.h"

namespace beautifier {

namespace {
  const char * symbol_names[SYMBOL_LAST] = {
    "source_file",
    "blank_line",
    "journal_item",

    "comment",
    "block_comment",
    "block_test",

    "directive",
    "option",
    "account_directive",
    "account_subdirective",
    "commodity_directive",
    "commodity_subdirective",
    "tag_directive",
    "payee_directive",
    "word_directive",
    "char_directive",

    "alias_subdirective",
    "note_subdirective",
    "assert_subdirective",
    "check_subdirective",
    "payee_subdirective",
    "default_subdirective",
    "format_subdirective",
    "nomarket_subdirective",
    "value_subdirective",
    "eval_subdirective",
    "uuid_subdirective",
    "unknown_subdirective",

    "value",
    "account",
    "commodity",
    "tag",

    "xact",
    "plain_xact",
    "periodic_xact",
    "automated_xact",
    "date",
    "effective_date",
    "status",
    "code",
    "payee",
    "note",
    "interval",
    "query",

    "posting",
    "amount",
    "quantity",
    "negative_quantity",
    "price",
    "balance_assertion",

    "whitespace",
    "token",
    "ERROR"
  };
}

const char * symbol_name(const symbol_t kind)
{
  assert(kind < SYMBOL_LAST);
  return symbol_names[kind];
}

optional<symbol_t> find_symbol(const string& name)
{
  for (int i = 0; i < SYMBOL_LAST; i++)
    if (name == symbol_names[i])
      return static_cast<symbol_t>(i);
  return none;
}

string node_t::type() const
{
  if (_kind == SYMBOL_TOKEN)
    return text();
  return symbol_name(_kind);
}

bool node_t::has_error() const
{
  if (is_error())
    return true;
  for (const node_t * node : _children)
    if (node->has_error())
      return true;
  return false;
}

node_t::children_list node_t::named_children() const
{
  children_list result;
  for (const node_t * node : _children)
    if (node->is_named())
      result.push_back(node);
  return result;
}

const node_t * node_t::named_child(std::size_t index) const
{
  for (const node_t * node : _children) {
    if (node->is_named()) {
      if (index == 0)
        return node;
      index--;
    }
  }
  return NULL;
}

const node_t * node_t::find(symbol_t kind) const
{
  for (const node_t * node : _children)
    if (node->is_named() && node->kind() == kind)
      return node;
  return NULL;
}

string node_t::text() const
{
  const string& source(tree.text());
  assert(_beg_pos <= _end_pos);
  assert(_end_pos <= source.length());
  return string(source, _beg_pos, _end_pos - _beg_pos);
}

string node_t::sexp() const
{
  std::ostringstream out;
  out << '(' << symbol_name(_kind);
  for (const node_t * node : _children)
    if (node->is_named() || node->is_error())
      out << ' ' << node->sexp();
  out << ')';
  return out.str();
}

node_t * syntax_tree_t::create_node(symbol_t kind, bool named,
                                    std::size_t beg_pos, std::size_t end_pos,
                                    const point_t& start)
{
  node_t * node = new node_t(*this, kind, named, beg_pos, end_pos, start);
  nodes.push_back(node);
  return node;
}

std::ostream& operator<<(std::ostream& out, const node_t& node)
{
  out << node.sexp();
  return out;
}

} // namespace beautifier
