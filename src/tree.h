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
 * @addtogroup data
 */

/**
 * @file   tree.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief The concrete syntax tree of a journal document
 *
 * A syntax_tree_t owns the text of one journal file along with every
 * node_t describing it.  Nodes never own text of their own: each one
 * records a byte range into the tree's source, a starting point, its
 * grammar kind, and its children in source order.
 */
#ifndef _TREE_H
#define _TREE_H

#include "utils.h"

namespace beautifier {

enum symbol_t {
  SYMBOL_SOURCE_FILE,
  SYMBOL_BLANK_LINE,
  SYMBOL_JOURNAL_ITEM,

  SYMBOL_COMMENT,
  SYMBOL_BLOCK_COMMENT,
  SYMBOL_BLOCK_TEST,

  SYMBOL_DIRECTIVE,
  SYMBOL_OPTION,
  SYMBOL_ACCOUNT_DIRECTIVE,
  SYMBOL_ACCOUNT_SUBDIRECTIVE,
  SYMBOL_COMMODITY_DIRECTIVE,
  SYMBOL_COMMODITY_SUBDIRECTIVE,
  SYMBOL_TAG_DIRECTIVE,
  SYMBOL_PAYEE_DIRECTIVE,
  SYMBOL_WORD_DIRECTIVE,
  SYMBOL_CHAR_DIRECTIVE,

  SYMBOL_ALIAS_SUBDIRECTIVE,
  SYMBOL_NOTE_SUBDIRECTIVE,
  SYMBOL_ASSERT_SUBDIRECTIVE,
  SYMBOL_CHECK_SUBDIRECTIVE,
  SYMBOL_PAYEE_SUBDIRECTIVE,
  SYMBOL_DEFAULT_SUBDIRECTIVE,
  SYMBOL_FORMAT_SUBDIRECTIVE,
  SYMBOL_NOMARKET_SUBDIRECTIVE,
  SYMBOL_VALUE_SUBDIRECTIVE,
  SYMBOL_EVAL_SUBDIRECTIVE,
  SYMBOL_UUID_SUBDIRECTIVE,
  SYMBOL_UNKNOWN_SUBDIRECTIVE,

  SYMBOL_VALUE,
  SYMBOL_ACCOUNT,
  SYMBOL_COMMODITY,
  SYMBOL_TAG,

  SYMBOL_XACT,
  SYMBOL_PLAIN_XACT,
  SYMBOL_PERIODIC_XACT,
  SYMBOL_AUTOMATED_XACT,
  SYMBOL_DATE,
  SYMBOL_EFFECTIVE_DATE,
  SYMBOL_STATUS,
  SYMBOL_CODE,
  SYMBOL_PAYEE,
  SYMBOL_NOTE,
  SYMBOL_INTERVAL,
  SYMBOL_QUERY,

  SYMBOL_POSTING,
  SYMBOL_AMOUNT,
  SYMBOL_QUANTITY,
  SYMBOL_NEGATIVE_QUANTITY,
  SYMBOL_PRICE,
  SYMBOL_BALANCE_ASSERTION,

  SYMBOL_WHITESPACE,
  SYMBOL_TOKEN,
  SYMBOL_ERROR,

  SYMBOL_LAST
};

/**
 * The grammar name of a symbol, such as "plain_xact" or "ERROR".
 */
const char * symbol_name(const symbol_t kind);

optional<symbol_t> find_symbol(const string& name);

struct point_t
{
  std::size_t row;              // 0-based line
  std::size_t column;           // 0-based byte offset within the line

  point_t(std::size_t _row = 0, std::size_t _column = 0)
    : row(_row), column(_column) {}
};

class syntax_tree_t;

class node_t : public noncopyable
{
public:
  typedef std::vector<const node_t *> children_list;

private:
  const syntax_tree_t& tree;
  symbol_t             _kind;
  bool                 named;
  std::size_t          _beg_pos;
  std::size_t          _end_pos;
  point_t              start;
  children_list        _children;

public:
  node_t(const syntax_tree_t& _tree, symbol_t kind, bool _named,
         std::size_t beg_pos, std::size_t end_pos, const point_t& _start)
    : tree(_tree), _kind(kind), named(_named),
      _beg_pos(beg_pos), _end_pos(end_pos), start(_start) {}

  symbol_t kind() const {
    return _kind;
  }

  /**
   * The kind of this node as a string.  Anonymous tokens are named by
   * their own text, the way a grammar names its literal tokens.
   */
  string type() const;

  bool is_named() const {
    return named;
  }
  bool is_error() const {
    return _kind == SYMBOL_ERROR;
  }
  bool has_error() const;

  std::size_t beg_pos() const {
    return _beg_pos;
  }
  std::size_t end_pos() const {
    return _end_pos;
  }
  const point_t& start_point() const {
    return start;
  }

  const children_list& children() const {
    return _children;
  }
  std::size_t child_count() const {
    return _children.size();
  }
  const node_t * child(std::size_t index) const {
    return index < _children.size() ? _children[index] : NULL;
  }

  children_list  named_children() const;
  const node_t * named_child(std::size_t index) const;

  /**
   * Return the first named child of the given kind, or NULL.
   */
  const node_t * find(symbol_t kind) const;

  string text() const;

  /**
   * Render the named structure below this node as an S-expression,
   * e.g. "(journal_item (directive (account_directive (account))))".
   */
  string sexp() const;

  void add_child(const node_t * node) {
    _children.push_back(node);
  }
  void set_end_pos(std::size_t end_pos) {
    _end_pos = end_pos;
  }
};

class syntax_tree_t : public noncopyable
{
  string            source;
  ptr_deque<node_t> nodes;
  node_t *          root_node;

public:
  explicit syntax_tree_t(const string& _source)
    : source(_source), root_node(NULL) {
    TRACE(2, "syntax_tree_t: " << source.length() << " bytes");
  }

  const string& text() const {
    return source;
  }

  const node_t& root() const {
    assert(root_node);
    return *root_node;
  }

  std::size_t size() const {
    return nodes.size();
  }

  node_t * create_node(symbol_t kind, bool named,
                       std::size_t beg_pos, std::size_t end_pos,
                       const point_t& start);

  void set_root(node_t * node) {
    root_node = node;
  }
};

std::ostream& operator<<(std::ostream& out, const node_t& node);

} // namespace beautifier

#endif // _TREE_H
