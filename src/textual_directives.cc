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

namespace {
  struct subdirective_t {
    const char * keyword;
    symbol_t     kind;
    bool         takes_argument;
  };

  const subdirective_t account_subdirectives[] = {
    { "alias",   SYMBOL_ALIAS_SUBDIRECTIVE,   true  },
    { "note",    SYMBOL_NOTE_SUBDIRECTIVE,    true  },
    { "assert",  SYMBOL_ASSERT_SUBDIRECTIVE,  true  },
    { "check",   SYMBOL_CHECK_SUBDIRECTIVE,   true  },
    { "payee",   SYMBOL_PAYEE_SUBDIRECTIVE,   true  },
    { "value",   SYMBOL_VALUE_SUBDIRECTIVE,   true  },
    { "eval",    SYMBOL_EVAL_SUBDIRECTIVE,    true  },
    { "expr",    SYMBOL_EVAL_SUBDIRECTIVE,    true  },
    { "default", SYMBOL_DEFAULT_SUBDIRECTIVE, false },
    { NULL,      SYMBOL_LAST,                 false }
  };

  const subdirective_t commodity_subdirectives[] = {
    { "alias",    SYMBOL_ALIAS_SUBDIRECTIVE,    true  },
    { "note",     SYMBOL_NOTE_SUBDIRECTIVE,     true  },
    { "format",   SYMBOL_FORMAT_SUBDIRECTIVE,   true  },
    { "value",    SYMBOL_VALUE_SUBDIRECTIVE,    true  },
    { "nomarket", SYMBOL_NOMARKET_SUBDIRECTIVE, false },
    { "default",  SYMBOL_DEFAULT_SUBDIRECTIVE,  false },
    { NULL,       SYMBOL_LAST,                  false }
  };

  const subdirective_t tag_subdirectives[] = {
    { "assert", SYMBOL_ASSERT_SUBDIRECTIVE, true },
    { "check",  SYMBOL_CHECK_SUBDIRECTIVE,  true },
    { NULL,     SYMBOL_LAST,                false }
  };

  const subdirective_t payee_subdirectives[] = {
    { "alias", SYMBOL_ALIAS_SUBDIRECTIVE, true },
    { "uuid",  SYMBOL_UUID_SUBDIRECTIVE,  true },
    { NULL,    SYMBOL_LAST,               false }
  };

  // Words that "apply" and "end" may be followed by, e.g. "end apply tag"
  const char * secondary_keywords[] = {
    "apply", "account", "tag", "year", "fixed", "rate", "bucket", "alias",
    "comment", "test", NULL
  };

  bool is_secondary_keyword(const string& word)
  {
    for (const char ** p = secondary_keywords; *p; p++)
      if (word == *p)
        return true;
    return false;
  }

  const subdirective_t * find_subdirective(const subdirective_t * table,
                                           const string& keyword)
  {
    for (const subdirective_t * p = table; p->keyword; p++)
      if (keyword == p->keyword)
        return p;
    return NULL;
  }

  // Reads the indented lines following a directive header.  When
  // `wrapper' is SYMBOL_LAST the subdirectives are direct children.
  // Lines whose keyword is not in `table' become unknown_subdirective
  // nodes, which the formatter skips.
  void read_subdirectives(instance_t& in, node_t * directive,
                          const subdirective_t * table, symbol_t wrapper)
  {
    while (in.peek_whitespace_line()) {
      in.read_line();

      std::size_t beg         = in.skip_ws(in.line_beg);
      std::size_t keyword_end = in.next_word(beg);
      string      keyword(in.text, beg, keyword_end - beg);

      node_t * node = NULL;
      if (const subdirective_t * sub = find_subdirective(table, keyword)) {
        node = sub->takes_argument
          ? in.argument_subdirective(sub->kind, beg, keyword_end)
          : in.keyword_subdirective(sub->kind, beg, keyword_end);

        if (! node->is_error() && wrapper != SYMBOL_LAST) {
          node_t * outer = in.make(wrapper, beg, in.line_end);
          outer->add_child(node);
          node = outer;
        }
      } else {
        DEBUG("textual.parse", "Skipping subdirective '" << keyword << "'");
        node = in.make(SYMBOL_UNKNOWN_SUBDIRECTIVE, beg, in.line_end);
        if (keyword_end > beg)
          in.token(node, beg, keyword_end);
      }

      directive->add_child(node);
      directive->set_end_pos(in.line_end);
    }
  }
}

node_t * instance_t::account_directive(std::size_t beg, std::size_t keyword_end)
{
  node_t * directive = make(SYMBOL_ACCOUNT_DIRECTIVE, beg, line_end);
  token(directive, beg, keyword_end);

  std::size_t p = whitespace(directive, keyword_end);
  if (p == line_end)
    return error(beg, line_end, "Account directive requires an account name");
  child(directive, SYMBOL_ACCOUNT, p, line_end);

  read_subdirectives(*this, directive, account_subdirectives,
                     SYMBOL_ACCOUNT_SUBDIRECTIVE);
  return directive;
}

node_t * instance_t::commodity_directive(std::size_t beg, std::size_t keyword_end)
{
  node_t * directive = make(SYMBOL_COMMODITY_DIRECTIVE, beg, line_end);
  token(directive, beg, keyword_end);

  std::size_t p = whitespace(directive, keyword_end);
  if (p == line_end)
    return error(beg, line_end, "Commodity directive requires a symbol");
  child(directive, SYMBOL_COMMODITY, p, line_end);

  read_subdirectives(*this, directive, commodity_subdirectives,
                     SYMBOL_COMMODITY_SUBDIRECTIVE);
  return directive;
}

node_t * instance_t::tag_directive(std::size_t beg, std::size_t keyword_end)
{
  node_t * directive = make(SYMBOL_TAG_DIRECTIVE, beg, line_end);
  token(directive, beg, keyword_end);

  std::size_t p = whitespace(directive, keyword_end);
  if (p == line_end)
    return error(beg, line_end, "Tag directive requires a tag name");
  child(directive, SYMBOL_TAG, p, line_end);

  read_subdirectives(*this, directive, tag_subdirectives, SYMBOL_LAST);
  return directive;
}

node_t * instance_t::payee_directive(std::size_t beg, std::size_t keyword_end)
{
  node_t * directive = make(SYMBOL_PAYEE_DIRECTIVE, beg, line_end);
  token(directive, beg, keyword_end);

  std::size_t p = whitespace(directive, keyword_end);
  if (p == line_end)
    return error(beg, line_end, "Payee directive requires a payee name");
  child(directive, SYMBOL_PAYEE, p, line_end);

  read_subdirectives(*this, directive, payee_subdirectives, SYMBOL_LAST);
  return directive;
}

node_t * instance_t::argument_subdirective(symbol_t kind, std::size_t beg,
                                           std::size_t keyword_end)
{
  node_t * node = make(kind, beg, line_end);
  token(node, beg, keyword_end);

  std::size_t p = whitespace(node, keyword_end);
  if (p == line_end)
    return error(beg, line_end, "Subdirective requires an argument");

  if (kind == SYMBOL_FORMAT_SUBDIRECTIVE) {
    node_t * amount = parse_amount(p);
    if (! amount || p != line_end)
      return error(beg, line_end, "Could not parse commodity format");
    node->add_child(amount);
  } else {
    child(node, SYMBOL_VALUE, p, line_end);
  }
  return node;
}

node_t * instance_t::keyword_subdirective(symbol_t kind, std::size_t beg,
                                          std::size_t keyword_end)
{
  if (skip_ws(keyword_end) != line_end)
    return error(beg, line_end, "Subdirective does not take an argument");

  node_t * node = make(kind, beg, keyword_end);
  token(node, beg, keyword_end);
  return node;
}

node_t * instance_t::word_directive(std::size_t beg, std::size_t keyword_end)
{
  node_t * directive = make(SYMBOL_WORD_DIRECTIVE, beg, line_end);
  token(directive, beg, keyword_end);

  std::size_t word_beg = beg;
  if (text[word_beg] == '@' || text[word_beg] == '!')
    word_beg++;
  string keyword(text, word_beg, keyword_end - word_beg);

  std::size_t p = whitespace(directive, keyword_end);

  int secondary = keyword == "apply" ? 1 : (keyword == "end" ? 2 : 0);
  while (secondary-- > 0 && p < line_end) {
    std::size_t e = next_word(p);
    if (! is_secondary_keyword(string(text, p, e - p)))
      break;
    token(directive, p, e);
    p = whitespace(directive, e);
  }

  if (p < line_end)
    child(directive, SYMBOL_VALUE, p, line_end);

  return directive;
}

node_t * instance_t::char_directive(std::size_t beg)
{
  node_t * directive = make(SYMBOL_CHAR_DIRECTIVE, beg, line_end);
  token(directive, beg, beg + 1);

  // Timelog entries keep everything after the date and time together
  bool timelog = std::strchr("iIoO", text[beg]) != NULL;
  int  fields  = 0;

  std::size_t p = whitespace(directive, beg + 1);
  while (p < line_end) {
    std::size_t e = p;
    if (timelog && fields == 2) {
      e = line_end;
    } else {
      bool quoted = false;
      while (e < line_end &&
             (quoted || (text[e] != ' ' && text[e] != '\t'))) {
        if (text[e] == '"')
          quoted = ! quoted;
        e++;
      }
    }
    child(directive, SYMBOL_VALUE, p, e);
    fields++;

    p = whitespace(directive, e);
  }

  return directive;
}

} // namespace beautifier
