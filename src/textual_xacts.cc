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
  inline bool is_date_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) ||
      c == '/' || c == '-' || c == '.';
  }

  inline bool is_commodity_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc >= 0x80)
      return true;
    if (std::isspace(uc) || std::isdigit(uc))
      return false;
    return std::strchr("-.,@;=(){}[]\"", c) == NULL;
  }
}

std::size_t instance_t::trailing_note(std::size_t beg) const
{
  // A note begins at a semicolon preceded by a tab or two spaces
  std::size_t spaces = 0;
  std::size_t tabs   = 0;
  for (std::size_t p = beg; p < line_end; p++) {
    if (text[p] == ' ') {
      spaces++;
    } else if (text[p] == '\t') {
      tabs++;
    } else if (text[p] == ';' && (tabs > 0 || spaces > 1)) {
      return p;
    } else {
      spaces = tabs = 0;
    }
  }
  return line_end;
}

node_t * instance_t::xact_directive()
{
  node_t * item  = make(SYMBOL_JOURNAL_ITEM, line_beg, line_end);
  node_t * xact  = child(item, SYMBOL_XACT, line_beg, line_end);
  node_t * plain = child(xact, SYMBOL_PLAIN_XACT, line_beg, line_end);

  std::size_t p = line_beg;
  std::size_t e = p;
  while (e < line_end && is_date_char(text[e]))
    e++;
  child(plain, SYMBOL_DATE, p, e);

  if (at(e) == '=') {
    token(plain, e, e + 1);
    p = ++e;
    while (e < line_end && is_date_char(text[e]))
      e++;
    if (e == p)
      return error(line_beg, line_end, "Expected an effective date after '='");
    child(plain, SYMBOL_EFFECTIVE_DATE, p, e);
  }

  if (e < line_end && text[e] != ' ' && text[e] != '\t')
    return error(line_beg, line_end, "Invalid date in transaction header");

  p = whitespace(plain, e);

  if (at(p) == '*' || at(p) == '!') {
    child(plain, SYMBOL_STATUS, p, p + 1);
    p = whitespace(plain, p + 1);
  }

  if (at(p) == '(') {
    string::size_type close = text.find(')', p);
    if (close != string::npos && close < line_end) {
      child(plain, SYMBOL_CODE, p, close + 1);
      p = whitespace(plain, close + 1);
    }
  }

  if (p < line_end) {
    std::size_t note = at(p) == ';' ? p : trailing_note(p);
    if (note > p) {
      e = note;
      while (text[e - 1] == ' ' || text[e - 1] == '\t')
        e--;
      child(plain, SYMBOL_PAYEE, p, e);
      whitespace(plain, e);
    }
    if (note < line_end)
      child(plain, SYMBOL_NOTE, note, line_end);
  }

  parse_xact_body(plain);

  xact->set_end_pos(plain->end_pos());
  item->set_end_pos(plain->end_pos());
  return item;
}

namespace {
  // Periodic and automated transactions share a header layout: a marker
  // character, the period or query expression, and an optional note.
  node_t * conditional_xact(instance_t& in, symbol_t kind, symbol_t expr_kind)
  {
    node_t * item = in.make(SYMBOL_JOURNAL_ITEM, in.line_beg, in.line_end);
    node_t * xact = in.child(item, SYMBOL_XACT, in.line_beg, in.line_end);
    node_t * cond = in.child(xact, kind, in.line_beg, in.line_end);

    in.token(cond, in.line_beg, in.line_beg + 1);
    std::size_t p = in.whitespace(cond, in.line_beg + 1);

    string::size_type note = in.text.find(';', p);
    if (note == string::npos || note > in.line_end)
      note = in.line_end;

    std::size_t e = note;
    while (e > p && (in.text[e - 1] == ' ' || in.text[e - 1] == '\t'))
      e--;
    if (e == p)
      return in.error(in.line_beg, in.line_end,
                      kind == SYMBOL_PERIODIC_XACT ?
                      "Expected a period after '~'" :
                      "Expected a predicate after '='");

    in.child(cond, expr_kind, p, e);
    in.whitespace(cond, e);
    if (note < in.line_end)
      in.child(cond, SYMBOL_NOTE, note, in.line_end);

    in.parse_xact_body(cond);

    xact->set_end_pos(cond->end_pos());
    item->set_end_pos(cond->end_pos());
    return item;
  }
}

node_t * instance_t::period_xact_directive()
{
  return conditional_xact(*this, SYMBOL_PERIODIC_XACT, SYMBOL_INTERVAL);
}

node_t * instance_t::automated_xact_directive()
{
  return conditional_xact(*this, SYMBOL_AUTOMATED_XACT, SYMBOL_QUERY);
}

void instance_t::parse_xact_body(node_t * xact)
{
  while (peek_whitespace_line()) {
    read_line();
    check_for_signal();

    std::size_t p = skip_ws(line_beg);
    if (text[p] == ';')
      xact->add_child(make(SYMBOL_NOTE, p, line_end));
    else
      xact->add_child(parse_post(p));

    xact->set_end_pos(line_end);
  }
}

node_t * instance_t::parse_post(std::size_t beg)
{
  node_t * post = make(SYMBOL_POSTING, beg, line_end);

  std::size_t p = beg;
  if (at(p) == '*' || at(p) == '!') {
    child(post, SYMBOL_STATUS, p, p + 1);
    p = whitespace(post, p + 1);
  }

  // The account name ends at a tab, two spaces, or the end of the line
  std::size_t e = p;
  while (e < line_end && text[e] != '\t' &&
         ! (text[e] == ' ' && at(e + 1) == ' '))
    e++;
  if (e == p || text[p] == ';')
    return error(beg, line_end, "Posting has no account");

  child(post, SYMBOL_ACCOUNT, p, e);
  p = whitespace(post, e);

  DEBUG("textual.parse", "line " << (line_row + 1) << ": "
        << "posting account '" << string(text, beg, e - beg) << "'");

  if (p < line_end && text[p] != ';' && text[p] != '=' && text[p] != '@') {
    node_t * amount = parse_amount(p);
    if (! amount)
      return error(beg, line_end, "Could not parse posting amount");
    post->add_child(amount);
    p = whitespace(post, p);
  }

  if (at(p) == '@') {
    node_t * price = make(SYMBOL_PRICE, p, line_end);
    e = at(p + 1) == '@' ? p + 2 : p + 1;
    token(price, p, e);
    e = whitespace(price, e);

    node_t * amount = parse_amount(e);
    if (! amount)
      return error(beg, line_end, "Could not parse posting cost");
    price->add_child(amount);
    price->set_end_pos(e);
    post->add_child(price);
    p = whitespace(post, e);
  }

  if (at(p) == '=') {
    node_t * assertion = make(SYMBOL_BALANCE_ASSERTION, p, line_end);
    token(assertion, p, p + 1);
    e = whitespace(assertion, p + 1);

    node_t * amount = parse_amount(e);
    if (! amount)
      return error(beg, line_end, "Could not parse balance assertion");
    assertion->add_child(amount);
    assertion->set_end_pos(e);
    post->add_child(assertion);
    p = whitespace(post, e);
  }

  if (at(p) == ';') {
    child(post, SYMBOL_NOTE, p, line_end);
    p = line_end;
  }

  if (p < line_end)
    return error(beg, line_end, "Unexpected text at end of posting");

  return post;
}

node_t * instance_t::parse_amount(std::size_t& offset)
{
  node_t * amount = make(SYMBOL_AMOUNT, offset, offset);

  std::size_t p = offset;
  std::size_t e;

  if (at(p) == '-' && (e = parse_quantity(p + 1)) > p + 1) {
    child(amount, SYMBOL_NEGATIVE_QUANTITY, p, e);
    p = e;
  }
  else if ((e = parse_quantity(p)) > p) {
    child(amount, SYMBOL_QUANTITY, p, e);
    p = e;
  }
  else {
    // The commodity comes first, possibly behind a detached sign
    bool negative = false;
    if (at(p) == '-') {
      token(amount, p, p + 1);
      negative = true;
      p++;
    }
    e = parse_commodity(p);
    if (e == p)
      return NULL;
    child(amount, SYMBOL_COMMODITY, p, e);

    p = whitespace(amount, e);
    if (! negative && at(p) == '-' && (e = parse_quantity(p + 1)) > p + 1)
      child(amount, SYMBOL_NEGATIVE_QUANTITY, p, e);
    else if ((e = parse_quantity(p)) > p)
      child(amount, SYMBOL_QUANTITY, p, e);
    else
      return NULL;

    offset = e;
    amount->set_end_pos(e);
    return amount;
  }

  std::size_t c  = skip_ws(p);
  std::size_t ce = parse_commodity(c);
  if (ce > c) {
    whitespace(amount, p);
    child(amount, SYMBOL_COMMODITY, c, ce);
    p = ce;
  }

  offset = p;
  amount->set_end_pos(p);
  return amount;
}

std::size_t instance_t::parse_quantity(std::size_t offset) const
{
  std::size_t e      = offset;
  bool        digits = false;
  while (e < line_end) {
    char c = text[e];
    if (std::isdigit(static_cast<unsigned char>(c)))
      digits = true;
    else if (c != '.' && c != ',')
      break;
    e++;
  }
  return digits ? e : offset;
}

std::size_t instance_t::parse_commodity(std::size_t offset) const
{
  if (at(offset) == '"') {
    string::size_type close = text.find('"', offset + 1);
    if (close == string::npos || close >= line_end)
      return offset;
    return close + 1;
  }

  std::size_t e = offset;
  while (e < line_end && is_commodity_char(text[e]))
    e++;
  return e;
}

} // namespace beautifier
