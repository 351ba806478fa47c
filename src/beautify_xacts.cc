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

#include "beautify_internal.h"
#include "unistring.h"

namespace beautifier {

namespace detail {
  void format_xact(layout_t& layout, const node_t& node)
  {
    const node_t& xact(first_child(node));

    switch (xact.kind()) {
    case SYMBOL_PLAIN_XACT:
      format_plain_xact(layout, xact);
      break;
    case SYMBOL_PERIODIC_XACT:
      format_periodic_xact(layout, xact);
      break;
    case SYMBOL_AUTOMATED_XACT:
      format_automated_xact(layout, xact);
      break;
    default:
      break;
    }
  }

  void format_plain_xact(layout_t& layout, const node_t& node)
  {
    node_t::children_list header;

    for (const node_t * child : node.named_children()) {
      switch (child->kind()) {
      case SYMBOL_DATE:
        layout.print(child->text());
        break;
      case SYMBOL_EFFECTIVE_DATE:
        layout.print("=");
        layout.print(child->text());
        break;
      case SYMBOL_STATUS:
      case SYMBOL_CODE:
      case SYMBOL_PAYEE:
        layout.print(" ");
        layout.print(child->text());
        break;
      default:
        continue;
      }
      header.push_back(child);
    }
    layout.println();

    // A note on the header line moves to the first line of the body
    format_xact_body(layout, node, header);
  }

  namespace {
    void format_conditional_xact(layout_t& layout, const node_t& node,
                                 const char * marker, symbol_t expr_kind)
    {
      node_t::children_list header;

      const node_t& expr(expect(node, expr_kind));
      layout.print(marker);
      layout.print(trimmed(expr));
      header.push_back(&expr);

      // Only a note on the same line as the expression belongs to the
      // header; later notes are part of the body.
      const node_t * note = node.find(SYMBOL_NOTE);
      if (note && note->start_point().row == expr.start_point().row) {
        layout.print(" ");
        layout.print(note->text());
        header.push_back(note);
      }
      layout.println();

      format_xact_body(layout, node, header);
    }
  }

  void format_periodic_xact(layout_t& layout, const node_t& node)
  {
    format_conditional_xact(layout, node, "~ ", SYMBOL_INTERVAL);
  }

  void format_automated_xact(layout_t& layout, const node_t& node)
  {
    format_conditional_xact(layout, node, "= ", SYMBOL_QUERY);
  }

  void format_xact_body(layout_t& layout, const node_t& node,
                        const node_t::children_list& header)
  {
    indented_t nested(layout);

    for (const node_t * child : node.named_children()) {
      if (std::find(header.begin(), header.end(), child) != header.end())
        continue;

      switch (child->kind()) {
      case SYMBOL_NOTE:
        layout.indent();
        layout.println(child->text());
        break;
      case SYMBOL_POSTING:
        layout.indent();
        format_posting(layout, *child);
        break;
      default:
        break;
      }
    }
  }

  void format_posting(layout_t& layout, const node_t& node)
  {
    if (const node_t * status = node.find(SYMBOL_STATUS))
      layout.print(status->text());
    if (const node_t * account = node.find(SYMBOL_ACCOUNT))
      layout.print(account->text());

    // Whatever follows the account needs at least two spaces, or it
    // would be read back as part of the account name.
    bool padded = false;

    if (const node_t * amount = node.find(SYMBOL_AMOUNT)) {
      const node_t * quantity = amount->find(SYMBOL_QUANTITY);
      if (! quantity)
        quantity = amount->find(SYMBOL_NEGATIVE_QUANTITY);
      if (! quantity) {
        const point_t& start(amount->start_point());
        throw_(structure_error,
               _f("Expected quantity or negative_quantity in amount "
                  "(at line %1%, column %2%)")
               % (start.row + 1) % (start.column + 1));
      }

      std::size_t width = unicode_length(trimmed(*quantity));
      if (amount->find(SYMBOL_COMMODITY) && first_child(*amount).type() == "-")
        width++;

      std::size_t column = width + 1 < AMOUNT_COLUMN ?
        AMOUNT_COLUMN - width - 1 : 0;

      DEBUG("beautify.posting", "line " << (node.start_point().row + 1)
            << ": quantity width " << width << ", amount at column "
            << std::max(column, layout.col + 2));

      layout.pad_to(column, 2);
      format_amount(layout, *amount);
      padded = true;
    }

    if (const node_t * price = node.find(SYMBOL_PRICE)) {
      if (padded)
        layout.print(" ");
      else
        layout.pad_to(AMOUNT_COLUMN, 2);
      format_price(layout, *price);
      padded = true;
    }

    if (const node_t * assertion = node.find(SYMBOL_BALANCE_ASSERTION)) {
      if (padded)
        layout.print(" ");
      else
        layout.pad_to(AMOUNT_COLUMN, 2);
      format_balance_assertion(layout, *assertion);
      padded = true;
    }

    if (const node_t * note = node.find(SYMBOL_NOTE)) {
      if (padded)
        layout.print(" ");
      else
        layout.pad_to(AMOUNT_COLUMN, 2);
      layout.print(trimmed(*note));
    }

    layout.println();
  }

  void format_amount(layout_t& layout, const node_t& node)
  {
    // A sign written ahead of the commodity, as in "-$10"
    if (const node_t * sign = node.child(0))
      if (! sign->is_named() && sign->type() == "-")
        layout.print("-");

    if (const node_t * quantity = node.find(SYMBOL_NEGATIVE_QUANTITY))
      layout.print(trimmed(*quantity));
    else if (const node_t * quantity = node.find(SYMBOL_QUANTITY))
      layout.print(trimmed(*quantity));

    if (const node_t * commodity = node.find(SYMBOL_COMMODITY)) {
      layout.print(" ");
      layout.print(trimmed(*commodity));
    }
  }

  void format_price(layout_t& layout, const node_t& node)
  {
    layout.print(first_child(node).text());
    layout.print(" ");
    format_amount(layout, expect(node, SYMBOL_AMOUNT));
  }

  void format_balance_assertion(layout_t& layout, const node_t& node)
  {
    layout.print("= ");
    format_amount(layout, expect(node, SYMBOL_AMOUNT));
  }
}

} // namespace beautifier
