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

namespace beautifier {

namespace detail {
  void format_directive(layout_t& layout, const node_t& node)
  {
    const node_t& directive(first_child(node));

    switch (directive.kind()) {
    case SYMBOL_OPTION:
      layout.println(directive.text());
      break;
    case SYMBOL_ACCOUNT_DIRECTIVE:
      format_account_directive(layout, directive);
      break;
    case SYMBOL_COMMODITY_DIRECTIVE:
      format_commodity_directive(layout, directive);
      break;
    case SYMBOL_TAG_DIRECTIVE:
      format_tag_directive(layout, directive);
      break;
    case SYMBOL_PAYEE_DIRECTIVE:
      format_payee_directive(layout, directive);
      break;
    case SYMBOL_WORD_DIRECTIVE:
    case SYMBOL_CHAR_DIRECTIVE:
      format_token_directive(layout, directive);
      break;
    default:
      break;
    }
  }

  void format_account_directive(layout_t& layout, const node_t& node)
  {
    layout.print("account ");
    layout.println(expect(node, SYMBOL_ACCOUNT).text());

    indented_t nested(layout);

    for (const node_t * child : node.named_children()) {
      if (child->kind() != SYMBOL_ACCOUNT_SUBDIRECTIVE)
        continue;

      const node_t& sub(first_child(*child));
      switch (sub.kind()) {
      case SYMBOL_ALIAS_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, sub, "alias");
        break;
      case SYMBOL_NOTE_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, sub, "note");
        break;
      case SYMBOL_ASSERT_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, sub, "assert");
        break;
      case SYMBOL_CHECK_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, sub, "check");
        break;
      case SYMBOL_PAYEE_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, sub, "payee");
        break;
      case SYMBOL_DEFAULT_SUBDIRECTIVE:
        layout.indent();
        layout.println("default");
        break;
      default:
        DEBUG("beautify.document", "skipping " << sub.type());
        break;
      }
    }
  }

  void format_commodity_directive(layout_t& layout, const node_t& node)
  {
    layout.print("commodity ");
    layout.println(expect(node, SYMBOL_COMMODITY).text());

    indented_t nested(layout);

    for (const node_t * child : node.named_children()) {
      if (child->kind() != SYMBOL_COMMODITY_SUBDIRECTIVE)
        continue;

      const node_t& sub(first_child(*child));
      switch (sub.kind()) {
      case SYMBOL_ALIAS_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, sub, "alias");
        break;
      case SYMBOL_NOTE_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, sub, "note");
        break;
      case SYMBOL_FORMAT_SUBDIRECTIVE:
        layout.indent();
        format_format_subdirective(layout, sub);
        break;
      case SYMBOL_DEFAULT_SUBDIRECTIVE:
        layout.indent();
        layout.println("default");
        break;
      case SYMBOL_NOMARKET_SUBDIRECTIVE:
        layout.indent();
        layout.println("nomarket");
        break;
      default:
        DEBUG("beautify.document", "skipping " << sub.type());
        break;
      }
    }
  }

  void format_tag_directive(layout_t& layout, const node_t& node)
  {
    layout.print("tag ");
    layout.println(trimmed(expect(node, SYMBOL_TAG)));

    indented_t nested(layout);

    for (const node_t * child : node.named_children()) {
      switch (child->kind()) {
      case SYMBOL_ASSERT_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, *child, "assert");
        break;
      case SYMBOL_CHECK_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, *child, "check");
        break;
      default:
        break;
      }
    }
  }

  void format_payee_directive(layout_t& layout, const node_t& node)
  {
    layout.print("payee ");
    layout.println(trimmed(expect(node, SYMBOL_PAYEE)));

    indented_t nested(layout);

    for (const node_t * child : node.named_children()) {
      switch (child->kind()) {
      case SYMBOL_ALIAS_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, *child, "alias");
        break;
      case SYMBOL_UUID_SUBDIRECTIVE:
        layout.indent();
        format_argument_subdirective(layout, *child, "uuid");
        break;
      default:
        break;
      }
    }
  }

  void format_token_directive(layout_t& layout, const node_t& node)
  {
    bool first = true;
    for (const node_t * child : node.children()) {
      if (child->kind() == SYMBOL_WHITESPACE)
        continue;

      string value = trimmed(*child);
      if (value.empty())
        continue;

      if (! first)
        layout.print(" ");
      layout.print(value);
      first = false;
    }
    layout.println();
  }

  void format_argument_subdirective(layout_t& layout, const node_t& node,
                                    const char * keyword)
  {
    layout.print(keyword);
    layout.print(" ");
    layout.println(expect(node, SYMBOL_VALUE).text());
  }

  void format_format_subdirective(layout_t& layout, const node_t& node)
  {
    layout.print("format ");
    format_amount(layout, expect(node, SYMBOL_AMOUNT));
    layout.println();
  }
}

} // namespace beautifier
