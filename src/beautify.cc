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
  const node_t& expect(const node_t& node, symbol_t kind)
  {
    if (const node_t * found = node.find(kind))
      return *found;

    const point_t& start(node.start_point());
    throw_(structure_error,
           _f("Expected %1% in %2% (at line %3%, column %4%)")
           % symbol_name(kind) % node.type() % (start.row + 1)
           % (start.column + 1));
    return node;                // not reached
  }

  const node_t& first_child(const node_t& node)
  {
    if (const node_t * found = node.child(0))
      return *found;

    const point_t& start(node.start_point());
    throw_(structure_error,
           _f("Empty %1% (at line %2%, column %3%)")
           % node.type() % (start.row + 1) % (start.column + 1));
    return node;                // not reached
  }

  string trimmed(const node_t& node)
  {
    return boost::algorithm::trim_copy(node.text());
  }

  void format_document(layout_t& layout, const node_t& node)
  {
    // Starting out as if a blank line had just been written suppresses
    // blank lines at the top of the file.
    bool last_blank = true;

    for (const node_t * child : node.children()) {
      check_for_signal();

      if (child->kind() == SYMBOL_BLANK_LINE) {
        if (! last_blank)
          layout.println();
        last_blank = true;
        continue;
      }

      std::size_t row = layout.row;
      format_journal_item(layout, *child);
      if (layout.row != row)
        last_blank = false;
    }
  }

  void format_journal_item(layout_t& layout, const node_t& node)
  {
    const node_t& item(first_child(node));

    DEBUG("beautify.document", "line " << (item.start_point().row + 1)
          << ": " << item.type());

    switch (item.kind()) {
    case SYMBOL_COMMENT:
    case SYMBOL_BLOCK_COMMENT:
    case SYMBOL_BLOCK_TEST:
      layout.println(item.text());
      break;

    case SYMBOL_DIRECTIVE:
      format_directive(layout, item);
      break;

    case SYMBOL_XACT:
      format_xact(layout, item);
      break;

    default:
      break;
    }
  }
}

const node_t * find_first_error(const node_t& node)
{
  if (node.is_error())
    return &node;

  for (const node_t * child : node.children())
    if (const node_t * error = find_first_error(*child))
      return error;

  return NULL;
}

void beautify(const syntax_tree_t& tree, output_sink_t& sink)
{
  const node_t& root(tree.root());

  if (root.has_error()) {
    const node_t * error = find_first_error(root);
    if (! error)
      throw_(inconsistent_tree_error,
             _("An error occurred, but no ERROR node was found."));

    const point_t& start(error->start_point());
    std::size_t    line = start.row + 1;

    DEBUG("beautify.error", "first ERROR node at line " << line
          << ", column " << start.column);

    string text = source_line(tree.text(), line);
    if (line == 1 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
      text.erase(0, 3);
    std::size_t column = start.column <= text.length() ?
      unicode_length(string(text, 0, start.column)) : 0;

    add_error_context(_f("While parsing line %1%:") % line);
    add_error_context(line_context(text, column));

    throw_(syntax_error,
           _f("Parsed file contains errors (at line %1%).") % line);
  }

  TRACE_START(beautify, 1, "Formatted journal");

  layout_t layout(sink);
  detail::format_document(layout, root);
  layout.flush();

  TRACE_FINISH(beautify, 1);
}

string beautify(const string& text, const config_t& config, std::ostream& out)
{
  unique_ptr<syntax_tree_t> tree(parse_journal(text));

  if (config.inplace) {
    buffer_sink_t sink(text.length() * 2);
    beautify(*tree, sink);
    return sink.str();
  }

  stream_sink_t sink(out);
  beautify(*tree, sink);
  return empty_string;
}

} // namespace beautifier
