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
 * @file   beautify.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Re-emits a journal in canonical layout.
 *
 * The beautifier walks the syntax tree of a journal and writes it back
 * out with normalized indentation and spacing: subdirectives and
 * postings are indented by one level, runs of blank lines collapse to
 * one, and posting amounts line up against AMOUNT_COLUMN.  A tree that
 * contains any ERROR node is never formatted.
 */
#ifndef _BEAUTIFY_H
#define _BEAUTIFY_H

#include "layout.h"
#include "textual.h"

namespace beautifier {

DECLARE_EXCEPTION(syntax_error, std::runtime_error);
DECLARE_EXCEPTION(inconsistent_tree_error, std::logic_error);
DECLARE_EXCEPTION(structure_error, std::runtime_error);

struct config_t
{
  bool inplace;                 // collect output instead of streaming it

  config_t() : inplace(false) {}
};

/**
 * Depth-first, in source order, search for the first ERROR node at or
 * below \p node.  Returns NULL if there is none.
 */
const node_t * find_first_error(const node_t& node);

void beautify(const syntax_tree_t& tree, output_sink_t& sink);

/**
 * Parse and format \p text.  In in-place mode the formatted journal is
 * returned; otherwise it is written to \p out as it is produced and an
 * empty string is returned.
 */
string beautify(const string& text, const config_t& config,
                std::ostream& out = std::cout);

} // namespace beautifier

#endif // _BEAUTIFY_H
