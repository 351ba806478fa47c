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

#ifndef _BEAUTIFY_INTERNAL_H
#define _BEAUTIFY_INTERNAL_H

#include <system.hh>

#include "beautify.h"

namespace beautifier::detail {

const node_t& expect(const node_t& node, symbol_t kind);
const node_t& first_child(const node_t& node);
string        trimmed(const node_t& node);

void format_document(layout_t& layout, const node_t& node);
void format_journal_item(layout_t& layout, const node_t& node);

void format_directive(layout_t& layout, const node_t& node);
void format_account_directive(layout_t& layout, const node_t& node);
void format_commodity_directive(layout_t& layout, const node_t& node);
void format_tag_directive(layout_t& layout, const node_t& node);
void format_payee_directive(layout_t& layout, const node_t& node);
void format_token_directive(layout_t& layout, const node_t& node);
void format_argument_subdirective(layout_t& layout, const node_t& node,
                                  const char * keyword);
void format_format_subdirective(layout_t& layout, const node_t& node);

void format_xact(layout_t& layout, const node_t& node);
void format_plain_xact(layout_t& layout, const node_t& node);
void format_periodic_xact(layout_t& layout, const node_t& node);
void format_automated_xact(layout_t& layout, const node_t& node);
void format_xact_body(layout_t& layout, const node_t& node,
                      const node_t::children_list& header);

void format_posting(layout_t& layout, const node_t& node);
void format_amount(layout_t& layout, const node_t& node);
void format_price(layout_t& layout, const node_t& node);
void format_balance_assertion(layout_t& layout, const node_t& node);

} // namespace beautifier::detail

#endif // _BEAUTIFY_INTERNAL_H
