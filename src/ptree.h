/*
 * Copyright (c) 2003-2018, John Wiegley.  All rights reserved.
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
 * @file   ptree.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Building a ledger from a structured (JSON) description.
 *
 * The document holds a "directives" array; each element names its kind
 * in a "type" field and carries that kind's fields by name:
 *
 * @code
 * { "directives": [
 *     { "type": "open", "date": "2023-01-01",
 *       "account": "Assets:Bank:Checking",
 *       "currencies": ["USD"], "booking": "strict" } ] }
 * @endcode
 *
 * An element whose type is not known becomes an unsupported_t.
 */
#ifndef _PTREE_H
#define _PTREE_H

#include "journal.h"

namespace beanprint {

DECLARE_EXCEPTION(parse_error, std::runtime_error);

directive_t get_directive(const property_tree::ptree& pt);

journal_file_t read_journal(std::istream& in);
journal_file_t read_journal(const path& pathname);

} // namespace beanprint

#endif // _PTREE_H
