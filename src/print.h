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
 * @addtogroup report
 */

/**
 * @file   print.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Writing a ledger back out in its textual form.
 *
 * renderer_t has one render() overload per kind of node.  Each writes the
 * node's text to the given stream and either returns normally or throws a
 * render_error; whatever was written before the error stays written.
 */
#ifndef _PRINT_H
#define _PRINT_H

#include "journal.h"

namespace beanprint {

DECLARE_EXCEPTION(render_error, std::runtime_error);

/**
 * The output stream failed while a ledger was being written to it.
 */
DECLARE_EXCEPTION(io_error, render_error);

/**
 * The ledger holds a directive that has no textual form.
 */
DECLARE_EXCEPTION(unsupported_error, render_error);

class renderer_t
{
public:
  renderer_t() {}

  /**
   * Every directive in order, each followed by a blank line.
   */
  void render(const journal_t& journal, std::ostream& out) const;
  void render(const journal_file_t& file, std::ostream& out) const;

  void render(const directive_t& directive, std::ostream& out) const;

  void render(const open_t& open, std::ostream& out) const;
  void render(const close_t& close, std::ostream& out) const;
  void render(const balance_t& balance, std::ostream& out) const;
  void render(const option_t& option, std::ostream& out) const;
  void render(const commodity_t& commodity, std::ostream& out) const;
  void render(const custom_t& custom, std::ostream& out) const;
  void render(const document_t& document, std::ostream& out) const;
  void render(const event_t& event, std::ostream& out) const;
  void render(const include_t& include, std::ostream& out) const;
  void render(const note_t& note, std::ostream& out) const;
  void render(const pad_t& pad, std::ostream& out) const;
  void render(const plugin_t& plugin, std::ostream& out) const;
  void render(const price_t& price, std::ostream& out) const;
  void render(const query_t& query, std::ostream& out) const;
  void render(const xact_t& xact, std::ostream& out) const;
  void render(const post_t& post, std::ostream& out) const;

  /**
   * The pieces a directive is built from.  These write no newline, and
   * like every overload here they throw io_error once out has failed.
   */
  void render(const account_t& account, std::ostream& out) const;
  void render(const amount_t& amount, std::ostream& out) const;
  void render(const incomplete_amount_t& amount, std::ostream& out) const;
  void render(const cost_spec_t& cost, std::ostream& out) const;
  void render(const flag_t& flag, std::ostream& out) const;

  /**
   * One "\t<key>: <value>" line per entry.  Nothing is escaped.
   */
  void render(const metadata_t& metadata, std::ostream& out) const;

private:
  void render_directives(const directives_list& directives,
                         std::ostream&          out) const;
};

string render_ledger(const journal_t& journal);
string render_document(const journal_file_t& file);

} // namespace beanprint

#endif // _PRINT_H
