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

#include <system.hh>

#include "directives.h"

namespace beanprint {

namespace {
  struct keyword_visitor : public boost::static_visitor<string>
  {
    string operator()(const open_t&) const      { return "open"; }
    string operator()(const close_t&) const     { return "close"; }
    string operator()(const balance_t&) const   { return "balance"; }
    string operator()(const option_t&) const    { return "option"; }
    string operator()(const commodity_t&) const { return "commodity"; }
    string operator()(const custom_t&) const    { return "custom"; }
    string operator()(const document_t&) const  { return "document"; }
    string operator()(const event_t&) const     { return "event"; }
    string operator()(const include_t&) const   { return "include"; }
    string operator()(const note_t&) const      { return "note"; }
    string operator()(const pad_t&) const       { return "pad"; }
    string operator()(const plugin_t&) const    { return "plugin"; }
    string operator()(const price_t&) const     { return "price"; }
    string operator()(const query_t&) const     { return "query"; }
    string operator()(const xact_t&) const      { return "transaction"; }

    string operator()(const unsupported_t& unsupported) const {
      return unsupported.keyword;
    }
  };

  struct date_visitor : public boost::static_visitor<optional<date_t> >
  {
    template <typename T>
    optional<date_t> operator()(const T& directive) const {
      return directive.date;
    }

    optional<date_t> operator()(const option_t&) const {
      return none;
    }
    optional<date_t> operator()(const include_t&) const {
      return none;
    }
    optional<date_t> operator()(const plugin_t&) const {
      return none;
    }
    optional<date_t> operator()(const unsupported_t&) const {
      return none;
    }
  };
}

string directive_keyword(const directive_t& directive)
{
  return boost::apply_visitor(keyword_visitor(), directive);
}

optional<date_t> directive_date(const directive_t& directive)
{
  return boost::apply_visitor(date_visitor(), directive);
}

} // namespace beanprint
