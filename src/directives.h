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
 * @file   directives.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief The top-level statements a ledger is made of.
 *
 * Every directive except a transaction is a small record of scalar
 * fields.  directive_t is the closed union over all of them; code that
 * visits it with a boost::static_visitor must handle every kind.
 */
#ifndef _DIRECTIVES_H
#define _DIRECTIVES_H

#include "xact.h"

namespace beanprint {

class open_t : public item_t
{
public:
  enum booking_t {
    BOOKING_NONE = 0,
    BOOKING_STRICT,
    BOOKING_AVERAGE,
    BOOKING_FIFO,
    BOOKING_LIFO
  };

  date_t              date;
  account_t           account;
  std::vector<string> currencies;
  booking_t           booking;

  open_t() : booking(BOOKING_NONE) {}
  open_t(const date_t& _date, const account_t& _account,
         const std::vector<string>& _currencies = std::vector<string>(),
         booking_t _booking = BOOKING_NONE)
    : item_t(), date(_date), account(_account), currencies(_currencies),
      booking(_booking) {}
};

class close_t : public item_t
{
public:
  date_t    date;
  account_t account;

  close_t() {}
  close_t(const date_t& _date, const account_t& _account)
    : item_t(), date(_date), account(_account) {}
};

/**
 * A balance assertion.  The optional tolerance widens the check to
 * amount +/- tolerance.
 */
class balance_t : public item_t
{
public:
  date_t              date;
  account_t           account;
  amount_t            amount;
  optional<decimal_t> tolerance;

  balance_t() {}
  balance_t(const date_t& _date, const account_t& _account,
            const amount_t& _amount)
    : item_t(), date(_date), account(_account), amount(_amount) {}
};

class option_t
{
public:
  string name;
  string value;

  option_t() {}
  option_t(const string& _name, const string& _value)
    : name(_name), value(_value) {}
};

class commodity_t : public item_t
{
public:
  date_t date;
  string name;

  commodity_t() {}
  commodity_t(const date_t& _date, const string& _name)
    : item_t(), date(_date), name(_name) {}
};

class custom_t : public item_t
{
public:
  date_t              date;
  string              name;
  std::vector<string> args;     // already in their written form

  custom_t() {}
  custom_t(const date_t& _date, const string& _name,
           const std::vector<string>& _args = std::vector<string>())
    : item_t(), date(_date), name(_name), args(_args) {}
};

class document_t : public item_t
{
public:
  date_t     date;
  account_t  account;
  string     filename;
  tags_list  tags;
  links_list links;

  document_t() {}
  document_t(const date_t& _date, const account_t& _account,
             const string& _filename)
    : item_t(), date(_date), account(_account), filename(_filename) {}

  void add_tag(const string& tag) {
    add_marked_name(tags, tag, '#');
  }
  void add_link(const string& link) {
    add_marked_name(links, link, '^');
  }
};

class event_t : public item_t
{
public:
  date_t date;
  string name;
  string description;

  event_t() {}
  event_t(const date_t& _date, const string& _name,
          const string& _description)
    : item_t(), date(_date), name(_name), description(_description) {}
};

class include_t
{
public:
  string filename;

  include_t() {}
  explicit include_t(const string& _filename) : filename(_filename) {}
};

class note_t : public item_t
{
public:
  date_t    date;
  account_t account;
  string    comment;

  note_t() {}
  note_t(const date_t& _date, const account_t& _account,
         const string& _comment)
    : item_t(), date(_date), account(_account), comment(_comment) {}
};

class pad_t : public item_t
{
public:
  date_t    date;
  account_t pad_to;
  account_t pad_from;

  pad_t() {}
  pad_t(const date_t& _date, const account_t& _pad_to,
        const account_t& _pad_from)
    : item_t(), date(_date), pad_to(_pad_to), pad_from(_pad_from) {}
};

class plugin_t
{
public:
  string           module;
  optional<string> config;

  plugin_t() {}
  plugin_t(const string& _module, const optional<string>& _config = none)
    : module(_module), config(_config) {}
};

class price_t : public item_t
{
public:
  date_t   date;
  string   currency;
  amount_t amount;

  price_t() {}
  price_t(const date_t& _date, const string& _currency,
          const amount_t& _amount)
    : item_t(), date(_date), currency(_currency), amount(_amount) {}
};

class query_t : public item_t
{
public:
  date_t date;
  string name;
  string query_string;

  query_t() {}
  query_t(const date_t& _date, const string& _name,
          const string& _query_string)
    : item_t(), date(_date), name(_name), query_string(_query_string) {}
};

/**
 * Stands in for a statement the ledger model could not classify.  It
 * cannot be written back out; rendering one is an error.
 */
class unsupported_t
{
public:
  string keyword;

  unsupported_t() {}
  explicit unsupported_t(const string& _keyword) : keyword(_keyword) {}
};

typedef boost::variant<open_t,
                       close_t,
                       balance_t,
                       option_t,
                       commodity_t,
                       custom_t,
                       document_t,
                       event_t,
                       include_t,
                       note_t,
                       pad_t,
                       plugin_t,
                       price_t,
                       query_t,
                       xact_t,
                       unsupported_t> directive_t;

typedef std::vector<directive_t> directives_list;

/**
 * The keyword that introduces a directive in the ledger grammar, e.g.
 * "open" or "transaction".  For an unsupported directive this is the
 * keyword the model saw.
 */
string directive_keyword(const directive_t& directive);

/**
 * The directive's date, if its kind has one (option, include and plugin
 * do not).
 */
optional<date_t> directive_date(const directive_t& directive);

inline bool is_unsupported(const directive_t& directive) {
  return boost::get<unsupported_t>(&directive) != NULL;
}

} // namespace beanprint

#endif // _DIRECTIVES_H
