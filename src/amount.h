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
 * @addtogroup math
 */

/**
 * @file   amount.h
 * @author John Wiegley
 *
 * @ingroup math
 *
 * @brief Commoditized decimal amounts.
 *
 * An amount_t is a number paired with the currency it is denominated in.
 * Both halves are always known.  A posting's units may leave either half
 * for the ledger model to infer, which is what incomplete_amount_t is for.
 */
#ifndef _AMOUNT_H
#define _AMOUNT_H

#include "decimal.h"

namespace beanprint {

DECLARE_EXCEPTION(amount_error, std::runtime_error);

class amount_t
{
public:
  decimal_t number;
  string    currency;

  amount_t() {}
  amount_t(const decimal_t& _number, const string& _currency)
    : number(_number), currency(_currency) {}

  /**
   * Reads "<number> <currency>", e.g. "100.00 USD".
   */
  static amount_t parse(const string& str);

  bool operator==(const amount_t& other) const {
    return number == other.number && currency == other.currency;
  }
  bool operator!=(const amount_t& other) const {
    return ! (*this == other);
  }

  bool valid() const;
};

class incomplete_amount_t
{
public:
  optional<decimal_t> number;
  optional<string>    currency;

  incomplete_amount_t() {}
  incomplete_amount_t(const optional<decimal_t>& _number,
                      const optional<string>&    _currency)
    : number(_number), currency(_currency) {}
  incomplete_amount_t(const amount_t& amt)
    : number(amt.number), currency(amt.currency) {}

  bool is_complete() const {
    return number && currency;
  }
  bool empty() const {
    return ! number && ! currency;
  }

  optional<amount_t> to_amount() const {
    if (is_complete())
      return amount_t(*number, *currency);
    return none;
  }

  bool operator==(const incomplete_amount_t& other) const {
    return number == other.number && currency == other.currency;
  }
  bool operator!=(const incomplete_amount_t& other) const {
    return ! (*this == other);
  }
};

} // namespace beanprint

#endif // _AMOUNT_H
