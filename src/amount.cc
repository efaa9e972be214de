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

#include "amount.h"

namespace beanprint {

amount_t amount_t::parse(const string& str)
{
  const string text = trim_copy(str);

  string::size_type space = text.find_first_of(" \t");
  if (space == string::npos)
    throw_(amount_error,
           _f("Amount '%1%' must be a number followed by a currency") % str);

  amount_t amt(decimal_t(text.substr(0, space)),
               trim_left_copy(text.substr(space + 1)));

  DEBUG("amount.parse", "Parsed amount: " << amt.number << ' ' << amt.currency);

  if (! amt.valid())
    throw_(amount_error, _f("Invalid amount: %1%") % str);
  return amt;
}

bool amount_t::valid() const
{
  if (currency.empty()) {
    DEBUG("beanprint.validate", "amount_t: currency is empty");
    return false;
  }
  if (currency.find_first_of(" \t\n") != string::npos) {
    DEBUG("beanprint.validate", "amount_t: currency contains whitespace");
    return false;
  }
  return number.valid();
}

} // namespace beanprint
