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

#include "decimal.h"

namespace beanprint {

const decimal_t::precision_t decimal_t::max_precision;

void decimal_t::parse(const string& str)
{
  string::size_type i = 0;
  bool negative = false;

  if (i < str.length() && (str[i] == '-' || str[i] == '+')) {
    negative = str[i] == '-';
    i++;
  }

  string      digits;
  bool        seen_point = false;
  precision_t places     = 0;

  for (; i < str.length(); i++) {
    const char c = str[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits += c;
      if (seen_point && ++places > max_precision)
        throw_(decimal_error,
               _f("Number has more than %1% decimal places") % max_precision);
    }
    else if (c == '.' && ! seen_point) {
      seen_point = true;
    }
    else if (c == ',' && ! seen_point && ! digits.empty()) {
      // digit group separator
    }
    else {
      throw_(decimal_error, _f("Invalid number: %1%") % str);
    }
  }

  if (digits.empty())
    throw_(decimal_error, _f("Invalid number: %1%") % str);

  if (mpz_set_str(quantity, digits.c_str(), 10) != 0)
    throw_(decimal_error, _f("Invalid number: %1%") % str);
  if (negative)
    mpz_neg(quantity, quantity);
  prec = places;

  DEBUG("decimal.parse",
        "Parsed '" << str << "' with precision " << prec);
}

int decimal_t::compare(const decimal_t& other) const
{
  if (prec == other.prec)
    return mpz_cmp(quantity, other.quantity);

  mpz_t scaled;
  mpz_init(scaled);

  int result;
  if (prec < other.prec) {
    mpz_ui_pow_ui(scaled, 10, other.prec - prec);
    mpz_mul(scaled, scaled, quantity);
    result = mpz_cmp(scaled, other.quantity);
  } else {
    mpz_ui_pow_ui(scaled, 10, prec - other.prec);
    mpz_mul(scaled, scaled, other.quantity);
    result = mpz_cmp(quantity, scaled);
  }

  mpz_clear(scaled);
  return result;
}

string decimal_t::to_string() const
{
  std::vector<char> buf(mpz_sizeinbase(quantity, 10) + 2);
  mpz_get_str(&buf[0], 10, quantity);

  string digits(&buf[0]);
  bool   negative = false;
  if (! digits.empty() && digits[0] == '-') {
    negative = true;
    digits.erase(0, 1);
  }

  if (prec > 0) {
    if (digits.length() <= prec)
      digits.insert(0, prec - digits.length() + 1, '0');
    digits.insert(digits.length() - prec, 1, '.');
  }

  return negative ? "-" + digits : digits;
}

bool decimal_t::valid() const
{
  if (prec > max_precision) {
    DEBUG("beanprint.validate", "decimal_t: prec > max_precision");
    return false;
  }
  return true;
}

} // namespace beanprint
