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
 * @file   decimal.h
 * @author John Wiegley
 *
 * @ingroup math
 *
 * @brief Exact decimal numbers, as written in a ledger.
 *
 * A decimal_t never rounds and never normalizes: "100.00" keeps its two
 * places when written back out.  The value is held as an arbitrary
 * precision integer coefficient together with the number of digits that
 * follow the decimal point.
 */
#ifndef _DECIMAL_H
#define _DECIMAL_H

#include "utils.h"

namespace beanprint {

DECLARE_EXCEPTION(decimal_error, std::runtime_error);

class decimal_t
{
public:
  typedef uint_least16_t precision_t;

  /**
   * The most decimal places a number may carry.
   */
  static const precision_t max_precision = 1024;

protected:
  mpz_t       quantity;
  precision_t prec;

public:
  decimal_t() : prec(0) {
    mpz_init(quantity);
  }
  decimal_t(const decimal_t& other) : prec(other.prec) {
    mpz_init_set(quantity, other.quantity);
  }
  explicit decimal_t(const string& str) : prec(0) {
    mpz_init(quantity);
    try {
      parse(str);
    }
    catch (const decimal_error&) {
      mpz_clear(quantity);
      throw;
    }
  }
  explicit decimal_t(const char * str) : prec(0) {
    mpz_init(quantity);
    try {
      parse(str);
    }
    catch (const decimal_error&) {
      mpz_clear(quantity);
      throw;
    }
  }
  explicit decimal_t(const long val) : prec(0) {
    mpz_init_set_si(quantity, val);
  }
  ~decimal_t() {
    mpz_clear(quantity);
  }

  decimal_t& operator=(const decimal_t& other) {
    if (this != &other) {
      mpz_set(quantity, other.quantity);
      prec = other.prec;
    }
    return *this;
  }

  /**
   * Reads an optionally signed run of digits with at most one decimal
   * point, such as "-12.50".  Digit-group commas are accepted and
   * dropped.  Anything else throws decimal_error and leaves the value
   * unchanged.
   */
  void parse(const string& str);

  precision_t precision() const {
    return prec;
  }
  int sign() const {
    return mpz_sgn(quantity);
  }
  bool is_zero() const {
    return sign() == 0;
  }

  /**
   * Numeric comparison, independent of the written precision: 1.0
   * compares equal to 1.00.
   */
  int compare(const decimal_t& other) const;

  bool operator==(const decimal_t& other) const {
    return compare(other) == 0;
  }
  bool operator!=(const decimal_t& other) const {
    return compare(other) != 0;
  }
  bool operator<(const decimal_t& other) const {
    return compare(other) < 0;
  }

  /**
   * The exact written form, with every stored decimal place.
   */
  string to_string() const;

  void print(std::ostream& out) const {
    out << to_string();
  }

  bool valid() const;
};

inline std::ostream& operator<<(std::ostream& out, const decimal_t& num) {
  num.print(out);
  return out;
}

} // namespace beanprint

#endif // _DECIMAL_H
