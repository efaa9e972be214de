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
 * @file   annotate.h
 * @author John Wiegley
 *
 * @ingroup math
 *
 * @brief Lot cost annotations on postings.
 *
 * A cost specification records what a lot was acquired for: a per-unit
 * or a total cost number, its currency, the acquisition date and a
 * free-form label.  Every part is optional, because the ledger model
 * fills in whatever the user left out.
 */
#ifndef _ANNOTATE_H
#define _ANNOTATE_H

#include "amount.h"
#include "times.h"

namespace beanprint {

struct cost_spec_t
{
  optional<decimal_t> number_per;
  optional<decimal_t> number_total;
  optional<string>    currency;
  optional<date_t>    date;
  optional<string>    label;

  cost_spec_t() {}

  /**
   * A total cost is written with doubled braces, {{...}}.
   */
  bool is_total() const {
    return static_cast<bool>(number_total);
  }

  /**
   * The number that gets displayed: the total if one was given,
   * otherwise the per-unit cost.
   */
  const optional<decimal_t>& display_number() const {
    return number_total ? number_total : number_per;
  }

  bool empty() const {
    return ! number_per && ! number_total && ! currency && ! date && ! label;
  }

  bool operator==(const cost_spec_t& other) const {
    return (number_per   == other.number_per   &&
            number_total == other.number_total &&
            currency     == other.currency     &&
            date         == other.date         &&
            label        == other.label);
  }
  bool operator!=(const cost_spec_t& other) const {
    return ! (*this == other);
  }
};

} // namespace beanprint

#endif // _ANNOTATE_H
