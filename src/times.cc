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

#include "times.h"

namespace beanprint {

namespace {
  const boost::regex date_mask("(\\d{4})[-/.](\\d{1,2})[-/.](\\d{1,2})");
}

date_t parse_date(const char * str)
{
  boost::cmatch what;
  if (! boost::regex_match(str, what, date_mask))
    throw_(date_error, _f("Invalid date: %1%") % str);

  date_t when;
  try {
    when = date_t(lexical_cast<unsigned short>(what[1].str()),
                  lexical_cast<unsigned short>(what[2].str()),
                  lexical_cast<unsigned short>(what[3].str()));
  }
  catch (const std::out_of_range&) {
    throw_(date_error, _f("Invalid date: %1%") % str);
  }

  DEBUG("times.parse", "Passed date string: " << str);
  DEBUG("times.parse", "Parsed result is:   " << format_date(when));

  return when;
}

std::string format_date(const date_t& when)
{
  assert(is_valid(when));
  return gregorian::to_iso_extended_string(when);
}

} // namespace beanprint
