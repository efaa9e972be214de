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

#include "account.h"

namespace beanprint {

const char * account_t::type_name(const type_t type)
{
  switch (type) {
  case ASSETS:      return "Assets";
  case LIABILITIES: return "Liabilities";
  case EQUITY:      return "Equity";
  case INCOME:      return "Income";
  case EXPENSES:    return "Expenses";
  }
  assert(false);
  return "";
}

account_t account_t::parse(const string& name)
{
  parts_t parts;
  split(parts, name, is_any_of(":"));

  type_t type;
  if (parts.front() == "Assets")
    type = ASSETS;
  else if (parts.front() == "Liabilities")
    type = LIABILITIES;
  else if (parts.front() == "Equity")
    type = EQUITY;
  else if (parts.front() == "Income")
    type = INCOME;
  else if (parts.front() == "Expenses")
    type = EXPENSES;
  else
    throw_(account_error,
           _f("Account '%1%' does not start with a known account type")
           % name);

  parts.erase(parts.begin());

  foreach (const string& part, parts)
    if (part.empty())
      throw_(account_error, _f("Account '%1%' has an empty component") % name);

  return account_t(type, parts);
}

string account_t::fullname() const
{
  string fullname = type_name(type);
  foreach (const string& part, parts)
    fullname += ":" + part;
  return fullname;
}

bool account_t::valid() const
{
  foreach (const string& part, parts) {
    if (part.empty()) {
      DEBUG("beanprint.validate", "account_t: empty account part");
      return false;
    }
    if (part.find(':') != string::npos) {
      DEBUG("beanprint.validate", "account_t: ':' inside an account part");
      return false;
    }
  }
  return true;
}

std::ostream& operator<<(std::ostream& out, const account_t& account)
{
  out << account.fullname();
  return out;
}

} // namespace beanprint
