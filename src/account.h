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
 * @file   account.h
 * @author John Wiegley
 *
 * @ingroup data
 */
#ifndef _ACCOUNT_H
#define _ACCOUNT_H

#include "utils.h"

namespace beanprint {

DECLARE_EXCEPTION(account_error, std::runtime_error);

class account_t
{
public:
  enum type_t {
    ASSETS = 0,
    LIABILITIES,
    EQUITY,
    INCOME,
    EXPENSES
  };

  typedef std::vector<string> parts_t;

  type_t  type;
  parts_t parts;

  account_t(type_t _type = ASSETS, const parts_t& _parts = parts_t())
    : type(_type), parts(_parts) {}

  /**
   * Builds an account from its written form, e.g. "Assets:Bank:Checking".
   * The first component must name one of the five account types.
   */
  static account_t parse(const string& name);

  static const char * type_name(const type_t type);

  /**
   * The written form: the type name, then each part, joined with ':'.
   */
  string fullname() const;

  bool operator==(const account_t& other) const {
    return type == other.type && parts == other.parts;
  }
  bool operator!=(const account_t& other) const {
    return ! (*this == other);
  }

  bool valid() const;
};

std::ostream& operator<<(std::ostream& out, const account_t& account);

} // namespace beanprint

#endif // _ACCOUNT_H
