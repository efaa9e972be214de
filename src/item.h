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
 * @defgroup data Data representation
 */

/**
 * @file   item.h
 * @author John Wiegley
 *
 * @ingroup data
 */
#ifndef _ITEM_H
#define _ITEM_H

#include "utils.h"

namespace beanprint {

/**
 * @brief Key/value annotations attached to directives and postings.
 *
 * Keys are unique.  Entries are kept in the order they were first set,
 * so a ledger always renders its metadata the same way; setting a key
 * that already exists replaces the value without moving the entry.
 */
class metadata_t
{
public:
  typedef std::pair<string, string> entry_t;

protected:
  typedef multi_index_container<
    entry_t,
    multi_index::indexed_by<
      multi_index::sequenced<>,
      multi_index::hashed_unique<
        multi_index::member<entry_t, string, &entry_t::first> >
    >
  > entries_t;

  typedef entries_t::nth_index<1>::type entries_by_key;

  entries_t entries;

public:
  typedef entries_t::const_iterator const_iterator;

  metadata_t() {}

  void set(const string& key, const string& value);

  optional<const string&> get(const string& key) const {
    const entries_by_key& key_index = entries.get<1>();
    entries_by_key::const_iterator i = key_index.find(key);
    if (i != key_index.end())
      return (*i).second;
    return none;
  }

  bool has(const string& key) const {
    return entries.get<1>().count(key) > 0;
  }
  bool remove(const string& key) {
    return entries.get<1>().erase(key) > 0;
  }

  std::size_t size() const {
    return entries.size();
  }
  bool empty() const {
    return entries.empty();
  }

  const_iterator begin() const {
    return entries.begin();
  }
  const_iterator end() const {
    return entries.end();
  }

  bool operator==(const metadata_t& other) const {
    return (size() == other.size() &&
            std::equal(begin(), end(), other.begin()));
  }
  bool operator!=(const metadata_t& other) const {
    return ! (*this == other);
  }
};

/**
 * @brief The status marker on a transaction or posting.
 *
 * "*" marks a completed transaction and "!" one that needs attention.
 * Any other marker a ledger uses is kept verbatim.
 */
class flag_t
{
public:
  enum kind_t { OKAY = 0, WARNING, OTHER };

  kind_t kind;
  string other;

  flag_t(kind_t _kind = OKAY) : kind(_kind) {}
  explicit flag_t(const string& _other) : kind(OTHER), other(_other) {}

  static flag_t parse(const string& str) {
    if (str == "*")
      return flag_t(OKAY);
    else if (str == "!")
      return flag_t(WARNING);
    else
      return flag_t(str);
  }

  bool operator==(const flag_t& flag) const {
    return kind == flag.kind && (kind != OTHER || other == flag.other);
  }
  bool operator!=(const flag_t& flag) const {
    return ! (*this == flag);
  }
};

typedef std::vector<string> tags_list;
typedef std::vector<string> links_list;

/**
 * Appends a tag or link name unless it is already present.  Names are
 * stored without their leading marker ('#' for tags, '^' for links).
 */
void add_marked_name(std::vector<string>& names, const string& name,
                     const char marker);

/**
 * Base of every node that can carry metadata.
 */
class item_t
{
public:
  metadata_t metadata;

  item_t() {}

  void set_meta(const string& key, const string& value) {
    metadata.set(key, value);
  }
};

} // namespace beanprint

#endif // _ITEM_H
