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

#include "ptree.h"

namespace beanprint {

using property_tree::ptree;

namespace {
  string get_required(const ptree& pt, const char * key)
  {
    if (optional<string> value = pt.get_optional<string>(key))
      return *value;
    throw_(parse_error, _f("Missing required field '%1%'") % key);
    return empty_string;
  }

  std::vector<string> get_strings(const ptree& pt, const char * key)
  {
    std::vector<string> strings;
    if (optional<const ptree&> list = pt.get_child_optional(key)) {
      foreach (const ptree::value_type& item, *list) {
        if (! item.first.empty() || ! item.second.empty())
          throw_(parse_error, _f("Field '%1%' must be a list of strings") % key);
        strings.push_back(item.second.data());
      }
    }
    return strings;
  }

  optional<decimal_t> get_decimal(const ptree& pt, const char * key)
  {
    if (optional<string> value = pt.get_optional<string>(key))
      return decimal_t(*value);
    return none;
  }

  optional<date_t> get_date(const ptree& pt, const char * key)
  {
    if (optional<string> value = pt.get_optional<string>(key))
      return parse_date(*value);
    return none;
  }

  date_t get_required_date(const ptree& pt)
  {
    return parse_date(get_required(pt, "date"));
  }

  account_t get_account(const ptree& pt, const char * key = "account")
  {
    return account_t::parse(get_required(pt, key));
  }

  // An amount is either "100.00 USD" or {"number": "100.00", "currency":
  // "USD"}.
  amount_t get_amount(const ptree& pt, const char * key)
  {
    optional<const ptree&> node = pt.get_child_optional(key);
    if (! node)
      throw_(parse_error, _f("Missing required field '%1%'") % key);

    if (node->empty())
      return amount_t::parse(node->data());

    return amount_t(decimal_t(get_required(*node, "number")),
                    get_required(*node, "currency"));
  }

  incomplete_amount_t get_incomplete_amount(const ptree& pt)
  {
    if (pt.empty()) {
      // "5.00 USD", "USD" or "5.00"
      const string& text(pt.data());
      if (text.empty())
        return incomplete_amount_t();

      string::size_type space = text.find(' ');
      if (space != string::npos)
        return incomplete_amount_t(decimal_t(text.substr(0, space)),
                                   text.substr(space + 1));

      if (std::isdigit(static_cast<unsigned char>(text[text.length() - 1])))
        return incomplete_amount_t(decimal_t(text), none);
      return incomplete_amount_t(none, text);
    }

    return incomplete_amount_t(get_decimal(pt, "number"),
                               pt.get_optional<string>("currency"));
  }

  cost_spec_t get_cost_spec(const ptree& pt)
  {
    cost_spec_t cost;
    cost.number_per   = get_decimal(pt, "number_per");
    cost.number_total = get_decimal(pt, "number_total");
    cost.currency     = pt.get_optional<string>("currency");
    cost.date         = get_date(pt, "date");
    cost.label        = pt.get_optional<string>("label");
    return cost;
  }

  void get_metadata(const ptree& pt, item_t& item)
  {
    if (optional<const ptree&> meta = pt.get_child_optional("meta")) {
      foreach (const ptree::value_type& entry, *meta) {
        if (entry.first.empty())
          throw_(parse_error, _("Field 'meta' must be an object"));
        item.set_meta(entry.first, entry.second.data());
      }
    }
  }

  void get_tags_and_links(const ptree& pt, tags_list& tags, links_list& links)
  {
    foreach (const string& tag, get_strings(pt, "tags"))
      add_marked_name(tags, tag, '#');
    foreach (const string& link, get_strings(pt, "links"))
      add_marked_name(links, link, '^');
  }

  open_t::booking_t get_booking(const ptree& pt)
  {
    optional<string> name = pt.get_optional<string>("booking");
    if (! name)
      return open_t::BOOKING_NONE;

    string booking = lowered(*name);
    if (booking == "none" || booking.empty())
      return open_t::BOOKING_NONE;
    else if (booking == "strict")
      return open_t::BOOKING_STRICT;
    else if (booking == "average")
      return open_t::BOOKING_AVERAGE;
    else if (booking == "fifo")
      return open_t::BOOKING_FIFO;
    else if (booking == "lifo")
      return open_t::BOOKING_LIFO;

    throw_(parse_error, _f("Unknown booking method '%1%'") % *name);
    return open_t::BOOKING_NONE;
  }

  post_t get_post(const ptree& pt)
  {
    post_t post(get_account(pt));

    if (optional<string> flag = pt.get_optional<string>("flag"))
      post.flag = flag_t::parse(*flag);
    if (optional<const ptree&> units = pt.get_child_optional("units"))
      post.units = get_incomplete_amount(*units);
    if (pt.get_child_optional("price"))
      post.price = get_amount(pt, "price");
    if (optional<const ptree&> cost = pt.get_child_optional("cost"))
      post.cost = get_cost_spec(*cost);

    get_metadata(pt, post);
    return post;
  }

  xact_t get_xact(const ptree& pt)
  {
    xact_t xact(get_required_date(pt),
                flag_t::parse(pt.get<string>("flag", "*")),
                pt.get<string>("narration", ""));

    xact.payee = pt.get_optional<string>("payee");
    get_tags_and_links(pt, xact.tags, xact.links);

    if (optional<const ptree&> posts = pt.get_child_optional("postings")) {
      foreach (const ptree::value_type& post, *posts)
        xact.add_post(get_post(post.second));
    }

    get_metadata(pt, xact);

    DEBUG("ptree.read", "Read transaction with " << xact.posts.size()
          << " postings");
    return xact;
  }
}

directive_t get_directive(const ptree& pt)
{
  const string type = get_required(pt, "type");

  DEBUG("ptree.read", "Reading " << type << " directive");

  if (type == "open") {
    open_t open(get_required_date(pt), get_account(pt),
                get_strings(pt, "currencies"), get_booking(pt));
    get_metadata(pt, open);
    return open;
  }
  else if (type == "close") {
    close_t close(get_required_date(pt), get_account(pt));
    get_metadata(pt, close);
    return close;
  }
  else if (type == "balance") {
    balance_t balance(get_required_date(pt), get_account(pt),
                      get_amount(pt, "amount"));
    balance.tolerance = get_decimal(pt, "tolerance");
    get_metadata(pt, balance);
    return balance;
  }
  else if (type == "option") {
    return option_t(get_required(pt, "name"), get_required(pt, "value"));
  }
  else if (type == "commodity") {
    commodity_t commodity(get_required_date(pt), get_required(pt, "name"));
    get_metadata(pt, commodity);
    return commodity;
  }
  else if (type == "custom") {
    custom_t custom(get_required_date(pt), get_required(pt, "name"),
                    get_strings(pt, "args"));
    get_metadata(pt, custom);
    return custom;
  }
  else if (type == "document") {
    document_t document(get_required_date(pt), get_account(pt),
                        get_required(pt, "filename"));
    get_tags_and_links(pt, document.tags, document.links);
    get_metadata(pt, document);
    return document;
  }
  else if (type == "event") {
    event_t event(get_required_date(pt), get_required(pt, "name"),
                  get_required(pt, "description"));
    get_metadata(pt, event);
    return event;
  }
  else if (type == "include") {
    return include_t(get_required(pt, "filename"));
  }
  else if (type == "note") {
    note_t note(get_required_date(pt), get_account(pt),
                get_required(pt, "comment"));
    get_metadata(pt, note);
    return note;
  }
  else if (type == "pad") {
    pad_t pad(get_required_date(pt), get_account(pt, "pad_to"),
              get_account(pt, "pad_from"));
    get_metadata(pt, pad);
    return pad;
  }
  else if (type == "plugin") {
    return plugin_t(get_required(pt, "module"),
                    pt.get_optional<string>("config"));
  }
  else if (type == "price") {
    price_t price(get_required_date(pt), get_required(pt, "currency"),
                  get_amount(pt, "amount"));
    get_metadata(pt, price);
    return price;
  }
  else if (type == "query") {
    query_t query(get_required_date(pt), get_required(pt, "name"),
                  get_required(pt, "query_string"));
    get_metadata(pt, query);
    return query;
  }
  else if (type == "transaction" || type == "txn") {
    return get_xact(pt);
  }

  DEBUG("ptree.read", "Unknown directive type '" << type << "'");
  return unsupported_t(type);
}

journal_file_t read_journal(std::istream& in)
{
  ptree pt;
  try {
    property_tree::read_json(in, pt);
  }
  catch (const property_tree::json_parser_error& err) {
    throw_(parse_error, _f("Invalid JSON at line %1%: %2%")
           % err.line() % err.message());
  }

  journal_file_t file;

  optional<ptree&> directives = pt.get_child_optional("directives");
  if (! directives)
    throw_(parse_error, _("Document has no 'directives' list"));

  std::size_t index = 0;
  foreach (const ptree::value_type& node, *directives) {
    index++;
    try {
      file.add(get_directive(node.second));
    }
    catch (const std::exception&) {
      add_error_context(_f("While reading directive #%1%") % index);
      throw;
    }
  }

  INFO("Read " << file.directives.size() << " directives");
  return file;
}

journal_file_t read_journal(const path& pathname)
{
  path filename = resolve_path(pathname);

  ifstream in(filename);
  if (! in.good())
    throw_(std::runtime_error,
           _f("Cannot read journal file %1%") % filename);

  try {
    journal_file_t file(read_journal(in));
    file.filename = filename;
    return file;
  }
  catch (const std::exception&) {
    add_error_context(_f("While reading file %1%") % filename);
    throw;
  }
}

} // namespace beanprint
