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

#include "print.h"

namespace beanprint {

namespace {
  void check_stream(std::ostream& out)
  {
    if (! out)
      throw_(io_error, _("Failed to write to the output stream"));
  }

  void end_line(std::ostream& out)
  {
    out << '\n';
    check_stream(out);
  }

  void print_quoted(std::ostream& out, const string& str)
  {
    out << '"' << str << '"';
  }

  void print_tags_and_links(std::ostream&     out,
                            const tags_list&  tags,
                            const links_list& links)
  {
    foreach (const string& tag, tags)
      out << " #" << tag;
    foreach (const string& link, links)
      out << " ^" << link;
  }

  class directive_renderer : public boost::static_visitor<>
  {
    const renderer_t& renderer;
    std::ostream&     out;

  public:
    directive_renderer(const renderer_t& _renderer, std::ostream& _out)
      : renderer(_renderer), out(_out) {}

    void operator()(const open_t& open) const {
      renderer.render(open, out);
    }
    void operator()(const close_t& close) const {
      renderer.render(close, out);
    }
    void operator()(const balance_t& balance) const {
      renderer.render(balance, out);
    }
    void operator()(const option_t& option) const {
      renderer.render(option, out);
    }
    void operator()(const commodity_t& commodity) const {
      renderer.render(commodity, out);
    }
    void operator()(const custom_t& custom) const {
      renderer.render(custom, out);
    }
    void operator()(const document_t& document) const {
      renderer.render(document, out);
    }
    void operator()(const event_t& event) const {
      renderer.render(event, out);
    }
    void operator()(const include_t& include) const {
      renderer.render(include, out);
    }
    void operator()(const note_t& note) const {
      renderer.render(note, out);
    }
    void operator()(const pad_t& pad) const {
      renderer.render(pad, out);
    }
    void operator()(const plugin_t& plugin) const {
      renderer.render(plugin, out);
    }
    void operator()(const price_t& price) const {
      renderer.render(price, out);
    }
    void operator()(const query_t& query) const {
      renderer.render(query, out);
    }
    void operator()(const xact_t& xact) const {
      renderer.render(xact, out);
    }

    void operator()(const unsupported_t& unsupported) const {
      if (unsupported.keyword.empty())
        throw_(unsupported_error, _("Cannot render an unsupported directive"));
      else
        throw_(unsupported_error,
               _f("Cannot render unsupported directive '%1%'")
               % unsupported.keyword);
    }
  };
}

void renderer_t::render_directives(const directives_list& directives,
                                   std::ostream&          out) const
{
  foreach (const directive_t& directive, directives) {
    render(directive, out);
    end_line(out);
  }
}

void renderer_t::render(const journal_t& journal, std::ostream& out) const
{
  INFO("Rendering ledger of " << journal.directives.size() << " directives");
  render_directives(journal.directives, out);
}

void renderer_t::render(const journal_file_t& file, std::ostream& out) const
{
  INFO("Rendering document "
       << (file.filename ? file.filename->string() : string("<stream>"))
       << " of " << file.directives.size() << " directives");
  render_directives(file.directives, out);
}

void renderer_t::render(const directive_t& directive, std::ostream& out) const
{
  IF_DEBUG("print.directive") {
    optional<date_t> when = directive_date(directive);
    DEBUG("print.directive",
          "Rendering " << directive_keyword(directive) << " directive"
          << (when ? " dated " + format_date(*when) : string()));
  }

  boost::apply_visitor(directive_renderer(*this, out), directive);
}

void renderer_t::render(const metadata_t& metadata, std::ostream& out) const
{
  foreach (const metadata_t::entry_t& entry, metadata) {
    out << '\t' << entry.first << ": " << entry.second;
    end_line(out);
  }
}

void renderer_t::render(const open_t& open, std::ostream& out) const
{
  out << format_date(open.date) << " open ";
  render(open.account, out);

  foreach (const string& currency, open.currencies)
    out << ' ' << currency;

  switch (open.booking) {
  case open_t::BOOKING_NONE:
    break;
  case open_t::BOOKING_STRICT:
    out << " \"strict\"";
    break;
  case open_t::BOOKING_AVERAGE:
    out << " \"average\"";
    break;
  case open_t::BOOKING_FIFO:
    out << " \"fifo\"";
    break;
  case open_t::BOOKING_LIFO:
    out << " \"lifo\"";
    break;
  }
  end_line(out);

  render(open.metadata, out);
}

void renderer_t::render(const close_t& close, std::ostream& out) const
{
  out << format_date(close.date) << " close ";
  render(close.account, out);
  end_line(out);

  render(close.metadata, out);
}

void renderer_t::render(const balance_t& balance, std::ostream& out) const
{
  out << format_date(balance.date) << " balance ";
  render(balance.account, out);
  out << '\t';

  if (balance.tolerance)
    out << balance.amount.number << " ~ " << *balance.tolerance
        << ' ' << balance.amount.currency;
  else
    render(balance.amount, out);
  end_line(out);

  render(balance.metadata, out);
}

void renderer_t::render(const option_t& option, std::ostream& out) const
{
  out << "option ";
  print_quoted(out, option.name);
  out << ' ';
  print_quoted(out, option.value);
  end_line(out);
}

void renderer_t::render(const commodity_t& commodity, std::ostream& out) const
{
  out << format_date(commodity.date) << " commodity " << commodity.name;
  end_line(out);

  render(commodity.metadata, out);
}

void renderer_t::render(const custom_t& custom, std::ostream& out) const
{
  out << format_date(custom.date) << " custom ";
  print_quoted(out, custom.name);
  foreach (const string& arg, custom.args)
    out << ' ' << arg;
  end_line(out);

  render(custom.metadata, out);
}

void renderer_t::render(const document_t& document, std::ostream& out) const
{
  out << format_date(document.date) << " document ";
  render(document.account, out);
  out << ' ';
  print_quoted(out, document.filename);
  print_tags_and_links(out, document.tags, document.links);
  end_line(out);

  render(document.metadata, out);
}

void renderer_t::render(const event_t& event, std::ostream& out) const
{
  out << format_date(event.date) << " event ";
  print_quoted(out, event.name);
  out << ' ';
  print_quoted(out, event.description);
  end_line(out);

  render(event.metadata, out);
}

void renderer_t::render(const include_t& include, std::ostream& out) const
{
  out << "include " << include.filename;
  end_line(out);
}

void renderer_t::render(const note_t& note, std::ostream& out) const
{
  out << format_date(note.date) << " note ";
  render(note.account, out);
  out << ' ';
  print_quoted(out, note.comment);
  end_line(out);

  render(note.metadata, out);
}

void renderer_t::render(const pad_t& pad, std::ostream& out) const
{
  out << format_date(pad.date) << " pad ";
  render(pad.pad_to, out);
  out << ' ';
  render(pad.pad_from, out);
  end_line(out);

  render(pad.metadata, out);
}

void renderer_t::render(const plugin_t& plugin, std::ostream& out) const
{
  out << "plugin ";
  print_quoted(out, plugin.module);
  if (plugin.config) {
    out << ' ';
    print_quoted(out, *plugin.config);
  }
  end_line(out);
}

void renderer_t::render(const price_t& price, std::ostream& out) const
{
  out << format_date(price.date) << " price " << price.currency << ' ';
  render(price.amount, out);
  end_line(out);

  render(price.metadata, out);
}

void renderer_t::render(const query_t& query, std::ostream& out) const
{
  out << format_date(query.date) << " query ";
  print_quoted(out, query.name);
  out << ' ';
  print_quoted(out, query.query_string);
  end_line(out);

  render(query.metadata, out);
}

void renderer_t::render(const xact_t& xact, std::ostream& out) const
{
  out << format_date(xact.date) << ' ';
  render(xact.flag, out);

  if (xact.payee) {
    out << ' ';
    print_quoted(out, *xact.payee);
  }
  out << ' ';
  print_quoted(out, xact.narration);

  print_tags_and_links(out, xact.tags, xact.links);
  end_line(out);

  TRACE(1, "Rendering " << xact.posts.size() << " postings");

  foreach (const post_t& post, xact.posts)
    render(post, out);

  render(xact.metadata, out);
}

void renderer_t::render(const post_t& post, std::ostream& out) const
{
  out << '\t';
  if (post.flag) {
    render(*post.flag, out);
    out << ' ';
  }
  render(post.account, out);
  out << '\t';
  render(post.units, out);

  if (post.price) {
    out << " @ ";
    render(*post.price, out);
  }
  if (post.cost) {
    out << ' ';
    render(*post.cost, out);
  }
  end_line(out);

  render(post.metadata, out);
}

void renderer_t::render(const account_t& account, std::ostream& out) const
{
  out << account_t::type_name(account.type);
  foreach (const string& part, account.parts)
    out << ':' << part;
  check_stream(out);
}

void renderer_t::render(const amount_t& amount, std::ostream& out) const
{
  out << amount.number << ' ' << amount.currency;
  check_stream(out);
}

void renderer_t::render(const incomplete_amount_t& amount,
                        std::ostream&              out) const
{
  if (amount.number) {
    out << *amount.number;
    if (amount.currency)
      out << ' ';
  }
  if (amount.currency)
    out << *amount.currency;
  check_stream(out);
}

void renderer_t::render(const cost_spec_t& cost, std::ostream& out) const
{
  const bool total = cost.is_total();
  out << (total ? "{{" : "{");

  bool first = true;

  const optional<decimal_t>& number(cost.display_number());
  if (number || cost.currency) {
    render(incomplete_amount_t(number, cost.currency), out);
    first = false;
  }
  if (cost.date) {
    if (! first)
      out << ", ";
    out << format_date(*cost.date);
    first = false;
  }
  if (cost.label) {
    if (! first)
      out << ", ";
    print_quoted(out, *cost.label);
  }

  out << (total ? "}}" : "}");
  check_stream(out);
}

void renderer_t::render(const flag_t& flag, std::ostream& out) const
{
  switch (flag.kind) {
  case flag_t::OKAY:
    out << '*';
    break;
  case flag_t::WARNING:
    out << '!';
    break;
  case flag_t::OTHER:
    out << flag.other;
    break;
  }
  check_stream(out);
}

string render_ledger(const journal_t& journal)
{
  std::ostringstream out;
  renderer_t().render(journal, out);
  return out.str();
}

string render_document(const journal_file_t& file)
{
  std::ostringstream out;
  renderer_t().render(file, out);
  return out.str();
}

} // namespace beanprint
