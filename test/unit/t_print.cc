#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE print
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "print.h"

using namespace beanprint;

namespace {
  // A sink that accepts only a fixed number of characters
  class limited_streambuf : public std::streambuf
  {
    std::size_t remaining;

  public:
    string written;

    explicit limited_streambuf(std::size_t limit) : remaining(limit) {}

  protected:
    virtual int_type overflow(int_type c) {
      if (traits_type::eq_int_type(c, traits_type::eof()) || remaining == 0)
        return traits_type::eof();
      remaining--;
      written += traits_type::to_char_type(c);
      return c;
    }
  };
}

struct print_fixture {
  renderer_t renderer;

  print_fixture() {}

  ~print_fixture() {
    error_context();
  }

  template <typename T>
  string rendered(const T& node) {
    std::ostringstream out;
    renderer.render(node, out);
    return out.str();
  }

  account_t checking() {
    return account_t::parse("Assets:Bank:Checking");
  }
};

BOOST_FIXTURE_TEST_SUITE(print, print_fixture)

BOOST_AUTO_TEST_CASE(testOpen)
{
  std::vector<string> currencies;
  currencies.push_back("USD");

  open_t open(date_t(2023, 1, 1), checking(), currencies,
              open_t::BOOKING_STRICT);
  BOOST_CHECK_EQUAL(string("2023-01-01 open Assets:Bank:Checking USD \"strict\"\n"),
                    rendered(open));

  open.booking = open_t::BOOKING_NONE;
  BOOST_CHECK_EQUAL(string("2023-01-01 open Assets:Bank:Checking USD\n"),
                    rendered(open));

  open.currencies.push_back("EUR");
  open.booking = open_t::BOOKING_FIFO;
  BOOST_CHECK_EQUAL(string("2023-01-01 open Assets:Bank:Checking USD EUR \"fifo\"\n"),
                    rendered(open));

  open.currencies.clear();
  open.booking = open_t::BOOKING_AVERAGE;
  BOOST_CHECK_EQUAL(string("2023-01-01 open Assets:Bank:Checking \"average\"\n"),
                    rendered(open));

  open.booking = open_t::BOOKING_LIFO;
  open.set_meta("institution", "\"First Bank\"");
  BOOST_CHECK_EQUAL(string("2023-01-01 open Assets:Bank:Checking \"lifo\"\n"
                           "\tinstitution: \"First Bank\"\n"),
                    rendered(open));
}

BOOST_AUTO_TEST_CASE(testClose)
{
  close_t close(date_t(2023, 12, 31), checking());
  BOOST_CHECK_EQUAL(string("2023-12-31 close Assets:Bank:Checking\n"),
                    rendered(close));
}

BOOST_AUTO_TEST_CASE(testBalance)
{
  balance_t balance(date_t(2023, 2, 1), checking(),
                    amount_t::parse("100.00 USD"));
  BOOST_CHECK_EQUAL(string("2023-02-01 balance Assets:Bank:Checking\t100.00 USD\n"),
                    rendered(balance));

  balance.tolerance = decimal_t("0.01");
  BOOST_CHECK_EQUAL(string("2023-02-01 balance Assets:Bank:Checking\t100.00 ~ 0.01 USD\n"),
                    rendered(balance));
}

BOOST_AUTO_TEST_CASE(testUndatedDirectives)
{
  BOOST_CHECK_EQUAL(string("option \"title\" \"My Books\"\n"),
                    rendered(option_t("title", "My Books")));
  BOOST_CHECK_EQUAL(string("include accounts.beancount\n"),
                    rendered(include_t("accounts.beancount")));
  BOOST_CHECK_EQUAL(string("plugin \"beancount.plugins.auto\"\n"),
                    rendered(plugin_t("beancount.plugins.auto")));
  BOOST_CHECK_EQUAL(string("plugin \"beancount.plugins.check\" \"strict\"\n"),
                    rendered(plugin_t("beancount.plugins.check",
                                      string("strict"))));
}

BOOST_AUTO_TEST_CASE(testSimpleDirectives)
{
  const date_t when(2023, 4, 5);

  BOOST_CHECK_EQUAL(string("2023-04-05 commodity HOOL\n"),
                    rendered(commodity_t(when, "HOOL")));

  BOOST_CHECK_EQUAL(string("2023-04-05 event \"location\" \"Paris, France\"\n"),
                    rendered(event_t(when, "location", "Paris, France")));

  BOOST_CHECK_EQUAL(string("2023-04-05 note Assets:Bank:Checking \"Called the bank\"\n"),
                    rendered(note_t(when, checking(), "Called the bank")));

  BOOST_CHECK_EQUAL(string("2023-04-05 pad Assets:Bank:Checking Equity:Opening-Balances\n"),
                    rendered(pad_t(when, checking(),
                                   account_t::parse("Equity:Opening-Balances"))));

  BOOST_CHECK_EQUAL(string("2023-04-05 price HOOL 520.10 USD\n"),
                    rendered(price_t(when, "HOOL",
                                     amount_t::parse("520.10 USD"))));

  BOOST_CHECK_EQUAL(string("2023-04-05 query \"cash\" \"SELECT account\"\n"),
                    rendered(query_t(when, "cash", "SELECT account")));
}

BOOST_AUTO_TEST_CASE(testCustom)
{
  std::vector<string> args;
  custom_t custom(date_t(2023, 4, 5), "budget", args);
  BOOST_CHECK_EQUAL(string("2023-04-05 custom \"budget\"\n"), rendered(custom));

  custom.args.push_back("Expenses:Food");
  custom.args.push_back("\"monthly\"");
  custom.args.push_back("400.00 USD");
  BOOST_CHECK_EQUAL(string("2023-04-05 custom \"budget\" Expenses:Food \"monthly\" 400.00 USD\n"),
                    rendered(custom));
}

BOOST_AUTO_TEST_CASE(testDocument)
{
  document_t document(date_t(2023, 4, 5), checking(), "/docs/statement.pdf");
  BOOST_CHECK_EQUAL(string("2023-04-05 document Assets:Bank:Checking \"/docs/statement.pdf\"\n"),
                    rendered(document));

  document.add_tag("#statement");
  document.add_link("april");
  BOOST_CHECK_EQUAL(string("2023-04-05 document Assets:Bank:Checking \"/docs/statement.pdf\" #statement ^april\n"),
                    rendered(document));
}

BOOST_AUTO_TEST_CASE(testTransaction)
{
  xact_t xact(date_t(2023, 3, 1), flag_t(flag_t::OKAY), "Coffee");
  xact.add_post(post_t(account_t::parse("Expenses:Food"),
                       amount_t::parse("5.00 USD")));

  BOOST_CHECK_EQUAL(string("2023-03-01 * \"Coffee\"\n"
                           "\tExpenses:Food\t5.00 USD\n"),
                    rendered(xact));
}

BOOST_AUTO_TEST_CASE(testTransactionDetails)
{
  xact_t xact(date_t(2023, 3, 2), flag_t(flag_t::WARNING), "Dinner");
  xact.payee = string("Bistro");
  xact.add_tag("trip");
  xact.add_tag("food");
  xact.add_link("^receipt-12");
  xact.set_meta("source", "\"card\"");

  post_t& food = xact.add_post(post_t(account_t::parse("Expenses:Food"),
                                      amount_t::parse("42.50 EUR")));
  food.set_meta("shared", "TRUE");

  post_t& card = xact.add_post(post_t(account_t::parse("Liabilities:Card")));
  card.flag = flag_t(flag_t::WARNING);

  BOOST_CHECK_EQUAL(string("2023-03-02 ! \"Bistro\" \"Dinner\" #trip #food ^receipt-12\n"
                           "\tExpenses:Food\t42.50 EUR\n"
                           "\tshared: TRUE\n"
                           "\t! Liabilities:Card\t\n"
                           "\tsource: \"card\"\n"),
                    rendered(xact));
}

BOOST_AUTO_TEST_CASE(testDirectiveDispatch)
{
  directive_t directive =
    balance_t(date_t(2023, 2, 1), checking(), amount_t::parse("100.00 USD"));
  BOOST_CHECK_EQUAL(string("2023-02-01 balance Assets:Bank:Checking\t100.00 USD\n"),
                    rendered(directive));

  directive = xact_t(date_t(2023, 3, 1), flag_t::parse("P"), "Padding");
  BOOST_CHECK_EQUAL(string("2023-03-01 P \"Padding\"\n"), rendered(directive));

  std::ostringstream out;
  directive = unsupported_t("budget");
  BOOST_CHECK_THROW(renderer.render(directive, out), unsupported_error);
  BOOST_CHECK(out.str().empty());
}

BOOST_AUTO_TEST_CASE(testLedger)
{
  journal_t journal;
  journal.add(option_t("title", "Books"));
  journal.add(close_t(date_t(2023, 12, 31), checking()));

  BOOST_CHECK_EQUAL(string("option \"title\" \"Books\"\n"
                           "\n"
                           "2023-12-31 close Assets:Bank:Checking\n"
                           "\n"),
                    render_ledger(journal));

  journal_t empty;
  BOOST_CHECK_EQUAL(string(""), render_ledger(empty));

  journal_file_t file;
  file.add(commodity_t(date_t(2023, 1, 1), "USD"));
  BOOST_CHECK_EQUAL(string("2023-01-01 commodity USD\n\n"),
                    render_document(file));
}

BOOST_AUTO_TEST_CASE(testUnsupportedStopsRendering)
{
  journal_t journal;
  journal.add(option_t("title", "Books"));
  journal.add(close_t(date_t(2023, 12, 31), checking()));
  journal.add(unsupported_t("budget"));
  journal.add(commodity_t(date_t(2024, 1, 1), "USD"));

  std::ostringstream out;
  BOOST_CHECK_THROW(renderer.render(journal, out), unsupported_error);

  // Everything before the failing directive stays written
  BOOST_CHECK_EQUAL(string("option \"title\" \"Books\"\n"
                           "\n"
                           "2023-12-31 close Assets:Bank:Checking\n"
                           "\n"),
                    out.str());

  BOOST_CHECK_THROW(render_ledger(journal), render_error);

  journal.remove_unsupported();
  BOOST_CHECK_NO_THROW(render_ledger(journal));
}

BOOST_AUTO_TEST_CASE(testWriteFailure)
{
  journal_t journal;
  journal.add(close_t(date_t(2023, 12, 31), checking()));
  journal.add(close_t(date_t(2024, 12, 31), checking()));

  // Room for the first directive and its blank line only
  limited_streambuf buf(39);
  std::ostream out(&buf);

  BOOST_CHECK_THROW(renderer.render(journal, out), io_error);
  BOOST_CHECK_EQUAL(string("2023-12-31 close Assets:Bank:Checking\n\n"),
                    buf.written);
}

BOOST_AUTO_TEST_SUITE_END()
