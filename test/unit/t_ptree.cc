#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE reader
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "ptree.h"
#include "print.h"

using namespace beanprint;

struct reader_fixture {
  reader_fixture() {}

  ~reader_fixture() {
    error_context();
  }

  journal_file_t read(const string& json) {
    std::istringstream in(json);
    return read_journal(in);
  }

  string reprinted(const string& json) {
    return render_document(read(json));
  }
};

BOOST_FIXTURE_TEST_SUITE(reader, reader_fixture)

BOOST_AUTO_TEST_CASE(testReadOpen)
{
  journal_file_t file = read(
    "{ \"directives\": ["
    "  { \"type\": \"open\", \"date\": \"2023-01-01\","
    "    \"account\": \"Assets:Bank:Checking\","
    "    \"currencies\": [\"USD\"], \"booking\": \"STRICT\","
    "    \"meta\": { \"institution\": \"\\\"First Bank\\\"\" } } ] }");

  BOOST_REQUIRE_EQUAL(1U, file.directives.size());
  BOOST_CHECK(! file.filename);

  const open_t * open = boost::get<open_t>(&file.directives[0]);
  BOOST_REQUIRE(open);
  BOOST_CHECK_EQUAL(date_t(2023, 1, 1), open->date);
  BOOST_CHECK_EQUAL(account_t::parse("Assets:Bank:Checking"), open->account);
  BOOST_REQUIRE_EQUAL(1U, open->currencies.size());
  BOOST_CHECK_EQUAL(string("USD"), open->currencies[0]);
  BOOST_CHECK_EQUAL(open_t::BOOKING_STRICT, open->booking);
  BOOST_CHECK_EQUAL(string("\"First Bank\""),
                    *open->metadata.get("institution"));
}

BOOST_AUTO_TEST_CASE(testReadTransaction)
{
  journal_file_t file = read(
    "{ \"directives\": ["
    "  { \"type\": \"txn\", \"date\": \"2023-03-02\", \"flag\": \"!\","
    "    \"payee\": \"Bistro\", \"narration\": \"Dinner\","
    "    \"tags\": [\"#trip\"], \"links\": [\"receipt\"],"
    "    \"postings\": ["
    "      { \"account\": \"Assets:Broker\", \"units\": \"10 HOOL\","
    "        \"price\": { \"number\": \"520.00\", \"currency\": \"USD\" },"
    "        \"cost\": { \"number_per\": \"500.00\", \"currency\": \"USD\","
    "                    \"date\": \"2023-01-01\", \"label\": \"lot\" } },"
    "      { \"account\": \"Assets:Cash\", \"flag\": \"!\","
    "        \"units\": { \"currency\": \"USD\" } },"
    "      { \"account\": \"Equity:Rounding\" } ] } ] }");

  BOOST_REQUIRE_EQUAL(1U, file.directives.size());
  const xact_t * xact = boost::get<xact_t>(&file.directives[0]);
  BOOST_REQUIRE(xact);

  BOOST_CHECK(xact->flag == flag_t(flag_t::WARNING));
  BOOST_CHECK_EQUAL(string("Bistro"), *xact->payee);
  BOOST_CHECK_EQUAL(string("trip"), xact->tags[0]);
  BOOST_CHECK_EQUAL(string("receipt"), xact->links[0]);
  BOOST_REQUIRE_EQUAL(3U, xact->posts.size());

  const post_t& broker(xact->posts[0]);
  BOOST_CHECK(broker.units.is_complete());
  BOOST_CHECK(*broker.price == amount_t::parse("520.00 USD"));
  BOOST_REQUIRE(broker.cost);
  BOOST_CHECK_EQUAL(string("lot"), *broker.cost->label);
  BOOST_CHECK(! broker.cost->is_total());

  BOOST_CHECK(! xact->posts[1].units.number);
  BOOST_CHECK_EQUAL(string("USD"), *xact->posts[1].units.currency);
  BOOST_CHECK(xact->posts[1].flag);
  BOOST_CHECK(xact->posts[2].units.empty());

  BOOST_CHECK_EQUAL(
    string("2023-03-02 ! \"Bistro\" \"Dinner\" #trip ^receipt\n"
           "\tAssets:Broker\t10 HOOL @ 520.00 USD {500.00 USD, 2023-01-01, \"lot\"}\n"
           "\t! Assets:Cash\tUSD\n"
           "\tEquity:Rounding\t\n"
           "\n"),
    render_document(file));
}

BOOST_AUTO_TEST_CASE(testReadEveryKind)
{
  string text = reprinted(
    "{ \"directives\": ["
    "  { \"type\": \"option\", \"name\": \"title\", \"value\": \"Books\" },"
    "  { \"type\": \"plugin\", \"module\": \"auto\", \"config\": \"x\" },"
    "  { \"type\": \"include\", \"filename\": \"other.beancount\" },"
    "  { \"type\": \"commodity\", \"date\": \"2023-01-01\", \"name\": \"HOOL\" },"
    "  { \"type\": \"close\", \"date\": \"2023-01-02\","
    "    \"account\": \"Assets:Cash\" },"
    "  { \"type\": \"balance\", \"date\": \"2023-01-03\","
    "    \"account\": \"Assets:Cash\", \"amount\": \"1.00 USD\","
    "    \"tolerance\": \"0.01\" },"
    "  { \"type\": \"custom\", \"date\": \"2023-01-04\", \"name\": \"budget\","
    "    \"args\": [\"Expenses:Food\", \"400.00 USD\"] },"
    "  { \"type\": \"document\", \"date\": \"2023-01-05\","
    "    \"account\": \"Assets:Cash\", \"filename\": \"r.pdf\","
    "    \"tags\": [\"paper\"] },"
    "  { \"type\": \"event\", \"date\": \"2023-01-06\", \"name\": \"city\","
    "    \"description\": \"Paris\" },"
    "  { \"type\": \"note\", \"date\": \"2023-01-07\","
    "    \"account\": \"Assets:Cash\", \"comment\": \"counted\" },"
    "  { \"type\": \"pad\", \"date\": \"2023-01-08\","
    "    \"pad_to\": \"Assets:Cash\", \"pad_from\": \"Equity:Opening\" },"
    "  { \"type\": \"price\", \"date\": \"2023-01-09\", \"currency\": \"HOOL\","
    "    \"amount\": \"520.00 USD\" },"
    "  { \"type\": \"query\", \"date\": \"2023-01-10\", \"name\": \"cash\","
    "    \"query_string\": \"SELECT 1\" } ] }");

  BOOST_CHECK_EQUAL(string("option \"title\" \"Books\"\n\n"
                           "plugin \"auto\" \"x\"\n\n"
                           "include other.beancount\n\n"
                           "2023-01-01 commodity HOOL\n\n"
                           "2023-01-02 close Assets:Cash\n\n"
                           "2023-01-03 balance Assets:Cash\t1.00 ~ 0.01 USD\n\n"
                           "2023-01-04 custom \"budget\" Expenses:Food 400.00 USD\n\n"
                           "2023-01-05 document Assets:Cash \"r.pdf\" #paper\n\n"
                           "2023-01-06 event \"city\" \"Paris\"\n\n"
                           "2023-01-07 note Assets:Cash \"counted\"\n\n"
                           "2023-01-08 pad Assets:Cash Equity:Opening\n\n"
                           "2023-01-09 price HOOL 520.00 USD\n\n"
                           "2023-01-10 query \"cash\" \"SELECT 1\"\n\n"),
                    text);
}

BOOST_AUTO_TEST_CASE(testUnknownType)
{
  journal_file_t file = read(
    "{ \"directives\": [ { \"type\": \"budget\", \"date\": \"2023-01-01\" } ] }");

  BOOST_REQUIRE_EQUAL(1U, file.directives.size());
  BOOST_CHECK(is_unsupported(file.directives[0]));
  BOOST_CHECK_EQUAL(string("budget"), directive_keyword(file.directives[0]));
  BOOST_CHECK_THROW(render_document(file), unsupported_error);
}

BOOST_AUTO_TEST_CASE(testReadErrors)
{
  BOOST_CHECK_THROW(read("{ \"directives\": ["), parse_error);
  BOOST_CHECK_THROW(read("{ }"), parse_error);
  BOOST_CHECK_THROW(read("{ \"directives\": [ { \"date\": \"2023-01-01\" } ] }"),
                    parse_error);
  BOOST_CHECK_THROW(read("{ \"directives\": [ { \"type\": \"close\","
                         " \"date\": \"2023-01-01\" } ] }"), parse_error);
  BOOST_CHECK_THROW(read("{ \"directives\": [ { \"type\": \"open\","
                         " \"date\": \"2023-01-01\", \"account\": \"Assets\","
                         " \"booking\": \"random\" } ] }"), parse_error);

  // Field values keep the error type of the thing being read
  BOOST_CHECK_THROW(read("{ \"directives\": [ { \"type\": \"close\","
                         " \"date\": \"2023-02-30\","
                         " \"account\": \"Assets\" } ] }"), date_error);
  BOOST_CHECK_THROW(read("{ \"directives\": [ { \"type\": \"close\","
                         " \"date\": \"2023-01-01\","
                         " \"account\": \"Cash\" } ] }"), account_error);
  BOOST_CHECK_THROW(read("{ \"directives\": [ { \"type\": \"price\","
                         " \"date\": \"2023-01-01\", \"currency\": \"HOOL\","
                         " \"amount\": \"lots USD\" } ] }"), decimal_error);
}

BOOST_AUTO_TEST_CASE(testErrorContext)
{
  error_context();

  try {
    read("{ \"directives\": ["
         "  { \"type\": \"commodity\", \"date\": \"2023-01-01\", \"name\": \"A\" },"
         "  { \"type\": \"commodity\", \"date\": \"2023-01-01\" } ] }");
    BOOST_FAIL("expected a parse_error");
  }
  catch (const parse_error& err) {
    BOOST_CHECK_EQUAL(string("Missing required field 'name'"),
                      string(err.what()));
    BOOST_CHECK_EQUAL(string("While reading directive #2"), error_context());
  }
}

BOOST_AUTO_TEST_SUITE_END()
