#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE data
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "account.h"

using namespace beanprint;

struct account_fixture {
  account_fixture() {}

  ~account_fixture() {
    error_context();
  }
};

BOOST_FIXTURE_TEST_SUITE(account, account_fixture)

BOOST_AUTO_TEST_CASE(testConstructors)
{
  // A bare account is the Assets root with no components
  account_t root;
  BOOST_CHECK_EQUAL(account_t::ASSETS, root.type);
  BOOST_CHECK(root.parts.empty());
  BOOST_CHECK_EQUAL(string("Assets"), root.fullname());
  BOOST_CHECK(root.valid());

  account_t::parts_t parts;
  parts.push_back("Food");
  parts.push_back("Coffee");
  account_t food(account_t::EXPENSES, parts);
  BOOST_CHECK_EQUAL(string("Expenses:Food:Coffee"), food.fullname());
  BOOST_CHECK(food.valid());
}

BOOST_AUTO_TEST_CASE(testTypeNames)
{
  BOOST_CHECK_EQUAL(string("Assets"), account_t::type_name(account_t::ASSETS));
  BOOST_CHECK_EQUAL(string("Liabilities"),
                    account_t::type_name(account_t::LIABILITIES));
  BOOST_CHECK_EQUAL(string("Equity"), account_t::type_name(account_t::EQUITY));
  BOOST_CHECK_EQUAL(string("Income"), account_t::type_name(account_t::INCOME));
  BOOST_CHECK_EQUAL(string("Expenses"),
                    account_t::type_name(account_t::EXPENSES));
}

BOOST_AUTO_TEST_CASE(testParse)
{
  account_t checking = account_t::parse("Assets:Bank:Checking");
  BOOST_CHECK_EQUAL(account_t::ASSETS, checking.type);
  BOOST_REQUIRE_EQUAL(2U, checking.parts.size());
  BOOST_CHECK_EQUAL(string("Bank"), checking.parts[0]);
  BOOST_CHECK_EQUAL(string("Checking"), checking.parts[1]);

  account_t equity = account_t::parse("Equity");
  BOOST_CHECK_EQUAL(account_t::EQUITY, equity.type);
  BOOST_CHECK(equity.parts.empty());

  BOOST_CHECK_EQUAL(account_t::parse("Liabilities:Card"),
                    account_t::parse("Liabilities:Card"));
  BOOST_CHECK(account_t::parse("Income:Salary") !=
              account_t::parse("Income:Bonus"));
}

BOOST_AUTO_TEST_CASE(testParseErrors)
{
  BOOST_CHECK_THROW(account_t::parse(""), account_error);
  BOOST_CHECK_THROW(account_t::parse("Revenue:Sales"), account_error);
  BOOST_CHECK_THROW(account_t::parse("assets:Bank"), account_error);
  BOOST_CHECK_THROW(account_t::parse("Assets::Bank"), account_error);
  BOOST_CHECK_THROW(account_t::parse("Assets:Bank:"), account_error);
}

BOOST_AUTO_TEST_CASE(testValid)
{
  account_t::parts_t parts;
  parts.push_back("Bank:Checking");
  BOOST_CHECK(! account_t(account_t::ASSETS, parts).valid());

  parts.clear();
  parts.push_back("");
  BOOST_CHECK(! account_t(account_t::ASSETS, parts).valid());
}

BOOST_AUTO_TEST_CASE(testStream)
{
  std::ostringstream out;
  out << account_t::parse("Expenses:Food");
  BOOST_CHECK_EQUAL(string("Expenses:Food"), out.str());
}

BOOST_AUTO_TEST_SUITE_END()
