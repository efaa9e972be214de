#define BOOST_TEST_DYN_LINK
//#define BOOST_TEST_MODULE amount
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "amount.h"

using namespace beanprint;

struct amount_fixture {
  amount_fixture() {}

  ~amount_fixture() {
    error_context();
  }
};

BOOST_FIXTURE_TEST_SUITE(amount, amount_fixture)

BOOST_AUTO_TEST_CASE(testParser)
{
  amount_t x1(amount_t::parse("100.00 USD"));
  amount_t x2(amount_t::parse("  -5 HOOL "));

  BOOST_CHECK_EQUAL(string("100.00"), x1.number.to_string());
  BOOST_CHECK_EQUAL(string("USD"), x1.currency);
  BOOST_CHECK_EQUAL(string("-5"), x2.number.to_string());
  BOOST_CHECK_EQUAL(string("HOOL"), x2.currency);

  BOOST_CHECK(x1 == amount_t(decimal_t("100.00"), "USD"));
  BOOST_CHECK(x1 == amount_t(decimal_t("100"), "USD"));
  BOOST_CHECK(x1 != amount_t(decimal_t("100.00"), "EUR"));

  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x2.valid());
}

BOOST_AUTO_TEST_CASE(testParseErrors)
{
  BOOST_CHECK_THROW(amount_t::parse(""), amount_error);
  BOOST_CHECK_THROW(amount_t::parse("100.00"), amount_error);
  BOOST_CHECK_THROW(amount_t::parse("USD"), amount_error);
  BOOST_CHECK_THROW(amount_t::parse("abc USD"), decimal_error);
}

BOOST_AUTO_TEST_CASE(testIncompleteAmount)
{
  incomplete_amount_t x0;
  incomplete_amount_t x1(decimal_t("5.00"), string("USD"));
  incomplete_amount_t x2(decimal_t("5.00"), none);
  incomplete_amount_t x3(none, string("USD"));
  incomplete_amount_t x4(amount_t(decimal_t("5.00"), "USD"));

  BOOST_CHECK(x0.empty());
  BOOST_CHECK(! x0.is_complete());
  BOOST_CHECK(! x0.to_amount());

  BOOST_CHECK(x1.is_complete());
  BOOST_CHECK(! x1.empty());
  BOOST_CHECK(*x1.to_amount() == amount_t(decimal_t("5.00"), "USD"));

  BOOST_CHECK(! x2.is_complete());
  BOOST_CHECK(! x2.empty());
  BOOST_CHECK(! x3.is_complete());
  BOOST_CHECK(! x3.to_amount());

  BOOST_CHECK(x1 == x4);
  BOOST_CHECK(x1 != x2);
  BOOST_CHECK(x2 != x3);
}

BOOST_AUTO_TEST_SUITE_END()
