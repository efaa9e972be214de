#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE math
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "decimal.h"

using namespace beanprint;

struct decimal_fixture {
  decimal_fixture() {}

  ~decimal_fixture() {
    error_context();            // discard whatever a failed parse left
  }
};

BOOST_FIXTURE_TEST_SUITE(decimal, decimal_fixture)

BOOST_AUTO_TEST_CASE(testParser)
{
  decimal_t x0;
  decimal_t x1("100.00");
  decimal_t x2("-5.25");
  decimal_t x3("+7");
  decimal_t x4("1,234.5");
  decimal_t x5(".5");

  BOOST_CHECK(x0.is_zero());
  BOOST_CHECK_EQUAL(decimal_t::precision_t(0), x0.precision());

  BOOST_CHECK_EQUAL(decimal_t::precision_t(2), x1.precision());
  BOOST_CHECK_EQUAL(string("100.00"), x1.to_string());

  BOOST_CHECK_EQUAL(-1, x2.sign());
  BOOST_CHECK_EQUAL(string("-5.25"), x2.to_string());

  BOOST_CHECK_EQUAL(1, x3.sign());
  BOOST_CHECK_EQUAL(string("7"), x3.to_string());

  BOOST_CHECK_EQUAL(string("1234.5"), x4.to_string());
  BOOST_CHECK_EQUAL(string("0.5"), x5.to_string());

  BOOST_CHECK(x0.valid());
  BOOST_CHECK(x1.valid());
  BOOST_CHECK(x4.valid());
}

BOOST_AUTO_TEST_CASE(testParseErrors)
{
  BOOST_CHECK_THROW(decimal_t(""), decimal_error);
  BOOST_CHECK_THROW(decimal_t("-"), decimal_error);
  BOOST_CHECK_THROW(decimal_t("1.2.3"), decimal_error);
  BOOST_CHECK_THROW(decimal_t("12 USD"), decimal_error);
  BOOST_CHECK_THROW(decimal_t(",100"), decimal_error);
  BOOST_CHECK_THROW(decimal_t("1.000,5"), decimal_error);
}

BOOST_AUTO_TEST_CASE(testPrecisionLimit)
{
  const string widest("0." + string(decimal_t::max_precision, '1'));

  decimal_t x1(widest);
  BOOST_CHECK_EQUAL(decimal_t::max_precision, x1.precision());
  BOOST_CHECK_EQUAL(widest, x1.to_string());
  BOOST_CHECK(x1.valid());

  BOOST_CHECK_THROW(decimal_t(widest + "1"), decimal_error);

  // Far past what the precision field can count
  BOOST_CHECK_THROW(decimal_t("1." + string(70000, '0')), decimal_error);
}

BOOST_AUTO_TEST_CASE(testExactPrinting)
{
  // Trailing zeros are part of the written value and are kept
  BOOST_CHECK_EQUAL(string("5.000"), decimal_t("5.000").to_string());
  BOOST_CHECK_EQUAL(string("0.01"), decimal_t("0.01").to_string());
  BOOST_CHECK_EQUAL(string("-0.001"), decimal_t("-0.001").to_string());
  BOOST_CHECK_EQUAL(string("123456789012345678901234567890.123456789"),
                    decimal_t("123456789012345678901234567890.123456789")
                    .to_string());

  std::ostringstream out;
  out << decimal_t("42.10");
  BOOST_CHECK_EQUAL(string("42.10"), out.str());
}

BOOST_AUTO_TEST_CASE(testComparisons)
{
  decimal_t x1("1.5");
  decimal_t x2("1.50");
  decimal_t x3("1.49");
  decimal_t x4(-2L);

  BOOST_CHECK(x1 == x2);
  BOOST_CHECK(x1 != x3);
  BOOST_CHECK(x3 < x1);
  BOOST_CHECK(x4 < x3);
  BOOST_CHECK_EQUAL(0, x1.compare(x2));
  BOOST_CHECK(x2.compare(x3) > 0);
  BOOST_CHECK(x4.compare(x1) < 0);
}

BOOST_AUTO_TEST_CASE(testCopyAndAssign)
{
  decimal_t x1("10.25");
  decimal_t x2(x1);
  decimal_t x3;

  x3 = x2;
  BOOST_CHECK_EQUAL(x1, x2);
  BOOST_CHECK_EQUAL(x1, x3);
  BOOST_CHECK_EQUAL(decimal_t::precision_t(2), x3.precision());

  x3 = x3;
  BOOST_CHECK_EQUAL(string("10.25"), x3.to_string());

  x2.parse("3");
  BOOST_CHECK_EQUAL(string("10.25"), x1.to_string());
  BOOST_CHECK_EQUAL(string("3"), x2.to_string());
}

BOOST_AUTO_TEST_SUITE_END()
