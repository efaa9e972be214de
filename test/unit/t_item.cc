#define BOOST_TEST_DYN_LINK
//#define BOOST_TEST_MODULE item
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "item.h"

using namespace beanprint;

struct item_fixture {
  item_fixture() {}
  ~item_fixture() {}
};

BOOST_FIXTURE_TEST_SUITE(item, item_fixture)

BOOST_AUTO_TEST_CASE(testMetadataOrder)
{
  metadata_t meta;
  BOOST_CHECK(meta.empty());

  meta.set("zeta", "1");
  meta.set("alpha", "2");
  meta.set("mid", "3");

  BOOST_CHECK_EQUAL(3U, meta.size());

  // Entries come back in the order they were first set
  metadata_t::const_iterator i = meta.begin();
  BOOST_CHECK_EQUAL(string("zeta"), (*i++).first);
  BOOST_CHECK_EQUAL(string("alpha"), (*i++).first);
  BOOST_CHECK_EQUAL(string("mid"), (*i++).first);
  BOOST_CHECK(i == meta.end());
}

BOOST_AUTO_TEST_CASE(testMetadataReplace)
{
  metadata_t meta;
  meta.set("first", "a");
  meta.set("second", "b");
  meta.set("first", "c");

  BOOST_CHECK_EQUAL(2U, meta.size());
  BOOST_CHECK(meta.has("first"));
  BOOST_CHECK_EQUAL(string("c"), *meta.get("first"));
  BOOST_CHECK(! meta.get("third"));

  // Replacing a value keeps the entry where it was
  BOOST_CHECK_EQUAL(string("first"), (*meta.begin()).first);

  BOOST_CHECK(meta.remove("first"));
  BOOST_CHECK(! meta.remove("first"));
  BOOST_CHECK(! meta.has("first"));
  BOOST_CHECK_EQUAL(1U, meta.size());
}

BOOST_AUTO_TEST_CASE(testMetadataEquality)
{
  metadata_t m1, m2, m3;
  m1.set("a", "1");
  m1.set("b", "2");
  m2.set("a", "1");
  m2.set("b", "2");
  m3.set("b", "2");
  m3.set("a", "1");

  BOOST_CHECK(m1 == m2);
  BOOST_CHECK(m1 != m3);

  item_t it;
  it.set_meta("a", "1");
  it.set_meta("b", "2");
  BOOST_CHECK(it.metadata == m1);
}

BOOST_AUTO_TEST_CASE(testFlags)
{
  BOOST_CHECK(flag_t::parse("*") == flag_t(flag_t::OKAY));
  BOOST_CHECK(flag_t::parse("!") == flag_t(flag_t::WARNING));

  flag_t other = flag_t::parse("P");
  BOOST_CHECK_EQUAL(flag_t::OTHER, other.kind);
  BOOST_CHECK_EQUAL(string("P"), other.other);
  BOOST_CHECK(other != flag_t::parse("T"));
  BOOST_CHECK(other != flag_t(flag_t::OKAY));

  BOOST_CHECK_EQUAL(flag_t::OKAY, flag_t().kind);
}

BOOST_AUTO_TEST_CASE(testMarkedNames)
{
  tags_list tags;
  add_marked_name(tags, "#trip", '#');
  add_marked_name(tags, "food", '#');
  add_marked_name(tags, "trip", '#');

  BOOST_REQUIRE_EQUAL(2U, tags.size());
  BOOST_CHECK_EQUAL(string("trip"), tags[0]);
  BOOST_CHECK_EQUAL(string("food"), tags[1]);

  // Only the marker of the right kind is removed
  links_list links;
  add_marked_name(links, "#invoice", '^');
  add_marked_name(links, "^receipt", '^');
  BOOST_REQUIRE_EQUAL(2U, links.size());
  BOOST_CHECK_EQUAL(string("#invoice"), links[0]);
  BOOST_CHECK_EQUAL(string("receipt"), links[1]);
}

BOOST_AUTO_TEST_SUITE_END()
