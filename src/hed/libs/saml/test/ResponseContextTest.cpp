#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cppunit/extensions/HelperMacros.h>

#include <fakeidp/saml/ResponseContext.h>

class ResponseContextTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(ResponseContextTest);
  CPPUNIT_TEST(TestIdentifiers);
  CPPUNIT_TEST(TestWindow);
  CPPUNIT_TEST(TestWholeSeconds);
  CPPUNIT_TEST_SUITE_END();

public:
  void setUp() {}
  void tearDown() {}
  void TestIdentifiers();
  void TestWindow();
  void TestWholeSeconds();
};

void ResponseContextTest::TestIdentifiers() {
  FakeIdP::ResponseContext context;
  CPPUNIT_ASSERT_EQUAL((std::string::size_type)37, context.ResponseID().length());
  CPPUNIT_ASSERT_EQUAL('_', context.ResponseID()[0]);
  CPPUNIT_ASSERT_EQUAL('_', context.AssertionID()[0]);
  CPPUNIT_ASSERT(context.ResponseID() != context.AssertionID());
  CPPUNIT_ASSERT_EQUAL("#" + context.AssertionID(), context.ReferenceURI());

  FakeIdP::ResponseContext other;
  CPPUNIT_ASSERT(context.ResponseID() != other.ResponseID());
  CPPUNIT_ASSERT(context.AssertionID() != other.AssertionID());
}

void ResponseContextTest::TestWindow() {
  FakeIdP::ResponseContext context("_r", "_a", FakeIdP::Time(FakeIdP::Time::DAY));
  CPPUNIT_ASSERT_EQUAL(std::string("#_a"), context.ReferenceURI());
  CPPUNIT_ASSERT_EQUAL(std::string("1970-01-02T00:00:00Z"), context.IssueInstant());
  CPPUNIT_ASSERT_EQUAL(std::string("1970-01-01T23:59:55Z"), context.NotBefore());
  CPPUNIT_ASSERT_EQUAL(std::string("1970-01-02T01:00:00Z"), context.NotOnOrAfter());
  CPPUNIT_ASSERT_EQUAL(std::string("1970-01-02T00:03:00Z"), context.ConfirmationNotOnOrAfter());
}

void ResponseContextTest::TestWholeSeconds() {
  FakeIdP::ResponseContext context("_r", "_a", FakeIdP::Time(1700000000, 999999999));
  CPPUNIT_ASSERT_EQUAL((time_t)1700000000, context.Instant().GetTime());
  CPPUNIT_ASSERT_EQUAL((uint32_t)0, context.Instant().GetTimeNanoseconds());

  FakeIdP::ResponseContext now;
  CPPUNIT_ASSERT_EQUAL((uint32_t)0, now.Instant().GetTimeNanoseconds());
  CPPUNIT_ASSERT(now.Instant() <= FakeIdP::Time());
}

CPPUNIT_TEST_SUITE_REGISTRATION(ResponseContextTest);
