#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cppunit/extensions/HelperMacros.h>

#include <cstdio>

#include <fakeidp/Base64.h>
#include <fakeidp/crypto/Digest.h>

class DigestTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(DigestTest);
  CPPUNIT_TEST(TestNames);
  CPPUNIT_TEST(TestUnknownName);
  CPPUNIT_TEST(TestDigests);
  CPPUNIT_TEST_SUITE_END();

public:
  void TestNames();
  void TestUnknownName();
  void TestDigests();
};

static std::string tohex(const std::string& bin) {
  std::string hex;
  char buf[3];
  for(std::string::size_type n = 0; n < bin.length(); ++n) {
    snprintf(buf, sizeof(buf), "%02x", (unsigned int)(unsigned char)bin[n]);
    hex += buf;
  }
  return hex;
}

void DigestTest::TestNames() {
  FakeIdP::DigestAlgorithm alg = FakeIdP::DIGEST_SHA1;
  CPPUNIT_ASSERT(FakeIdP::string_to_digest("SHA256", alg));
  CPPUNIT_ASSERT_EQUAL(FakeIdP::DIGEST_SHA256, alg);
  CPPUNIT_ASSERT(FakeIdP::string_to_digest("sha384", alg));
  CPPUNIT_ASSERT_EQUAL(FakeIdP::DIGEST_SHA384, alg);
  CPPUNIT_ASSERT(FakeIdP::string_to_digest("SHA-512", alg));
  CPPUNIT_ASSERT_EQUAL(FakeIdP::DIGEST_SHA512, alg);
  CPPUNIT_ASSERT(FakeIdP::string_to_digest(" sha1 ", alg));
  CPPUNIT_ASSERT_EQUAL(FakeIdP::DIGEST_SHA1, alg);
  CPPUNIT_ASSERT_EQUAL(std::string("SHA384"), FakeIdP::digest_to_string(FakeIdP::DIGEST_SHA384));
}

void DigestTest::TestUnknownName() {
  FakeIdP::DigestAlgorithm alg = FakeIdP::DIGEST_SHA256;
  CPPUNIT_ASSERT(!FakeIdP::string_to_digest("md5", alg));
  CPPUNIT_ASSERT(!FakeIdP::string_to_digest("", alg));
  CPPUNIT_ASSERT(!FakeIdP::string_to_digest("SHA224", alg));
  // Untouched on failure
  CPPUNIT_ASSERT_EQUAL(FakeIdP::DIGEST_SHA256, alg);
}

void DigestTest::TestDigests() {
  std::string out;
  CPPUNIT_ASSERT(FakeIdP::Digest(FakeIdP::DIGEST_SHA1, "abc", out));
  CPPUNIT_ASSERT_EQUAL(std::string("a9993e364706816aba3e25717850c26c9cd0d89d"), tohex(out));
  CPPUNIT_ASSERT(FakeIdP::Digest(FakeIdP::DIGEST_SHA256, "abc", out));
  CPPUNIT_ASSERT_EQUAL(std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"), tohex(out));
  CPPUNIT_ASSERT_EQUAL(std::string("ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0="), FakeIdP::Base64::encode(out));
  CPPUNIT_ASSERT(FakeIdP::Digest(FakeIdP::DIGEST_SHA384, "abc", out));
  CPPUNIT_ASSERT_EQUAL(std::string("cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed8086072ba1e7cc2358baeca134c825a7"), tohex(out));
  CPPUNIT_ASSERT(FakeIdP::Digest(FakeIdP::DIGEST_SHA512, "abc", out));
  CPPUNIT_ASSERT_EQUAL(std::string("ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f"), tohex(out));
}

CPPUNIT_TEST_SUITE_REGISTRATION(DigestTest);
