// -*- indent-tabs-mode: nil -*-

#include <sstream>

#include <cppunit/extensions/HelperMacros.h>

#include <fakeidp/Logger.h>

class LoggerTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(LoggerTest);
  CPPUNIT_TEST(TestLoggerINFO);
  CPPUNIT_TEST(TestLoggerVERBOSE);
  CPPUNIT_TEST(TestFormats);
  CPPUNIT_TEST(TestArguments);
  CPPUNIT_TEST(TestHierarchy);
  CPPUNIT_TEST(TestLevels);
  CPPUNIT_TEST_SUITE_END();

public:
  void setUp();
  void tearDown();

  void TestLoggerINFO();
  void TestLoggerVERBOSE();
  void TestFormats();
  void TestArguments();
  void TestHierarchy();
  void TestLevels();

private:
  std::stringstream stream;
  FakeIdP::LogStream *output;
  FakeIdP::Logger *logger;
};


void LoggerTest::setUp() {
  output = new FakeIdP::LogStream(stream);
  FakeIdP::Logger::getRootLogger().addDestination(*output);
  logger = new FakeIdP::Logger(FakeIdP::Logger::getRootLogger(), "TestLogger", FakeIdP::INFO);
}

void LoggerTest::tearDown() {
  FakeIdP::Logger::getRootLogger().removeDestinations();
  delete logger;
  delete output;
}

void LoggerTest::TestLoggerINFO() {
  std::string res;
  logger->msg(FakeIdP::VERBOSE, "This VERBOSE message should not be seen");
  res = stream.str();
  CPPUNIT_ASSERT(res.empty());

  logger->msg(FakeIdP::INFO, "This INFO message should be seen");
  res = stream.str();
  res = res.substr(res.rfind(']') + 2);
  CPPUNIT_ASSERT_EQUAL(res, std::string("This INFO message should be seen\n"));
  stream.str("");
}


void LoggerTest::TestLoggerVERBOSE() {
  std::string res;
  logger->setThreshold(FakeIdP::VERBOSE);
  logger->msg(FakeIdP::VERBOSE, "This VERBOSE message should now be seen");
  res = stream.str();
  res = res.substr(res.rfind(']') + 2);
  CPPUNIT_ASSERT_EQUAL(res, std::string("This VERBOSE message should now be seen\n"));
  stream.str("");

  logger->msg(FakeIdP::INFO, "This INFO message should also be seen");
  res = stream.str();
  res = res.substr(res.rfind(']') + 2);
  CPPUNIT_ASSERT_EQUAL(res, std::string("This INFO message should also be seen\n"));
  stream.str("");
}

void LoggerTest::TestFormats() {
  std::string res;
  CPPUNIT_ASSERT_EQUAL(std::string("FakeIdP.TestLogger"), logger->getDomain());
  logger->msg(FakeIdP::ERROR, "Node %s is missing in %s", "DigestValue", std::string("Signature"));
  res = stream.str();
  CPPUNIT_ASSERT_EQUAL(std::string("["), res.substr(0, 1));
  CPPUNIT_ASSERT(res.find("] [FakeIdP.TestLogger] [ERROR] Node DigestValue is missing in Signature\n") != std::string::npos);
  stream.str("");

  output->setFormat(FakeIdP::ShortFormat);
  CPPUNIT_ASSERT_EQUAL(FakeIdP::ShortFormat, output->getFormat());
  logger->msg(FakeIdP::WARNING, "Found %u signatures", 2u);
  CPPUNIT_ASSERT_EQUAL(std::string("WARNING: Found 2 signatures\n"), stream.str());
  stream.str("");
}

void LoggerTest::TestArguments() {
  output->setFormat(FakeIdP::ShortFormat);
  const char *missing = NULL;
  logger->msg(FakeIdP::INFO, "id=%s name=%s", missing, std::string());
  CPPUNIT_ASSERT_EQUAL(std::string("INFO: id=(null) name=(empty)\n"), stream.str());
  stream.str("");

  std::string big(2000, 'x');
  logger->msg(FakeIdP::INFO, "<%s>", big);
  CPPUNIT_ASSERT_EQUAL(std::string("INFO: <") + big + ">\n", stream.str());
  stream.str("");

  CPPUNIT_ASSERT_EQUAL(std::string("fakeidp-response version 1.0"),
                       FakeIdP::IString("%s version %s", "fakeidp-response", "1.0").str());
  CPPUNIT_ASSERT_EQUAL(std::string("100%s"), FakeIdP::IString("100%s").str());
}

void LoggerTest::TestHierarchy() {
  output->setFormat(FakeIdP::ShortFormat);
  std::stringstream childstream;
  FakeIdP::LogStream childoutput(childstream);
  childoutput.setFormat(FakeIdP::ShortFormat);
  {
    // Inherits INFO from parent
    FakeIdP::Logger child(*logger, "Child");
    CPPUNIT_ASSERT_EQUAL(std::string("FakeIdP.TestLogger.Child"), child.getDomain());
    CPPUNIT_ASSERT_EQUAL(FakeIdP::INFO, child.getThreshold());
    child.addDestination(childoutput);
    child.msg(FakeIdP::VERBOSE, "hidden");
    child.msg(FakeIdP::INFO, "shown");
    child.removeDestinations();
  }
  CPPUNIT_ASSERT_EQUAL(std::string("INFO: shown\n"), childstream.str());
  // Reaches destinations of ancestors too
  CPPUNIT_ASSERT_EQUAL(std::string("INFO: shown\n"), stream.str());
  stream.str("");
}

void LoggerTest::TestLevels() {
  FakeIdP::LogLevel level = FakeIdP::INFO;
  CPPUNIT_ASSERT(FakeIdP::string_to_level("VERBOSE", level));
  CPPUNIT_ASSERT_EQUAL(FakeIdP::VERBOSE, level);
  CPPUNIT_ASSERT(!FakeIdP::string_to_level("verbose", level));
  CPPUNIT_ASSERT(FakeIdP::istring_to_level("debug", level));
  CPPUNIT_ASSERT_EQUAL(FakeIdP::DEBUG, level);
  CPPUNIT_ASSERT(!FakeIdP::istring_to_level("LOUD", level));
  CPPUNIT_ASSERT_EQUAL(FakeIdP::DEBUG, level);
  CPPUNIT_ASSERT_EQUAL(std::string("ERROR"), FakeIdP::level_to_string(FakeIdP::ERROR));
}

CPPUNIT_TEST_SUITE_REGISTRATION(LoggerTest);
