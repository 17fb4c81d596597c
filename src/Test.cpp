// -*- indent-tabs-mode: nil -*-

#include <string.h>

#include <iostream>

#include <cppunit/CompilerOutputter.h>
#include <cppunit/extensions/TestFactoryRegistry.h>
#include <cppunit/ui/text/TestRunner.h>

#include <fakeidp/Logger.h>

/*
 * Use -v to enable logging when running a unit test directly.
 * E.g.: ./SAMLResponseTest -v
 */
int main(int argc, char **argv) {

  FakeIdP::LogStream logcerr(std::cerr);

  if (argc > 1 && strcmp(argv[1], "-v") == 0) {
    // set logging
    FakeIdP::Logger::getRootLogger().addDestination(logcerr);
    FakeIdP::Logger::getRootLogger().setThreshold(FakeIdP::DEBUG);
  }

  CppUnit::TextUi::TestRunner runner;
  runner.addTest(CppUnit::TestFactoryRegistry::getRegistry().makeTest());

  runner.setOutputter(CppUnit::CompilerOutputter::defaultOutputter
                      (&runner.result(), std::cerr));

  bool wasSuccessful = runner.run();

  return wasSuccessful ? 0 : 1;
}
