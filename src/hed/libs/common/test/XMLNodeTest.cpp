// -*- indent-tabs-mode: nil -*-
#ifdef HAVE_CONFIG_H
#include <config.h>
#endif


#include <string>

#include <cppunit/extensions/HelperMacros.h>

#include <fakeidp/XMLNode.h>

class XMLNodeTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(XMLNodeTest);
  CPPUNIT_TEST(TestParsing);
  CPPUNIT_TEST(TestCreate);
  CPPUNIT_TEST(TestExternalNamespaces);
  CPPUNIT_TEST(TestReplace);
  CPPUNIT_TEST(TestDestroy);
  CPPUNIT_TEST(TestCopy);
  CPPUNIT_TEST(TestQuery);
  CPPUNIT_TEST_SUITE_END();

public:
  void setUp();
  void tearDown();
  void TestParsing();
  void TestCreate();
  void TestExternalNamespaces();
  void TestReplace();
  void TestDestroy();
  void TestCopy();
  void TestQuery();

};


void XMLNodeTest::setUp() {
}


void XMLNodeTest::tearDown() {
}


void XMLNodeTest::TestParsing() {
  std::string xml_str(
     "<!-- comment must not be visible -->\n"
     "<root>\n"
     "  <child1>value1</child1>\n"
     "  <child2>value2</child2>\n"
     "</root>"
  );
  FakeIdP::XMLNode xml(xml_str);
  CPPUNIT_ASSERT((bool)xml);
  CPPUNIT_ASSERT_EQUAL(std::string("root"), xml.Name());
  CPPUNIT_ASSERT_EQUAL(std::string("value1"), (std::string)xml["child1"]);
  CPPUNIT_ASSERT_EQUAL(std::string("value2"), (std::string)xml["child2"]);
  std::string s;
  xml.GetXML(s);
  CPPUNIT_ASSERT_EQUAL(std::string("<root>\n  <child1>value1</child1>\n  <child2>value2</child2>\n</root>"),s);
  xml.GetDoc(s);
  CPPUNIT_ASSERT_EQUAL("<?xml version=\"1.0\"?>\n"+xml_str+"\n",s);

  FakeIdP::XMLNode broken("<root><child1></root>");
  CPPUNIT_ASSERT(!broken);
  FakeIdP::XMLNode empty("");
  CPPUNIT_ASSERT(!empty);
}

void XMLNodeTest::TestCreate() {
  FakeIdP::NS ns("samlp", "urn:oasis:names:tc:SAML:2.0:protocol");
  FakeIdP::XMLNode response(ns, "samlp:Response");
  CPPUNIT_ASSERT((bool)response);
  response.NewAttribute("ID") = "_r1";
  response.NewAttribute("Version") = "2.0";
  FakeIdP::XMLNode issuer = response.NewChild("saml:Issuer", FakeIdP::NS("saml", "urn:oasis:names:tc:SAML:2.0:assertion"));
  issuer = "https://idp.example.com?a=1&b=2";
  FakeIdP::XMLNode status = response.NewChild("samlp:Status");
  status.NewChild("samlp:StatusCode").NewAttribute("Value") = "urn:oasis:names:tc:SAML:2.0:status:Success";

  CPPUNIT_ASSERT_EQUAL(std::string("urn:oasis:names:tc:SAML:2.0:protocol"), status.Namespace());
  CPPUNIT_ASSERT_EQUAL(2, response.Size());
  CPPUNIT_ASSERT_EQUAL(2, response.AttributesSize());
  CPPUNIT_ASSERT_EQUAL(std::string("_r1"), (std::string)response.Attribute("ID"));
  CPPUNIT_ASSERT_EQUAL(std::string("https://idp.example.com?a=1&b=2"), (std::string)response["saml:Issuer"]);
  CPPUNIT_ASSERT((bool)response["urn:oasis:names:tc:SAML:2.0:assertion:Issuer"]);
  CPPUNIT_ASSERT(!response["samlp:Issuer"]);

  std::string s;
  response.GetXML(s);
  CPPUNIT_ASSERT_EQUAL(std::string(
    "<samlp:Response xmlns:samlp=\"urn:oasis:names:tc:SAML:2.0:protocol\" ID=\"_r1\" Version=\"2.0\">"
    "<saml:Issuer xmlns:saml=\"urn:oasis:names:tc:SAML:2.0:assertion\">https://idp.example.com?a=1&amp;b=2</saml:Issuer>"
    "<samlp:Status><samlp:StatusCode Value=\"urn:oasis:names:tc:SAML:2.0:status:Success\"/></samlp:Status>"
    "</samlp:Response>"), s);
}

void XMLNodeTest::TestExternalNamespaces() {
  FakeIdP::XMLNode xml("<ns1:root xmlns:ns1=\"uri:ns1\" xmlns:ns2=\"uri:ns2\" xmlns:ns3=\"uri:ns3\">"
                       "<ns1:child ns2:attr=\"v\"><ns1:leaf/></ns1:child></ns1:root>");
  std::string s;
  xml["child"].GetXML(s);
  CPPUNIT_ASSERT(s.compare(0, 11, "<ns1:child ") == 0);
  // Only namespaces used inside subtree are carried over
  CPPUNIT_ASSERT(s.find(" xmlns:ns1=\"uri:ns1\"") != std::string::npos);
  CPPUNIT_ASSERT(s.find(" xmlns:ns2=\"uri:ns2\"") != std::string::npos);
  CPPUNIT_ASSERT(s.find("ns3") == std::string::npos);
  CPPUNIT_ASSERT(s.find(" ns2:attr=\"v\"><ns1:leaf/></ns1:child>") != std::string::npos);
  FakeIdP::XMLNode copy(s);
  CPPUNIT_ASSERT((bool)copy);
  CPPUNIT_ASSERT_EQUAL(std::string("uri:ns1"), copy["leaf"].Namespace());
}

void XMLNodeTest::TestReplace() {
  FakeIdP::XMLNode xml("<root><first/><target>old</target><last/></root>");
  FakeIdP::XMLNode replacement("<e:EncryptedData xmlns:e=\"uri:e\"><e:CipherValue>abc</e:CipherValue></e:EncryptedData>");
  FakeIdP::XMLNode target = xml["target"];
  target.Replace(replacement);
  CPPUNIT_ASSERT_EQUAL(std::string("e:EncryptedData"), target.FullName());
  CPPUNIT_ASSERT(!xml["target"]);
  CPPUNIT_ASSERT_EQUAL(std::string("EncryptedData"), xml.Child(1).Name());
  CPPUNIT_ASSERT_EQUAL(std::string("abc"), (std::string)xml["EncryptedData"]["CipherValue"]);
  CPPUNIT_ASSERT_EQUAL(std::string("last"), xml.Child(2).Name());
  // Replacement is copied
  CPPUNIT_ASSERT((bool)replacement);
  CPPUNIT_ASSERT(replacement != target);

  // Owner of document is never replaced
  FakeIdP::XMLNode other("<other/>");
  xml.Replace(other);
  CPPUNIT_ASSERT_EQUAL(std::string("root"), xml.Name());
}

void XMLNodeTest::TestDestroy() {
  FakeIdP::XMLNode xml("<root>\n  <a/>\n  <b/>\n</root>");
  FakeIdP::XMLNode a = xml["a"];
  a.Destroy();
  CPPUNIT_ASSERT(!a);
  CPPUNIT_ASSERT(!xml["a"]);
  std::string s;
  xml.GetXML(s);
  CPPUNIT_ASSERT_EQUAL(std::string("<root>\n  <b/>\n</root>"), s);
  xml.Destroy();
  CPPUNIT_ASSERT(!xml);
}

void XMLNodeTest::TestCopy() {
  FakeIdP::XMLNode xml("<root><a x=\"1\"><b>text</b></a></root>");
  FakeIdP::XMLNode copy;
  xml["a"].New(copy);
  CPPUNIT_ASSERT((bool)copy);
  CPPUNIT_ASSERT_EQUAL(std::string("a"), copy.Name());
  copy["b"] = "changed";
  CPPUNIT_ASSERT_EQUAL(std::string("text"), (std::string)xml["a"]["b"]);
  CPPUNIT_ASSERT(!copy.Parent());
  CPPUNIT_ASSERT(xml["a"]["b"].GetRoot() == xml);

  FakeIdP::XMLNode child = xml.NewChild(copy);
  CPPUNIT_ASSERT_EQUAL(std::string("changed"), (std::string)child["b"]);
  CPPUNIT_ASSERT_EQUAL(2, xml.Size());
  CPPUNIT_ASSERT(xml["a"][1] == child);
  CPPUNIT_ASSERT(!xml["a"][2]);
}

void XMLNodeTest::TestQuery() {
  std::string xml_str1(
     "<root1>"
      "<child1>value1</child1>"
      "<child2>"
       "<child3>value3</child3>"
      "</child2>"
     "</root1>"
  );
  std::string xml_str2(
     "<ns1:root1 xmlns:ns1=\"http://host/path1\" xmlns:ns2=\"http://host/path2\" >"
      "<ns1:child1>value1</ns1:child1>"
      "<ns2:child2>"
       "<ns2:child3 ID=\"_x\">value3</ns2:child3>"
      "</ns2:child2>"
     "</ns1:root1>"
  );
  FakeIdP::XMLNode xml1(xml_str1);
  FakeIdP::XMLNode xml2(xml_str2);
  FakeIdP::NS ns;
  ns["ns1"] = "http://host/path1";
  ns["ns2"] = "http://host/path2";
  FakeIdP::XMLNodeList list1 = xml1.XPathLookup("/root1/child2",FakeIdP::NS());
  CPPUNIT_ASSERT_EQUAL(1,(int)list1.size());

  FakeIdP::XMLNodeList list2 = xml1.XPathLookup("/ns1:root1/ns2:child2",ns);
  CPPUNIT_ASSERT_EQUAL(0,(int)list2.size());

  FakeIdP::XMLNodeList list3 = xml2.XPathLookup("/root1/child2",FakeIdP::NS());
  CPPUNIT_ASSERT_EQUAL(0,(int)list3.size());

  FakeIdP::XMLNodeList list4 = xml2.XPathLookup("/ns1:root1/ns2:child2",ns);
  CPPUNIT_ASSERT_EQUAL(1,(int)list4.size());

  FakeIdP::XMLNodeList list5 = xml2.XPathLookup("/ns1:root1/ns1:child1",ns);
  CPPUNIT_ASSERT_EQUAL(1,(int)list5.size());

  FakeIdP::XMLNodeList list6 = xml2.XPathLookup("//*[@ID='_x']",FakeIdP::NS());
  CPPUNIT_ASSERT_EQUAL(1,(int)list6.size());
  CPPUNIT_ASSERT_EQUAL(std::string("value3"),(std::string)list6.front());

  // Only elements inside the subtree are returned
  FakeIdP::XMLNodeList list7 = xml2["child1"].XPathLookup("//ns2:child3",ns);
  CPPUNIT_ASSERT_EQUAL(0,(int)list7.size());
}

CPPUNIT_TEST_SUITE_REGISTRATION(XMLNodeTest);
