// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstring>
#include <ctype.h>

#include <libxml/parser.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

#include "XMLNode.h"

namespace FakeIdP {

  static const int parse_options =
    XML_PARSE_NODICT | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET;

  static inline bool is_element(xmlNodePtr node) {
    return (node != NULL) && (node->type == XML_ELEMENT_NODE);
  }

  static inline const xmlChar* to_xml(const std::string& s) {
    return s.empty() ? NULL : (const xmlChar*)(s.c_str());
  }

  // Returns local part of "prefix:name" and stores prefix.
  static const char* split_name(const char *name, std::string& prefix) {
    prefix.clear();
    if (name == NULL) return "";
    const char *colon = strchr(name, ':');
    if (colon == NULL) return name;
    prefix.assign(name, colon - name);
    return colon + 1;
  }

  // Namespace of element or attribute. Attr keeps ns at same offset as Node.
  static xmlNsPtr node_ns(xmlNodePtr node) {
    if (node == NULL) return NULL;
    if ((node->type != XML_ELEMENT_NODE) && (node->type != XML_ATTRIBUTE_NODE)) return NULL;
    return node->ns;
  }

  static std::string ns_href(xmlNodePtr node) {
    xmlNsPtr ns = node_ns(node);
    return (ns && ns->href) ? (const char*)(ns->href) : "";
  }

  static bool same_name(xmlNodePtr a, xmlNodePtr b) {
    if ((a == NULL) || (b == NULL)) return false;
    if (a->type != b->type) return false;
    if (!xmlStrEqual(a->name, b->name)) return false;
    return ns_href(a) == ns_href(b);
  }

  static bool name_matches(xmlNodePtr node, const char *name) {
    if ((node == NULL) || (name == NULL)) return false;
    // Last colon separates local name so that URIs may be used as qualifier
    const char *local = strrchr(name, ':');
    if (local == NULL) return xmlStrEqual(node->name, (const xmlChar*)name);
    if (!xmlStrEqual(node->name, (const xmlChar*)(local + 1))) return false;
    std::string qualifier(name, local - name);
    xmlNsPtr ns = node_ns(node);
    if (qualifier.find(':') != std::string::npos)
      return (ns != NULL) && xmlStrEqual(ns->href, (const xmlChar*)qualifier.c_str());
    std::string prefix = (ns && ns->prefix) ? (const char*)(ns->prefix) : "";
    return prefix == qualifier;
  }

  // Declares namespaces on node unless the prefix is already bound to the
  // same URI at this point of the tree.
  static void declare_namespaces(xmlNodePtr node, const NS& namespaces) {
    for (NS::const_iterator n = namespaces.begin(); n != namespaces.end(); ++n) {
      xmlNsPtr visible = xmlSearchNs(node->doc, node, to_xml(n->first));
      if (visible && xmlStrEqual(visible->href, (const xmlChar*)n->second.c_str())) continue;
      xmlNewNs(node, (const xmlChar*)n->second.c_str(), to_xml(n->first));
    }
  }

  static xmlNodePtr root_element(xmlDocPtr doc) {
    if (doc == NULL) return NULL;
    return xmlDocGetRootElement(doc);
  }

  // Makes node own doc, dropping whatever it referred to before.
  static void adopt(xmlNodePtr& node, bool& owner, xmlDocPtr doc) {
    if (owner && node) xmlFreeDoc(node->doc);
    node = NULL;
    owner = false;
    xmlNodePtr root = root_element(doc);
    if (root == NULL) {
      if (doc) xmlFreeDoc(doc);
      return;
    }
    node = root;
    owner = true;
  }

  XMLNode::XMLNode(const std::string& xml)
    : node_(NULL),
      is_owner_(false) {
    if (xml.empty()) return;
    adopt(node_, is_owner_, xmlReadMemory(xml.c_str(), xml.length(), NULL, NULL, parse_options));
  }

  XMLNode::XMLNode(const NS& ns, const char *name)
    : node_(NULL),
      is_owner_(false) {
    std::string prefix;
    const char *local = split_name(name, prefix);
    xmlDocPtr doc = xmlNewDoc((const xmlChar*)"1.0");
    if (doc == NULL) return;
    xmlNodePtr root = xmlNewDocNode(doc, NULL, (const xmlChar*)local, NULL);
    if (root == NULL) {
      xmlFreeDoc(doc);
      return;
    }
    xmlDocSetRootElement(doc, root);
    declare_namespaces(root, ns);
    root->ns = xmlSearchNs(doc, root, to_xml(prefix));
    node_ = root;
    is_owner_ = true;
  }

  XMLNode::~XMLNode(void) {
    if (is_owner_ && node_) xmlFreeDoc(node_->doc);
  }

  XMLNode& XMLNode::operator=(const XMLNode& node) {
    if (this == &node) return *this;
    if (is_owner_ && node_) xmlFreeDoc(node_->doc);
    node_ = node.node_;
    is_owner_ = false;
    return *this;
  }

  void XMLNode::New(XMLNode& new_node) const {
    xmlDocPtr doc = NULL;
    if (is_element(node_)) {
      doc = xmlNewDoc((const xmlChar*)"1.0");
      if (doc) xmlDocSetRootElement(doc, xmlDocCopyNode(node_, doc, 1));
    }
    adopt(new_node.node_, new_node.is_owner_, doc);
  }

  bool XMLNode::ReadFromFile(const std::string& file_name) {
    xmlDocPtr doc = xmlReadFile(file_name.c_str(), NULL, parse_options);
    if (root_element(doc) == NULL) {
      if (doc) xmlFreeDoc(doc);
      return false;
    }
    adopt(node_, is_owner_, doc);
    return true;
  }

  XMLNode XMLNode::Child(int n) const {
    if (!is_element(node_) || (n < 0)) return XMLNode();
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if (is_element(p) && (n-- == 0)) return XMLNode(p);
    }
    return XMLNode();
  }

  int XMLNode::Size(void) const {
    int n = 0;
    if (is_element(node_)) {
      for (xmlNodePtr p = node_->children; p; p = p->next)
        if (is_element(p)) ++n;
    }
    return n;
  }

  XMLNode XMLNode::operator[](const char *name) const {
    if (!is_element(node_)) return XMLNode();
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if (is_element(p) && name_matches(p, name)) return XMLNode(p);
    }
    return XMLNode();
  }

  XMLNode XMLNode::operator[](int n) const {
    if (n < 0) return XMLNode();
    for (xmlNodePtr p = node_; p; p = p->next) {
      if (same_name(node_, p) && (n-- == 0)) return XMLNode(p);
    }
    return XMLNode();
  }

  void XMLNode::operator++(void) {
    if (node_ == NULL) return;
    if (is_owner_) {
      // Document element has no siblings
      xmlFreeDoc(node_->doc);
      node_ = NULL;
      is_owner_ = false;
      return;
    }
    xmlNodePtr p = node_->next;
    while (p && !same_name(node_, p)) p = p->next;
    node_ = p;
  }

  std::string XMLNode::Name(void) const {
    if (node_ && node_->name) return (const char*)(node_->name);
    return "";
  }

  std::string XMLNode::Prefix(void) const {
    xmlNsPtr ns = node_ns(node_);
    return (ns && ns->prefix) ? (const char*)(ns->prefix) : "";
  }

  std::string XMLNode::Namespace(void) const {
    return ns_href(node_);
  }

  XMLNode::operator std::string(void) const {
    std::string text;
    if (node_ == NULL) return text;
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if ((p->type == XML_TEXT_NODE) && p->content) text += (const char*)(p->content);
    }
    return text;
  }

  XMLNode& XMLNode::operator=(const char *content) {
    if (node_ == NULL) return *this;
    // xmlNodeSetContent interprets entity references, so escape them first
    xmlChar *escaped = xmlEncodeSpecialChars(node_->doc, (const xmlChar*)(content ? content : ""));
    xmlNodeSetContent(node_, escaped ? escaped : (const xmlChar*)"");
    if (escaped) xmlFree(escaped);
    return *this;
  }

  XMLNode XMLNode::Attribute(const char *name) const {
    if (!is_element(node_)) return XMLNode();
    for (xmlAttrPtr a = node_->properties; a; a = a->next) {
      if (name_matches((xmlNodePtr)a, name)) return XMLNode((xmlNodePtr)a);
    }
    return XMLNode();
  }

  XMLNode XMLNode::NewAttribute(const char *name) {
    if (!is_element(node_)) return XMLNode();
    std::string prefix;
    const char *local = split_name(name, prefix);
    xmlNsPtr ns = prefix.empty() ? NULL : xmlSearchNs(node_->doc, node_, to_xml(prefix));
    return XMLNode((xmlNodePtr)xmlNewNsProp(node_, ns, (const xmlChar*)local, NULL));
  }

  int XMLNode::AttributesSize(void) const {
    int n = 0;
    if (is_element(node_)) {
      for (xmlAttrPtr a = node_->properties; a; a = a->next) ++n;
    }
    return n;
  }

  XMLNode XMLNode::NewChild(const char *name) {
    return NewChild(name, NS());
  }

  XMLNode XMLNode::NewChild(const char *name, const NS& namespaces) {
    if (!is_element(node_)) return XMLNode();
    std::string prefix;
    const char *local = split_name(name, prefix);
    xmlNodePtr child = xmlNewDocNode(node_->doc, NULL, (const xmlChar*)local, NULL);
    if (child == NULL) return XMLNode();
    xmlAddChild(node_, child);
    declare_namespaces(child, namespaces);
    child->ns = xmlSearchNs(child->doc, child, to_xml(prefix));
    return XMLNode(child);
  }

  XMLNode XMLNode::NewChild(const XMLNode& node) {
    if (!is_element(node_) || !is_element(node.node_)) return XMLNode();
    xmlNodePtr copy = xmlDocCopyNode(node.node_, node_->doc, 1);
    if (copy == NULL) return XMLNode();
    return XMLNode(xmlAddChild(node_, copy));
  }

  void XMLNode::Replace(const XMLNode& node) {
    if (is_owner_) return;
    if (!is_element(node_) || !is_element(node.node_)) return;
    xmlNodePtr copy = xmlDocCopyNode(node.node_, node_->doc, 1);
    if (copy == NULL) return;
    xmlReplaceNode(node_, copy);
    xmlFreeNode(node_);
    node_ = copy;
  }

  static bool is_blank_text(xmlNodePtr node) {
    if ((node == NULL) || (node->type != XML_TEXT_NODE)) return false;
    for (const xmlChar *c = node->content; c && *c; ++c)
      if (!isspace(*c)) return false;
    return true;
  }

  void XMLNode::Destroy(void) {
    if (node_ == NULL) return;
    if (is_owner_) {
      xmlFreeDoc(node_->doc);
    } else if (node_->type == XML_ATTRIBUTE_NODE) {
      xmlRemoveProp((xmlAttrPtr)node_);
    } else if (is_element(node_)) {
      xmlNodePtr indent = is_blank_text(node_->prev) ? node_->prev : NULL;
      xmlUnlinkNode(node_);
      xmlFreeNode(node_);
      if (indent) {
        xmlUnlinkNode(indent);
        xmlFreeNode(indent);
      }
    } else {
      return;
    }
    node_ = NULL;
    is_owner_ = false;
  }

  XMLNodeList XMLNode::XPathLookup(const std::string& xpathExpr, const NS& nsList) const {
    XMLNodeList found;
    if (!is_element(node_) || (node_->doc == NULL)) return found;
    xmlXPathContextPtr ctx = xmlXPathNewContext(node_->doc);
    if (ctx == NULL) return found;
    for (NS::const_iterator n = nsList.begin(); n != nsList.end(); ++n) {
      if (n->first.empty()) continue; // XPath 1.0 has no default namespace
      xmlXPathRegisterNs(ctx, (const xmlChar*)n->first.c_str(), (const xmlChar*)n->second.c_str());
    }
    xmlXPathObjectPtr result = xmlXPathEvalExpression((const xmlChar*)xpathExpr.c_str(), ctx);
    xmlNodeSetPtr nodes = result ? result->nodesetval : NULL;
    for (int i = 0; nodes && (i < nodes->nodeNr); ++i) {
      xmlNodePtr cur = nodes->nodeTab[i];
      if (!is_element(cur)) continue;
      for (xmlNodePtr up = cur; up; up = up->parent) {
        if (up == node_) {
          found.push_back(XMLNode(cur));
          break;
        }
      }
    }
    if (result) xmlXPathFreeObject(result);
    xmlXPathFreeContext(ctx);
    return found;
  }

  XMLNode XMLNode::GetRoot(void) const {
    if (node_ == NULL) return XMLNode();
    return XMLNode(root_element(node_->doc));
  }

  XMLNode XMLNode::Parent(void) const {
    if (node_ == NULL) return XMLNode();
    xmlNodePtr p = node_->parent;
    return is_element(p) ? XMLNode(p) : XMLNode();
  }

  void XMLNode::GetDoc(std::string& out_xml_str) const {
    out_xml_str.clear();
    if ((node_ == NULL) || (node_->doc == NULL)) return;
    xmlChar *mem = NULL;
    int size = 0;
    xmlDocDumpMemory(node_->doc, &mem, &size);
    if (mem == NULL) return;
    out_xml_str.assign((const char*)mem, size);
    xmlFree(mem);
  }

  void XMLNode::GetXML(std::string& out_xml_str) const {
    out_xml_str.clear();
    if (!is_element(node_)) return;
    // Copying into standalone document makes libxml2 declare on the copy
    // every namespace which was inherited from ancestors.
    XMLNode standalone;
    New(standalone);
    if (!standalone) return;
    xmlBufferPtr buf = xmlBufferCreate();
    if (buf == NULL) return;
    if (xmlNodeDump(buf, standalone.node_->doc, standalone.node_, 0, 0) >= 0)
      out_xml_str.assign((const char*)xmlBufferContent(buf), xmlBufferLength(buf));
    xmlBufferFree(buf);
  }

  bool MatchXMLName(const XMLNode& node, const char *name) {
    return name_matches(node.node_, name);
  }

  bool MatchXMLName(const XMLNode& node, const std::string& name) {
    return MatchXMLName(node, name.c_str());
  }

  bool MatchXMLNamespace(const XMLNode& node, const char *uri) {
    if ((node.node_ == NULL) || (uri == NULL)) return false;
    return ns_href(node.node_) == uri;
  }

  bool MatchXMLNamespace(const XMLNode& node, const std::string& uri) {
    return MatchXMLNamespace(node, uri.c_str());
  }

} // namespace FakeIdP
