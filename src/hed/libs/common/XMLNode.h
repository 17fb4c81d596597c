// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_XMLNODE_H__
#define __FAKEIDP_XMLNODE_H__

#include <string>
#include <list>
#include <map>

#include <libxml/tree.h>

namespace FakeIdP {

  /** \addtogroup common
   *  @{ */

  class XMLNode;

  /// Namespace map, prefix to URI.
  /** \headerfile XMLNode.h fakeidp/XMLNode.h */
  class NS
    : public std::map<std::string, std::string> {
  public:
    NS(void) {}
    NS(const char *prefix, const char *uri) {
      operator[](prefix) = uri;
    }
  };

  typedef std::list<XMLNode> XMLNodeList;

  /// Handle to an element or attribute of a libxml2 document.
  /** An instance which parsed or created a document owns it and frees it
     when destroyed. Copies of a handle refer to the same element and never
     own it, so they must not outlive the owner.
     Names passed to lookup methods may be "name", "prefix:name" or
     "uri:name". Plain names match any namespace.
     \headerfile XMLNode.h fakeidp/XMLNode.h */
  class XMLNode {
    friend class XMLSecNode;
    friend bool MatchXMLName(const XMLNode& node, const char *name);
    friend bool MatchXMLNamespace(const XMLNode& node, const char *uri);

  protected:
    xmlNodePtr node_;
    bool is_owner_;

    /// Refers to existing libxml2 node without owning it.
    XMLNode(xmlNodePtr node)
      : node_(node),
        is_owner_(false) {}

  public:
    /// Invalid handle. All methods are allowed and produce nothing.
    XMLNode(void)
      : node_(NULL),
        is_owner_(false) {}
    XMLNode(const XMLNode& node)
      : node_(node.node_),
        is_owner_(false) {}
    /// Parses document. Instance is invalid if xml is not well formed.
    XMLNode(const std::string& xml);
    /// Creates document with root element 'name' declaring namespaces ns.
    XMLNode(const NS& ns, const char *name);
    ~XMLNode(void);

    /// Makes new_node own a standalone copy of this subtree.
    void New(XMLNode& new_node) const;

    operator bool(void) const {
      return (node_ != NULL);
    }
    bool operator!(void) const {
      return (node_ == NULL);
    }
    /// True if both refer to the same libxml2 node.
    bool operator==(const XMLNode& node) const {
      return ((node_ == node.node_) && (node_ != NULL));
    }
    bool operator!=(const XMLNode& node) const {
      return !operator==(node);
    }

    /// n-th child element
    XMLNode Child(int n = 0) const;
    /// First child element matching name
    XMLNode operator[](const char *name) const;
    XMLNode operator[](const std::string& name) const {
      return operator[](name.c_str());
    }
    /// n-th element among this one and its following siblings of same name
    XMLNode operator[](int n) const;
    /// Moves to next sibling of same name or becomes invalid.
    void operator++(void);
    /// Number of child elements
    int Size(void) const;

    std::string Name(void) const;
    std::string Prefix(void) const;
    std::string FullName(void) const {
      return Prefix() + ":" + Name();
    }
    std::string Namespace(void) const;

    /// Serializes subtree, declaring every namespace it uses.
    void GetXML(std::string& out_xml_str) const;
    /// Serializes whole document including XML declaration.
    void GetDoc(std::string& out_xml_str) const;

    /// Text content, not including content of child elements.
    operator std::string(void) const;
    /// Replaces all content with text.
    XMLNode& operator=(const char *content);
    XMLNode& operator=(const std::string& content) {
      return operator=(content.c_str());
    }
    /// Refers to another node. Document owned so far is freed.
    XMLNode& operator=(const XMLNode& node);

    XMLNode Attribute(const char *name) const;
    XMLNode Attribute(const std::string& name) const {
      return Attribute(name.c_str());
    }
    /// Appends attribute. Unprefixed attributes have no namespace.
    XMLNode NewAttribute(const char *name);
    XMLNode NewAttribute(const std::string& name) {
      return NewAttribute(name.c_str());
    }
    int AttributesSize(void) const;

    /// Appends child element. Prefix must be visible at this node.
    XMLNode NewChild(const char *name);
    XMLNode NewChild(const std::string& name) {
      return NewChild(name.c_str());
    }
    /// Appends child element declaring namespaces not yet visible under the same prefix.
    XMLNode NewChild(const char *name, const NS& namespaces);
    XMLNode NewChild(const std::string& name, const NS& namespaces) {
      return NewChild(name.c_str(), namespaces);
    }
    /// Appends copy of node and returns handle to the copy.
    XMLNode NewChild(const XMLNode& node);
    /// Puts copy of node in place of this element and refers to the copy.
    /** Does nothing for the element owning document. */
    void Replace(const XMLNode& node);
    /// Removes element together with whitespace in front of it.
    void Destroy(void);

    /// Evaluates XPath over whole document, returns elements inside this subtree.
    XMLNodeList XPathLookup(const std::string& xpathExpr, const NS& nsList) const;
    XMLNode GetRoot(void) const;
    XMLNode Parent(void) const;

    /// Replaces referred document with one parsed from file.
    bool ReadFromFile(const std::string& file_name);
  };

  /// True if name matches node (see XMLNode for accepted forms).
  bool MatchXMLName(const XMLNode& node, const char *name);
  bool MatchXMLName(const XMLNode& node, const std::string& name);
  bool MatchXMLNamespace(const XMLNode& node, const char *uri);
  bool MatchXMLNamespace(const XMLNode& node, const std::string& uri);

  /** @} */

} // namespace FakeIdP

#endif // __FAKEIDP_XMLNODE_H__
