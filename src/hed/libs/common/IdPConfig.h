// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_IDPCONFIG_H__
#define __FAKEIDP_IDPCONFIG_H__

#include <string>

#include <fakeidp/XMLNode.h>

namespace FakeIdP {

  /// Response configuration document.
  /** XML tree loaded from a file which remembers the file name, so that
      credential paths found inside may be given relative to it.
      \ingroup common
      \headerfile IdPConfig.h fakeidp/IdPConfig.h
   */
  class Config
    : public XMLNode {
  private:
    std::string file_name_;
  public:
    /// Empty configuration with IdPResponse root element
    Config() : XMLNode(NS(), "IdPResponse") {}
    /// Loads configuration document from file
    Config(const char *filename);
    /// Parses configuration document from string
    Config(const std::string& xml_str)
      : XMLNode(xml_str) {}
    /// Independent copy of the document
    Config(const Config& cfg);
    ~Config(void);
    /// Replaces content with document loaded from file
    bool parse(const char *filename);
    const std::string& getFileName(void) const {
      return file_name_;
    }
    void setFileName(const std::string& filename) {
      file_name_ = filename;
    }
    /// Makes path relative to directory of configuration file.
    /** Absolute paths and paths of configuration without file name are
        returned unchanged. */
    std::string resolvePath(const std::string& path) const;
    /// Converts content of element ename (or pnode if ename is NULL) to boolean.
    /** Missing or empty element leaves val unchanged and is not an error. */
    static bool elementtobool(XMLNode pnode, const char *ename, bool& val);
    /// Converts content of element to index in NULL terminated opts.
    static bool elementtoenum(XMLNode pnode, const char *ename, int& val, const char* const opts[]);
  };

} // namespace FakeIdP

#endif // __FAKEIDP_IDPCONFIG_H__
