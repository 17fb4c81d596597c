// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <glibmm/miscutils.h>

#include <fakeidp/StringConv.h>

#include "IdPConfig.h"

namespace FakeIdP {

  Config::Config(const char *filename)
    : file_name_(filename) {
    ReadFromFile(filename);
  }

  Config::Config(const Config& cfg)
    : XMLNode(),
      file_name_(cfg.file_name_) {
    cfg.New(*this);
  }

  Config::~Config(void) {}

  bool Config::parse(const char *filename) {
    file_name_ = filename;
    return ReadFromFile(filename);
  }

  std::string Config::resolvePath(const std::string& path) const {
    if (path.empty() || file_name_.empty() || Glib::path_is_absolute(path)) return path;
    return Glib::build_filename(Glib::path_get_dirname(file_name_), path);
  }

  static std::string element_text(XMLNode pnode, const char *ename) {
    return trim(ename ? (std::string)pnode[ename] : (std::string)pnode);
  }

  bool Config::elementtobool(XMLNode pnode, const char *ename, bool& val) {
    std::string v = element_text(pnode, ename);
    return v.empty() || strtobool(v, val);
  }

  bool Config::elementtoenum(XMLNode pnode, const char *ename, int& val, const char* const opts[]) {
    std::string v = element_text(pnode, ename);
    if (v.empty()) return true;
    for (int n = 0; opts[n]; ++n) {
      if (v != opts[n]) continue;
      val = n;
      return true;
    }
    return false;
  }

} // namespace FakeIdP
