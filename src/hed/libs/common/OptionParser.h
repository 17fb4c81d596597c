// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_OPTIONPARSER_H__
#define __FAKEIDP_OPTIONPARSER_H__

#include <list>
#include <string>

namespace FakeIdP {

  struct OptionSlot;

  /// Command line parser on top of Glib::OptionContext.
  /** Options are registered with AddOption() and bound to caller's
     variables, which Parse() fills. Variables of options not given on the
     command line keep their values. -h and --help print generated help
     and terminate the process.
     \ingroup common
     \headerfile OptionParser.h fakeidp/OptionParser.h */
  class OptionParser {
  public:
    OptionParser(const std::string& arguments = "",
                 const std::string& summary = "",
                 const std::string& description = "");
    ~OptionParser();

    /// Flag without argument
    void AddOption(char shortOpt, const std::string& longOpt,
                   const std::string& optDesc, bool& val);

    /// Option with string argument
    void AddOption(char shortOpt, const std::string& longOpt,
                   const std::string& optDesc, const std::string& argDesc,
                   std::string& val);

    /// Parses argv and stores remaining arguments in params.
    /** On malformed command line the error is printed to stderr and
       false is returned. */
    bool Parse(int argc, char **argv, std::list<std::string>& params);

  private:
    std::string arguments;
    std::string summary;
    std::string description;
    std::list<OptionSlot*> options;

    OptionParser(const OptionParser&);
    OptionParser& operator=(const OptionParser&);
  };

} // namespace FakeIdP

#endif // __FAKEIDP_OPTIONPARSER_H__
