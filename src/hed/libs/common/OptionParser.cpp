// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iostream>

#include <glibmm/optioncontext.h>

#include "OptionParser.h"

namespace FakeIdP {

  // Binds one Glib::OptionEntry to caller's variable. String values are
  // collected into ustring first and copied out only if option was given.
  struct OptionSlot {
    Glib::OptionEntry entry;
    bool *flag;
    std::string *text;
    Glib::ustring buffer;
    OptionSlot(char shortOpt, const std::string& longOpt, const std::string& optDesc)
      : flag(NULL), text(NULL) {
      entry.set_short_name(shortOpt);
      entry.set_long_name(longOpt);
      entry.set_description(optDesc);
    }
  };

  OptionParser::OptionParser(const std::string& arguments,
                             const std::string& summary,
                             const std::string& description)
    : arguments(arguments),
      summary(summary),
      description(description) {}

  OptionParser::~OptionParser() {
    for (std::list<OptionSlot*>::iterator o = options.begin(); o != options.end(); ++o)
      delete *o;
  }

  void OptionParser::AddOption(char shortOpt, const std::string& longOpt,
                               const std::string& optDesc, bool& val) {
    OptionSlot *slot = new OptionSlot(shortOpt, longOpt, optDesc);
    slot->flag = &val;
    options.push_back(slot);
  }

  void OptionParser::AddOption(char shortOpt, const std::string& longOpt,
                               const std::string& optDesc, const std::string& argDesc,
                               std::string& val) {
    OptionSlot *slot = new OptionSlot(shortOpt, longOpt, optDesc);
    slot->entry.set_arg_description(argDesc);
    slot->text = &val;
    options.push_back(slot);
  }

  bool OptionParser::Parse(int argc, char **argv, std::list<std::string>& params) {
    Glib::OptionContext ctx(arguments);
    if (!summary.empty()) ctx.set_summary(summary);
    if (!description.empty()) ctx.set_description(description);

    // Context takes over the group
    Glib::OptionGroup *group = new Glib::OptionGroup("main", "Main Group");
    for (std::list<OptionSlot*>::iterator o = options.begin(); o != options.end(); ++o) {
      OptionSlot& slot = **o;
      slot.buffer.clear();
      if (slot.flag) group->add_entry(slot.entry, *slot.flag);
      else group->add_entry(slot.entry, slot.buffer);
    }
    ctx.set_main_group(*group);

    try {
      ctx.parse(argc, argv);
    } catch (const Glib::Error& err) {
      std::cerr << err.what() << std::endl;
      return false;
    }

    for (std::list<OptionSlot*>::iterator o = options.begin(); o != options.end(); ++o) {
      if ((*o)->text && !(*o)->buffer.empty()) *((*o)->text) = (*o)->buffer;
    }
    params.clear();
    for (int n = 1; n < argc; ++n) params.push_back(argv[n]);
    return true;
  }

} // namespace FakeIdP
