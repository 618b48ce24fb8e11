// file      : affected/help.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/help.hxx>

#include <libbutl/pager.hxx>

#include <affected/diagnostics.hxx>
#include <affected/affected-options.hxx>
#include <affected/workspace-options.hxx>

// Help topics.
//
#include <affected/command-templates.hxx>
#include <affected/default-options-files.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  int
  help (const help_options& o, const string& t, usage_function* usage)
  {
    if (usage == nullptr) // Not a command.
    {
      if (t.empty ())             // General help.
        usage = &print_affected_usage;
      //
      // Help topics.
      //
      else if (t == "common-options")
        usage = &print_affected_common_options_usage;
      else if (t == "workspace-options")
        usage = &print_affected_workspace_options_usage;
      else if (t == "command-templates")
        usage = &print_affected_command_templates_usage;
      else if (t == "default-options-files")
        usage = &print_affected_default_options_files_usage;
      else
        fail << "unknown affected command/help topic '" << t << "'" <<
          info << "run 'affected help' for more information";
    }

    try
    {
      pager p ("affected " + (t.empty () ? "help" : t),
               verb >= 2,
               o.pager_specified () ? &o.pager () : nullptr,
               &o.pager_option ());

      usage (p.stream (), cli::usage_para::none);

      // If the pager failed, assume it has issued some diagnostics.
      //
      return p.wait () ? 0 : 1;
    }
    // Catch io_error as std::system_error together with the pager-specific
    // exceptions.
    //
    catch (const system_error& e)
    {
      error << "pager failed: " << e;

      // Fall through.
    }

    throw failed ();
  }
}
