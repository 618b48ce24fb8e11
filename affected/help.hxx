// file      : affected/help.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_HELP_HXX
#define AFFECTED_HELP_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/help-options.hxx>

namespace affected
{
  using usage_function = cli::usage_para (ostream&, cli::usage_para);

  int
  help (const help_options&, const string& topic, usage_function* usage);
}

#endif // AFFECTED_HELP_HXX
