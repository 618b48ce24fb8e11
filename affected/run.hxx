// file      : affected/run.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_RUN_HXX
#define AFFECTED_RUN_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/impact.hxx>
#include <affected/run-options.hxx>

namespace affected
{
  inline int
  run (const run_options& o, cli::scanner& args)
  {
    return impact_command ("run",
                           o,
                           o.command_specified ()
                           ? optional<string> (o.command ())
                           : nullopt,
                           args);
  }
}

#endif // AFFECTED_RUN_HXX
