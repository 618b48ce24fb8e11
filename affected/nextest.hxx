// file      : affected/nextest.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_NEXTEST_HXX
#define AFFECTED_NEXTEST_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/impact.hxx>
#include <affected/nextest-options.hxx>

namespace affected
{
  inline int
  nextest (const nextest_options& o, cli::scanner& args)
  {
    return impact_command ("nextest", o, nullopt /* template */, args);
  }
}

#endif // AFFECTED_NEXTEST_HXX
