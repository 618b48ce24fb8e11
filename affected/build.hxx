// file      : affected/build.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_BUILD_HXX
#define AFFECTED_BUILD_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/impact.hxx>
#include <affected/build-options.hxx>

namespace affected
{
  inline int
  build (const build_options& o, cli::scanner& args)
  {
    return impact_command ("build", o, nullopt /* template */, args);
  }
}

#endif // AFFECTED_BUILD_HXX
