// file      : affected/bench.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_BENCH_HXX
#define AFFECTED_BENCH_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/impact.hxx>
#include <affected/bench-options.hxx>

namespace affected
{
  inline int
  bench (const bench_options& o, cli::scanner& args)
  {
    return impact_command ("bench", o, nullopt /* template */, args);
  }
}

#endif // AFFECTED_BENCH_HXX
