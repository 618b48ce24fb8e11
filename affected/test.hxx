// file      : affected/test.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_TEST_HXX
#define AFFECTED_TEST_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/impact.hxx>
#include <affected/test-options.hxx>

namespace affected
{
  inline int
  test (const test_options& o, cli::scanner& args)
  {
    return impact_command ("test", o, nullopt /* template */, args);
  }
}

#endif // AFFECTED_TEST_HXX
