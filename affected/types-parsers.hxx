// file      : affected/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef AFFECTED_TYPES_PARSERS_HXX
#define AFFECTED_TYPES_PARSERS_HXX

#include <affected/types.hxx>

#include <affected/common-options.hxx> // affected::cli namespace
#include <affected/options-types.hxx>

namespace affected
{
  namespace cli
  {
    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };

    template <>
    struct parser<stdout_format>
    {
      static void
      parse (stdout_format&, bool&, scanner&);

      static void
      merge (stdout_format& b, const stdout_format& a) {b = a;}
    };

    template <>
    struct parser<workspace_type>
    {
      static void
      parse (workspace_type&, bool&, scanner&);

      static void
      merge (workspace_type& b, const workspace_type& a) {b = a;}
    };
  }
}

#endif // AFFECTED_TYPES_PARSERS_HXX
