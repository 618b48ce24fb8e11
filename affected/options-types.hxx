// file      : affected/options-types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_OPTIONS_TYPES_HXX
#define AFFECTED_OPTIONS_TYPES_HXX

#include <affected/types.hxx>

namespace affected
{
  enum class stdout_format
  {
    lines,
    json
  };

  enum class workspace_type
  {
    cargo, // Cargo.toml with the [workspace] section or a single package.
    bdep   // build2 project (packages.manifest or manifest).
  };

  string
  to_string (workspace_type);

  // Throw invalid_argument if the string is not a valid workspace type.
  //
  workspace_type
  to_workspace_type (const string&);
}

#endif // AFFECTED_OPTIONS_TYPES_HXX
