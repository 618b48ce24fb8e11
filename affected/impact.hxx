// file      : affected/impact.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_IMPACT_HXX
#define AFFECTED_IMPACT_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/package.hxx>
#include <affected/options-types.hxx>
#include <affected/workspace-options.hxx>

namespace affected
{
  // Common run/test/nextest/build/bench implementation.
  //
  // Determine the packages affected by the changed files and either print
  // them or, if the command template is specified, render it and run the
  // resulting command returning its exit code. If cmd is not run, then the
  // predefined template for this command and the workspace type is used.
  //
  // The arguments that follow the "--" separator are passed to the template
  // as the args variable. Any other argument is an error.
  //
  int
  impact_command (const string& cmd,
                  const workspace_options&,
                  const optional<string>& tmpl,
                  cli::scanner& args);

  // Render the command template for the included packages and either print
  // the resulting command (dry run) or run it returning its exit code. If
  // the template is predefined and there are no included packages, then
  // print `no packages affected` instead.
  //
  // Issue diagnostics and throw failed if the command is invalid.
  //
  int
  run_template (ostream&,
                const string& tmpl,
                bool predefined,
                const package_map&,
                const string_set& included,
                const strings& args,
                bool dry_run);

  // Return the predefined template for the command or nullopt if the
  // command is not supported for this workspace type.
  //
  optional<string>
  predefined_template (const string& cmd, workspace_type);

  // Print the affected packages in the specified format. For lines print
  // `no packages affected` if there are none.
  //
  void
  print_affected (ostream&,
                  stdout_format,
                  const package_map&,
                  const string_set& included);
}

#endif // AFFECTED_IMPACT_HXX
