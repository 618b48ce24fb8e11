// file      : affected/command.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_COMMAND_HXX
#define AFFECTED_COMMAND_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/package.hxx>

namespace affected
{
  // Template references a variable other than packages, excludes, or args.
  //
  class unsupported_variable: public invalid_argument
  {
  public:
    explicit
    unsupported_variable (const string& n)
        : invalid_argument ("unsupported variable '" + n + "'"), name (n) {}

    string name;
  };

  // Names of the workspace packages that are not in the included set.
  //
  string_set
  exclude_list (const package_map&, const string_set& included);

  // Throw invalid_template if the template cannot be parsed and
  // unsupported_variable if it references a variable other than packages,
  // excludes, or args.
  //
  void
  verify_template (const string& tmpl);

  // Split the command line into words the way a POSIX shell does. Outside
  // quotes a backslash escapes the next character and a backslash-newline
  // pair is removed. Inside single quotes every character is literal.
  // Inside double quotes a backslash only escapes `"`, `\`, `$`, `` ` ``,
  // and newline. Quotes are removed and adjacent quoted and unquoted parts
  // form a single word, so '' produces an empty word.
  //
  // Throw invalid_argument on an unterminated quote or a trailing
  // backslash.
  //
  strings
  split_command (const string&);

  // Render the command template binding packages to the included package
  // names, excludes to the rest of the workspace packages, and args to the
  // extra arguments. Then split the result into words with split_command().
  //
  // Throw invalid_template and unsupported_variable as verify_template()
  // does and invalid_argument if the result contains no program name or
  // cannot be split.
  //
  strings
  generate_command (const string& tmpl,
                    const package_map&,
                    const string_set& included,
                    const strings& args);

  // Search for the program in PATH, run the command with the standard
  // streams inherited, and return its exit code. Fail if unable to execute
  // the program or if it terminates abnormally.
  //
  int
  run_command (const strings&);

  // Print the command line as it would be executed.
  //
  void
  print_command (ostream&, const strings&);
}

#endif // AFFECTED_COMMAND_HXX
