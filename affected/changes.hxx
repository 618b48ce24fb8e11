// file      : affected/changes.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_CHANGES_HXX
#define AFFECTED_CHANGES_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/workspace-options.hxx>

namespace affected
{
  // Extensions (without the leading dot) of the files considered by
  // default.
  //
  extern const strings default_extensions;

  // Return true if the file extension matches one of the specified
  // extensions, case-insensitively. Files without extension never match.
  //
  bool
  considered_file (const path&, const strings& extensions);

  // Parse the NUL-separated list of paths, relative to the repository top
  // directory, as printed by `git diff --name-only -z`. Return the
  // considered files completed against the top directory.
  //
  // Throw invalid_path if a path is invalid.
  //
  paths
  parse_changed_files (istream&,
                       const dir_path& top,
                       const strings& extensions);

  // Return the changed files, either as specified with --changed-file or as
  // reported by git for the repository containing the workspace root. In the
  // former case the paths are returned as is, with the relative ones being
  // relative to the workspace root. In the latter case the files are
  // absolute and filtered by extension (see --extension).
  //
  // Issue diagnostics and throw failed on errors.
  //
  paths
  changed_files (const workspace_options&, const dir_path& root);
}

#endif // AFFECTED_CHANGES_HXX
