// file      : affected/closure.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_CLOSURE_HXX
#define AFFECTED_CLOSURE_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/package.hxx>

namespace affected
{
  struct affected_packages
  {
    std::set<dir_path> directories;
    string_set         names;

    bool
    empty () const {return names.empty ();}
  };

  // Return the packages that own the changed files plus, transitively, all
  // the packages that depend on them. Relative changed file paths are
  // completed against the workspace root and all of them are normalized.
  // Files that are not owned by any package are ignored, as are
  // dependencies that don't resolve to a package.
  //
  affected_packages
  resolve_affected (const package_map&,
                    const dir_path& root,
                    const paths& changed_files);

  // Same as above but start from the already affected packages (for
  // example, the result of a previous call).
  //
  affected_packages
  resolve_affected (const package_map&, const affected_packages&);
}

#endif // AFFECTED_CLOSURE_HXX
