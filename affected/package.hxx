// file      : affected/package.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_PACKAGE_HXX
#define AFFECTED_PACKAGE_HXX

#include <libbutl/path-map.hxx>

#include <affected/types.hxx>
#include <affected/utility.hxx>

namespace affected
{
  // Workspace member as reported by the manifest provider (see
  // workspace.hxx). Dependency paths are the declared ones and may point
  // outside of the workspace.
  //
  struct workspace_member
  {
    string name;
    path   manifest;     // Absolute.
    paths  dependencies;
  };

  using workspace_members = vector<workspace_member>;

  // A package is identified by its directory. The dependencies are the
  // directories of other workspace packages (or their subdirectories) it
  // depends on.
  //
  struct package
  {
    string             name;
    dir_path           directory;
    path               manifest;
    std::set<dir_path> dependencies;
  };

  // Workspace packages indexed by directory. Any path inside the workspace
  // can be mapped to the package that owns it, that is, the package with the
  // longest directory that is a prefix of the path. The package directories
  // are not assumed to be non-nested.
  //
  // Note that the map is only modified while being built by
  // build_package_map() and is read-only afterwards.
  //
  class package_map
  {
  public:
    using map_type = butl::dir_path_map<package>;
    using const_iterator = map_type::const_iterator;

    // Throw invalid_argument if there is already a package with the same
    // directory.
    //
    void
    insert (package&&);

    // Return NULL if no package owns this path.
    //
    const package*
    find_owner (const dir_path&) const;

    const package*
    find_owner (const path& p) const
    {
      return find_owner (path_cast<dir_path> (p));
    }

    const_iterator begin () const {return map_.begin ();}
    const_iterator end ()   const {return map_.end ();}

    size_t size ()  const {return map_.size ();}
    bool   empty () const {return map_.empty ();}

  private:
    map_type map_;
  };

  // Build the package map from the workspace members. Only the dependencies
  // inside the workspace root are kept: the rest cannot change as part of
  // the workspace and are irrelevant for the impact analysis. Relative
  // dependency paths are completed against the package directory.
  //
  // Throw invalid_argument if the members are inconsistent (package outside
  // of the workspace root, multiple packages in the same directory, etc).
  //
  package_map
  build_package_map (const dir_path& root, workspace_members&&);
}

#endif // AFFECTED_PACKAGE_HXX
