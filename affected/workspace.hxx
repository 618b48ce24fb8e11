// file      : affected/workspace.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_WORKSPACE_HXX
#define AFFECTED_WORKSPACE_HXX

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/package.hxx>
#include <affected/options-types.hxx>
#include <affected/workspace-options.hxx>

namespace affected
{
  // Detect the workspace type from the files in the root directory. Fail if
  // there is no workspace in this directory.
  //
  workspace_type
  detect_workspace_type (const dir_path& root);

  // Parse the output of `cargo metadata --format-version 1`. Only the
  // workspace members are returned. Registry dependencies (those without a
  // path) are omitted.
  //
  // Throw json::invalid_json_input if the input is not valid JSON and
  // invalid_argument if it is not valid metadata.
  //
  struct cargo_metadata
  {
    dir_path          workspace_root; // Empty if not present.
    workspace_members members;
  };

  cargo_metadata
  parse_cargo_metadata (istream&, const string& name);

  // Parse the bdep packages.manifest file returning the package locations
  // as specified (relative to the project root).
  //
  // Throw manifest_parsing on errors.
  //
  dir_paths
  parse_packages_manifest (istream&, const string& name);

  // Parse the package manifest returning the package name and the names of
  // all the packages mentioned in its depends values (including
  // alternatives and build-time dependencies).
  //
  // Throw manifest_parsing on errors.
  //
  struct package_manifest_info
  {
    string  name;
    strings dependencies;
  };

  package_manifest_info
  parse_package_manifest (istream&, const string& name);

  // Load the workspace members for the specified root. For a cargo
  // workspace the root can be adjusted to the workspace root reported by
  // cargo (for example, if the specified directory is a member of the
  // workspace).
  //
  // Issue diagnostics and throw failed on errors.
  //
  workspace_members
  load_workspace (const workspace_options&, dir_path& root, workspace_type);
}

#endif // AFFECTED_WORKSPACE_HXX
