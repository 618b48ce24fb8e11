// file      : affected/workspace.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/workspace.hxx>

#include <sstream>
#include <algorithm> // find()

#include <libbutl/manifest-parser.hxx> // manifest_parsing
#include <libbutl/json/parser.hxx>     // invalid_json_input

#include <affected/types.hxx>
#include <affected/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace affected
{
  static cargo_metadata
  cargo (const string& s)
  {
    istringstream is (s);
    return parse_cargo_metadata (is, "metadata");
  }

  static dir_paths
  packages (const string& s)
  {
    istringstream is (s);
    return parse_packages_manifest (is, "packages.manifest");
  }

  static package_manifest_info
  package_manifest (const string& s)
  {
    istringstream is (s);
    return parse_package_manifest (is, "manifest");
  }

  template <typename F>
  static bool
  manifest_fails (F&& f, const string& s)
  {
    try
    {
      f (s);
      return false;
    }
    catch (const butl::manifest_parsing&)
    {
      return true;
    }
  }

  static int
  main (int, char*[])
  {
    // Cargo metadata.
    //
    {
      cargo_metadata m (cargo (R"({
  "packages": [
    {
      "name": "core",
      "version": "0.1.0",
      "id": "path+file:///ws/core#0.1.0",
      "dependencies": [
        {"name": "serde", "req": "^1.0", "kind": null, "optional": false}
      ],
      "targets": [{"kind": ["lib"], "name": "core"}],
      "manifest_path": "/ws/core/Cargo.toml"
    },
    {
      "name": "app",
      "id": "path+file:///ws/app#0.1.0",
      "dependencies": [
        {"name": "core", "path": "/ws/core", "kind": null},
        {"name": "local", "path": null}
      ],
      "manifest_path": "/ws/app/Cargo.toml"
    },
    {
      "name": "example",
      "id": "path+file:///ws/example#0.1.0",
      "dependencies": [],
      "manifest_path": "/ws/example/Cargo.toml"
    }
  ],
  "workspace_members": [
    "path+file:///ws/core#0.1.0",
    "path+file:///ws/app#0.1.0"
  ],
  "resolve": null,
  "target_directory": "/ws/target",
  "version": 1,
  "workspace_root": "/ws"
})"));

      assert (m.workspace_root == dir_path ("/ws"));
      assert (m.members.size () == 2);

      const workspace_member& c (m.members[0]);
      assert (c.name == "core");
      assert (c.manifest == path ("/ws/core/Cargo.toml"));
      assert (c.dependencies.empty ());

      const workspace_member& a (m.members[1]);
      assert (a.name == "app");
      assert (a.dependencies.size () == 1);
      assert (a.dependencies[0] == path ("/ws/core"));
    }

    {
      cargo_metadata m (cargo ("{\"packages\": [], \"version\": 1}"));
      assert (m.workspace_root.empty () && m.members.empty ());
    }

    try
    {
      cargo ("{\"packages\": [");
      assert (false);
    }
    catch (const butl::json::invalid_json_input&) {}

    try
    {
      cargo ("{\"packages\": [{\"name\": \"core\"}]}");
      assert (false);
    }
    catch (const invalid_argument&) {}

    // Packages manifest.
    //
    {
      dir_paths ds (packages (": 1\n"
                              "location: libhello/\n"
                              ":\n"
                              "location: hello/\n"));

      assert (ds.size () == 2);
      assert (ds[0] == dir_path ("libhello"));
      assert (ds[1] == dir_path ("hello"));
    }

    assert (manifest_fails (packages, ": 2\nlocation: libhello/\n"));
    assert (manifest_fails (packages, ": 1\nlocation: /libhello/\n"));
    assert (manifest_fails (packages, ": 1\nname: libhello\n"));
    assert (manifest_fails (packages,
                            ": 1\nlocation: a/\nlocation: b/\n"));

    // Package manifest.
    //
    {
      package_manifest_info pi (
        package_manifest (": 1\n"
                          "name: hello\n"
                          "version: 1.2.3\n"
                          "summary: hello executable\n"
                          "depends: * build2 >= 0.16.0\n"
                          "depends: libhello ^1.0.0\n"
                          "depends: libfoo | libbar\n"));

      assert (pi.name == "hello");

      const strings& ds (pi.dependencies);
      assert (ds.size () == 4);

      auto has = [&ds] (const char* n)
      {
        return find (ds.begin (), ds.end (), n) != ds.end ();
      };

      assert (has ("build2"));
      assert (has ("libhello"));
      assert (has ("libfoo"));
      assert (has ("libbar"));
    }

    assert (manifest_fails (package_manifest, ": 1\nversion: 1.0.0\n"));
    assert (manifest_fails (package_manifest, ": 1\nname: +hello\n"));
    assert (manifest_fails (package_manifest,
                            ": 1\nname: hello\ndepends: libfoo >=\n"));
    assert (manifest_fails (package_manifest, ": 1\nname: a\n: 1\nname: b\n"));

    // Workspace type names.
    //
    assert (to_workspace_type ("cargo") == workspace_type::cargo);
    assert (to_workspace_type ("bdep") == workspace_type::bdep);
    assert (to_string (workspace_type::bdep) == "bdep");

    try
    {
      to_workspace_type ("npm");
      assert (false);
    }
    catch (const invalid_argument&) {}

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return affected::main (argc, argv);
}
