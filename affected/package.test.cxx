// file      : affected/package.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/package.hxx>

#include <affected/types.hxx>
#include <affected/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace affected
{
  static bool
  fails (const dir_path& root, workspace_members&& ms)
  {
    try
    {
      build_package_map (root, move (ms));
      return false;
    }
    catch (const invalid_argument&)
    {
      return true;
    }
  }

  static int
  main (int, char*[])
  {
    dir_path root ("/ws");

    // Longest prefix ownership.
    //
    {
      workspace_members ms {
        {"core", path ("/ws/core/Cargo.toml"),     {}},
        {"sub",  path ("/ws/core/sub/Cargo.toml"), {}},
        {"util", path ("/ws/util/Cargo.toml"),     {path ("/ws/core")}},
        {"app",  path ("/ws/app/Cargo.toml"),
         {path ("../util"), path ("/registry/serde-1.0.0")}}};

      package_map pm (build_package_map (root, move (ms)));
      assert (pm.size () == 4);

      const package* p (pm.find_owner (path ("/ws/core/src/lib.rs")));
      assert (p != nullptr && p->name == "core");

      p = pm.find_owner (path ("/ws/core/sub/src/lib.rs"));
      assert (p != nullptr && p->name == "sub");

      p = pm.find_owner (path ("/ws/core/subdir/lib.rs"));
      assert (p != nullptr && p->name == "core");

      p = pm.find_owner (path ("/ws/core/Cargo.toml"));
      assert (p != nullptr && p->name == "core");

      p = pm.find_owner (dir_path ("/ws/util"));
      assert (p != nullptr && p->name == "util");

      assert (pm.find_owner (path ("/ws/README.md")) == nullptr);
      assert (pm.find_owner (path ("/ws/utility/lib.rs")) == nullptr);
      assert (pm.find_owner (path ("/elsewhere/core/lib.rs")) == nullptr);

      // Relative dependencies are completed against the package directory
      // and the dependencies outside of the workspace are dropped.
      //
      p = pm.find_owner (dir_path ("/ws/app"));
      assert (p != nullptr);
      assert (p->manifest == path ("/ws/app/Cargo.toml"));
      assert (p->dependencies.size () == 1);
      assert (*p->dependencies.begin () == dir_path ("/ws/util"));
    }

    // Empty workspace.
    //
    {
      package_map pm (build_package_map (root, workspace_members ()));
      assert (pm.empty ());
      assert (pm.find_owner (path ("/ws/core/src/lib.rs")) == nullptr);
    }

    // Inconsistent members.
    //
    assert (fails (root, {{"a", path ("a/Cargo.toml"), {}}}));

    assert (fails (root, {{"a", path ("/ws/a/Cargo.toml"), {}},
                          {"a", path ("/ws/b/Cargo.toml"), {}}}));

    assert (fails (root, {{"a", path ("/ws/a/Cargo.toml"), {}},
                          {"b", path ("/ws/a/manifest"),   {}}}));

    assert (fails (root, {{"a", path ("/other/a/Cargo.toml"), {}}}));

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return affected::main (argc, argv);
}
