// file      : affected/closure.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/closure.hxx>

#include <affected/types.hxx>
#include <affected/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace affected
{
  static string_set
  names (const affected_packages& a)
  {
    return a.names;
  }

  static string_set
  set_of (std::initializer_list<const char*> ns)
  {
    return string_set (ns.begin (), ns.end ());
  }

  static int
  main (int, char*[])
  {
    dir_path root ("/ws");

    // app -> util -> core, tool -> core, docs (standalone), nested core/sub.
    //
    package_map pm (
      build_package_map (
        root,
        workspace_members {
          {"core", path ("/ws/core/Cargo.toml"),     {}},
          {"sub",  path ("/ws/core/sub/Cargo.toml"), {}},
          {"util", path ("/ws/util/Cargo.toml"),     {path ("../core")}},
          {"app",  path ("/ws/app/Cargo.toml"),      {path ("/ws/util")}},
          {"tool", path ("/ws/tool/Cargo.toml"),
           {path ("/ws/core"), path ("/ws/missing")}},
          {"docs", path ("/ws/docs/Cargo.toml"),     {}}}));

    auto resolve = [&pm, &root] (const paths& fs)
    {
      return resolve_affected (pm, root, fs);
    };

    // No changes.
    //
    assert (resolve (paths ()).empty ());

    // Unowned files.
    //
    assert (resolve ({path ("/ws/README.md"), path ("/tmp/x.rs")}).empty ());

    // Leaf package.
    //
    {
      affected_packages a (resolve ({path ("/ws/app/src/main.rs")}));
      assert (names (a) == set_of ({"app"}));
      assert (a.directories.size () == 1);
      assert (*a.directories.begin () == dir_path ("/ws/app"));
    }

    // Transitive closure along the chain.
    //
    assert (names (resolve ({path ("/ws/util/src/lib.rs")})) ==
            set_of ({"util", "app"}));

    assert (names (resolve ({path ("/ws/core/src/lib.rs")})) ==
            set_of ({"core", "util", "app", "tool"}));

    // Nested package is not a dependency of its parent.
    //
    assert (names (resolve ({path ("/ws/core/sub/src/lib.rs")})) ==
            set_of ({"sub"}));

    // Relative paths are completed against the root.
    //
    assert (names (resolve ({path ("docs/src/lib.rs")})) ==
            set_of ({"docs"}));

    // Paths are normalized before the ownership lookup.
    //
    assert (names (resolve ({path ("core/../util/x.rs")})) ==
            set_of ({"util", "app"}));

    assert (names (resolve ({path ("/ws/core/../docs/a.rs")})) ==
            set_of ({"docs"}));

    assert (names (resolve ({path ("./docs/./src/lib.rs")})) ==
            set_of ({"docs"}));

    assert (resolve ({path ("docs/../../other/x.rs")}).empty ());

    // Multiple files in the same package.
    //
    assert (names (resolve ({path ("/ws/docs/a.rs"),
                             path ("/ws/docs/b.rs")})) ==
            set_of ({"docs"}));

    // Monotonicity.
    //
    {
      paths fs {path ("/ws/util/src/lib.rs")};
      string_set s1 (names (resolve (fs)));

      fs.push_back (path ("/ws/docs/src/lib.rs"));
      string_set s2 (names (resolve (fs)));

      assert (includes (s2.begin (), s2.end (), s1.begin (), s1.end ()));
      assert (s2 == set_of ({"util", "app", "docs"}));
    }

    // Idempotence.
    //
    {
      affected_packages a (resolve ({path ("/ws/core/src/lib.rs"),
                                     path ("/ws/core/sub/x.rs")}));

      affected_packages b (resolve_affected (pm, a));
      assert (b.names == a.names);
      assert (b.directories == a.directories);
    }

    // Dependency cycle: a <-> b, c -> a, d standalone.
    //
    {
      package_map cm (
        build_package_map (
          root,
          workspace_members {
            {"a", path ("/ws/a/Cargo.toml"), {path ("../b")}},
            {"b", path ("/ws/b/Cargo.toml"), {path ("../a")}},
            {"c", path ("/ws/c/Cargo.toml"), {path ("../a")}},
            {"d", path ("/ws/d/Cargo.toml"), {}}}));

      affected_packages a (
        resolve_affected (cm, root, {path ("/ws/a/src/lib.rs")}));

      assert (names (a) == set_of ({"a", "b", "c"}));

      assert (names (resolve_affected (cm, root, {path ("b/lib.rs")})) ==
              set_of ({"a", "b", "c"}));

      assert (names (resolve_affected (cm, root, {path ("c/lib.rs")})) ==
              set_of ({"c"}));

      assert (resolve_affected (cm, a).names == a.names);
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return affected::main (argc, argv);
}
