// file      : affected/command.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/command.hxx>

#include <sstream>

#include <affected/types.hxx>
#include <affected/utility.hxx>

#include <affected/impact.hxx>
#include <affected/package.hxx>
#include <affected/diagnostics.hxx>
#include <affected/command-template.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace affected
{
  static string_set
  set_of (std::initializer_list<const char*> ns)
  {
    string_set r;
    for (const char* n: ns)
      r.insert (n);
    return r;
  }

  static strings
  words (std::initializer_list<const char*> ws)
  {
    strings r;
    for (const char* w: ws)
      r.push_back (w);
    return r;
  }

  static bool
  split_fails (const string& s)
  {
    try
    {
      split_command (s);
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
    package_map pm (
      build_package_map (
        dir_path ("/ws"),
        workspace_members {
          {"core", path ("/ws/core/Cargo.toml"), {}},
          {"util", path ("/ws/util/Cargo.toml"), {path ("../core")}},
          {"app",  path ("/ws/app/Cargo.toml"),  {path ("../util")}},
          {"docs", path ("/ws/docs/Cargo.toml"), {}}}));

    string_set included (set_of ({"core", "util"}));

    // Excludes.
    //
    assert (exclude_list (pm, included) == set_of ({"app", "docs"}));
    assert (exclude_list (pm, string_set ()).size () == 4);
    assert (exclude_list (pm,
                          set_of ({"app", "core", "docs", "util"})).empty ());

    // Command generation.
    //
    {
      strings c (
        generate_command (
          "cargo build {% for pkg in packages %} -p {{ pkg }} {% endfor %}",
          pm,
          included,
          strings ()));

      assert (c == words ({"cargo", "build", "-p", "core", "-p", "util"}));
    }

    {
      strings c (
        generate_command (
          "cargo test --workspace"
          " {% for e in excludes %}--exclude {{ e }} {% endfor %}"
          "{% for a in args %}{{ a }} {% endfor %}",
          pm,
          included,
          words ({"--", "--nocapture"})));

      assert (c == words ({"cargo", "test", "--workspace",
                           "--exclude", "app",
                           "--exclude", "docs",
                           "--", "--nocapture"}));
    }

    // The list substitution inside quotes produces a single word.
    //
    {
      strings c (
        generate_command ("sh -c 'echo {{ packages }}'", pm, included, {}));

      assert (c == words ({"sh", "-c", "echo core util"}));
    }

    {
      strings c (
        generate_command ("echo \"{{ excludes }}\" {{ packages }}",
                          pm,
                          string_set (),
                          {}));

      assert (c.size () == 2 && c[1] == "app core docs util");
    }

    // Word splitting.
    //
    assert (split_command ("") == strings ());
    assert (split_command (" \t\n ") == strings ());
    assert (split_command ("  a  b\tc\nd ") == words ({"a", "b", "c", "d"}));

    assert (split_command ("echo foo\\ bar") == words ({"echo", "foo bar"}));
    assert (split_command ("a\\\\b \\'c\\\"") ==
            words ({"a\\b", "'c\""}));
    assert (split_command ("a\\\nb") == words ({"ab"}));

    assert (split_command ("echo 'a\\b \"c\"'") ==
            words ({"echo", "a\\b \"c\""}));

    assert (split_command ("echo \"a\\\"b\"") == words ({"echo", "a\"b"}));
    assert (split_command ("echo \"\\\\ \\$ \\` \\n 'x'\"") ==
            words ({"echo", "\\ $ ` \\n 'x'"}));

    assert (split_command ("a'b c'\"d e\"f") == words ({"ab cd ef"}));
    assert (split_command ("echo '' \"\" x") ==
            words ({"echo", "", "", "x"}));

    assert (split_fails ("echo 'x"));
    assert (split_fails ("echo \"x"));
    assert (split_fails ("echo \"x\\\""));
    assert (split_fails ("echo x\\"));

    // Escapes in the rendered command.
    //
    {
      strings c (
        generate_command ("echo {{ 'foo\\ bar' }} \"{{ packages }}\"",
                          pm,
                          included,
                          {}));

      assert (c == words ({"echo", "foo bar", "core util"}));
    }

    try
    {
      generate_command ("echo '{{ packages }}", pm, included, {});
      assert (false);
    }
    catch (const invalid_argument&) {}

    // Unsupported variable.
    //
    try
    {
      generate_command ("cargo test {{ unknown }}", pm, included, {});
      assert (false);
    }
    catch (const unsupported_variable& e)
    {
      assert (e.name == "unknown");
    }

    try
    {
      verify_template ("{% for x in pkgs %}{{ x }}{% endfor %}");
      assert (false);
    }
    catch (const unsupported_variable& e)
    {
      assert (e.name == "pkgs");
    }

    // Invalid template.
    //
    try
    {
      verify_template ("cargo test {% for p in packages %}");
      assert (false);
    }
    catch (const invalid_template& e)
    {
      assert (e.line == 1 && e.column == 12);
    }

    verify_template ("cargo test {{ packages }} {{ excludes }} {{ args }}");

    // No program name.
    //
    try
    {
      generate_command ("{{ args }}", pm, included, {});
      assert (false);
    }
    catch (const invalid_argument&) {}

    // Printing.
    //
    {
      ostringstream os;
      print_command (os, words ({"cargo", "build", "-p", "core"}));
      assert (os.str () == "cargo build -p core");
    }

    // Predefined templates.
    //
    {
      optional<string> t (predefined_template ("nextest",
                                               workspace_type::cargo));
      assert (t);

      strings c (
        generate_command (*t, pm, included, words ({"--no-fail-fast"})));
      assert (c == words ({"cargo", "nextest", "run",
                           "-p", "core", "-p", "util",
                           "--no-fail-fast"}));

      assert (predefined_template ("test",  workspace_type::cargo));
      assert (predefined_template ("build", workspace_type::cargo));
      assert (predefined_template ("bench", workspace_type::cargo));
      assert (!predefined_template ("run",  workspace_type::cargo));

      t = predefined_template ("build", workspace_type::bdep);
      assert (t);

      c = generate_command (*t, pm, included, {});
      assert (c == words ({"bpkg", "update", "core", "util"}));

      assert (predefined_template ("test", workspace_type::bdep));
      assert (!predefined_template ("nextest", workspace_type::bdep));
      assert (!predefined_template ("bench", workspace_type::bdep));
    }

    // Command templates with no affected packages. A custom template is
    // still rendered while a predefined one is not.
    //
    {
      ostringstream os;
      assert (run_template (os,
                            "cargo test --workspace"
                            " {% for e in excludes %}--exclude {{ e }} "
                            "{% endfor %}",
                            false /* predefined */,
                            pm,
                            string_set (),
                            {},
                            true /* dry_run */) == 0);

      assert (os.str () == "cargo test --workspace --exclude app "
                           "--exclude core --exclude docs --exclude util\n");
    }

    {
      ostringstream os;
      assert (run_template (os,
                            *predefined_template ("test",
                                                  workspace_type::cargo),
                            true /* predefined */,
                            pm,
                            string_set (),
                            {},
                            true /* dry_run */) == 0);

      assert (os.str () == "no packages affected\n");
    }

    {
      ostringstream os;
      assert (run_template (os,
                            *predefined_template ("test",
                                                  workspace_type::cargo),
                            true /* predefined */,
                            pm,
                            included,
                            words ({"--", "--nocapture"}),
                            true /* dry_run */) == 0);

      assert (os.str () == "cargo test -p core -p util -- --nocapture\n");
    }

    // Empty command.
    //
    try
    {
      ostringstream os;
      run_template (os,
                    "{{ packages }}",
                    false /* predefined */,
                    pm,
                    string_set (),
                    {},
                    true /* dry_run */);
      assert (false);
    }
    catch (const failed&) {}

    // Affected packages output.
    //
    {
      ostringstream os;
      print_affected (os, stdout_format::lines, pm, included);
      assert (os.str () == "-p core -p util\n");
    }

    {
      ostringstream os;
      print_affected (os, stdout_format::lines, pm, string_set ());
      assert (os.str () == "no packages affected\n");
    }

    {
      ostringstream os;
      print_affected (os, stdout_format::json, pm, included);

      const string& s (os.str ());
      assert (s.find ("\"packages\"") != string::npos);
      assert (s.find ("\"excludes\"") != string::npos);
      assert (s.find ("\"docs\"") != string::npos);
      assert (s.find ("\"core\"") < s.find ("\"excludes\""));
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return affected::main (argc, argv);
}
