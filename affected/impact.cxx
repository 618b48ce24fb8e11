// file      : affected/impact.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/impact.hxx>

#include <iostream> // cout

#include <libbutl/json/serializer.hxx>

#include <affected/closure.hxx>
#include <affected/command.hxx>
#include <affected/changes.hxx>
#include <affected/workspace.hxx>
#include <affected/diagnostics.hxx>
#include <affected/command-template.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  // Note that the args loop is at the end so that the extra arguments can
  // be options of the program itself rather than of the subcommand.
  //
  static const char* const cargo_templates[][2] = {
    {"test",
     "cargo test"
     " {% for pkg in packages %} -p {{ pkg }} {% endfor %}"
     " {% for arg in args %} {{ arg }} {% endfor %}"},
    {"nextest",
     "cargo nextest run"
     " {% for pkg in packages %} -p {{ pkg }} {% endfor %}"
     " {% for arg in args %} {{ arg }} {% endfor %}"},
    {"build",
     "cargo build"
     " {% for pkg in packages %} -p {{ pkg }} {% endfor %}"
     " {% for arg in args %} {{ arg }} {% endfor %}"},
    {"bench",
     "cargo bench"
     " {% for pkg in packages %} -p {{ pkg }} {% endfor %}"
     " {% for arg in args %} {{ arg }} {% endfor %}"}};

  static const char* const bdep_templates[][2] = {
    {"test",
     "bpkg test"
     " {% for pkg in packages %} {{ pkg }} {% endfor %}"
     " {% for arg in args %} {{ arg }} {% endfor %}"},
    {"build",
     "bpkg update"
     " {% for pkg in packages %} {{ pkg }} {% endfor %}"
     " {% for arg in args %} {{ arg }} {% endfor %}"}};

  optional<string>
  predefined_template (const string& cmd, workspace_type t)
  {
    auto find = [&cmd] (const auto& ts) -> optional<string>
    {
      for (const auto& e: ts)
      {
        if (cmd == e[0])
          return string (e[1]);
      }

      return nullopt;
    };

    switch (t)
    {
    case workspace_type::cargo: return find (cargo_templates);
    case workspace_type::bdep:  return find (bdep_templates);
    }

    assert (false); // Can't be here.
    return nullopt;
  }

  void
  print_affected (ostream& os,
                  stdout_format f,
                  const package_map& pm,
                  const string_set& ps)
  {
    switch (f)
    {
    case stdout_format::lines:
      {
        if (ps.empty ())
        {
          os << "no packages affected" << endl;
          break;
        }

        for (auto b (ps.begin ()), i (b); i != ps.end (); ++i)
          os << (i != b ? " " : "") << "-p " << *i;

        os << endl;
        break;
      }
    case stdout_format::json:
      {
        json::stream_serializer s (os);

        s.begin_object ();

        s.member_begin_array ("packages");
        for (const string& n: ps)
          s.value (n);
        s.end_array ();

        s.member_begin_array ("excludes");
        for (const string& n: exclude_list (pm, ps))
          s.value (n);
        s.end_array ();

        s.end_object ();

        os << endl;
        break;
      }
    }
  }

  int
  run_template (ostream& os,
                const string& tmpl,
                bool predefined,
                const package_map& pm,
                const string_set& included,
                const strings& args,
                bool dry_run)
  {
    // Without any package a predefined command would act on the whole
    // workspace (for example, cargo test without -p).
    //
    if (predefined && included.empty ())
    {
      os << "no packages affected" << endl;
      return 0;
    }

    strings c;
    try
    {
      c = generate_command (tmpl, pm, included, args);
    }
    catch (const invalid_argument& e)
    {
      fail << "invalid command: " << e;
    }

    if (dry_run)
    {
      print_command (os, c);
      os << endl;
      return 0;
    }

    return run_command (c);
  }

  int
  impact_command (const string& cmd,
                  const workspace_options& o,
                  const optional<string>& ct,
                  cli::scanner& args)
  {
    tracer trace ("impact_command");

    // Sort the arguments into the command arguments, which follow "--", and
    // junk.
    //
    strings cmd_args;
    for (bool sep (false); args.more (); )
    {
      string a (args.next ());

      if (!sep && a == "--")
      {
        sep = true;
        continue;
      }

      if (!sep)
        fail << "unexpected argument '" << a << "'" <<
          info << "use '--' to pass arguments to the command" <<
          info << "run 'affected help " << cmd << "' for more information";

      cmd_args.push_back (move (a));
    }

    if (!cmd_args.empty () && !ct && cmd == "run")
      fail << "command arguments specified without --command|-c" <<
        info << "run 'affected help run' for more information";

    // Workspace root.
    //
    dir_path root (o.directory_specified () ? o.directory () : current_dir);
    normalize (root, "workspace");

    if (!exists (root))
      fail << "workspace directory " << root << " does not exist";

    try
    {
      root.realize ();
    }
    catch (const invalid_path& e)
    {
      fail << "unable to realize workspace directory " << e.path;
    }

    workspace_type wt (o.workspace_type_specified ()
                       ? o.workspace_type ()
                       : detect_workspace_type (root));

    l4 ([&]{trace << to_string (wt) << " workspace " << root;});

    // Verify the template before doing any real work.
    //
    optional<string> tmpl (ct);

    if (cmd != "run")
    {
      tmpl = predefined_template (cmd, wt);

      if (!tmpl)
        fail << cmd << " command is not supported for " << to_string (wt)
             << " workspaces";
    }

    if (tmpl)
    try
    {
      verify_template (*tmpl);
    }
    catch (const invalid_template& e)
    {
      fail (location ("<command template>", e.line, e.column))
        << e.description;
    }
    catch (const unsupported_variable& e)
    {
      fail << "unsupported variable '" << e.name << "' in command template" <<
        info << "available variables are packages, excludes, and args";
    }

    package_map pm;
    try
    {
      pm = build_package_map (root, load_workspace (o, root, wt));
    }
    catch (const invalid_argument& e)
    {
      fail << "invalid workspace " << root << ": " << e;
    }

    l4 ([&]{trace << pm.size () << " workspace packages";});

    paths fs (changed_files (o, root));
    affected_packages ap (resolve_affected (pm, root, fs));

    if (!tmpl)
    {
      print_affected (cout, o.stdout_format (), pm, ap.names);
      return 0;
    }

    return run_template (cout,
                         *tmpl,
                         cmd != "run" /* predefined */,
                         pm,
                         ap.names,
                         cmd_args,
                         o.no_run ());
  }
}
