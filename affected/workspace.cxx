// file      : affected/workspace.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/workspace.hxx>

#include <map>

#include <libbutl/manifest-parser.hxx>
#include <libbutl/json/parser.hxx>

#include <libbpkg/manifest.hxx>
#include <libbpkg/package-name.hxx>

#include <affected/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  using bpkg::package_name;
  using bpkg::dependency;
  using bpkg::dependency_alternative;
  using bpkg::dependency_alternatives;

  string
  to_string (workspace_type t)
  {
    switch (t)
    {
    case workspace_type::cargo: return "cargo";
    case workspace_type::bdep:  return "bdep";
    }

    assert (false); // Can't be here.
    return string ();
  }

  workspace_type
  to_workspace_type (const string& t)
  {
         if (t == "cargo") return workspace_type::cargo;
    else if (t == "bdep")  return workspace_type::bdep;
    else throw invalid_argument ("invalid workspace type '" + t + "'");
  }

  workspace_type
  detect_workspace_type (const dir_path& root)
  {
    if (exists (root / cargo_manifest_file))
      return workspace_type::cargo;

    if (exists (root / packages_manifest_file) ||
        exists (root / package_manifest_file))
      return workspace_type::bdep;

    fail << "no workspace found in " << root <<
      info << "expected " << cargo_manifest_file << ", "
           << packages_manifest_file << ", or " << package_manifest_file <<
      info << "use --workspace-type to specify the workspace type explicitly"
         << endf;
  }

  // cargo
  //
  cargo_metadata
  parse_cargo_metadata (istream& is, const string& name)
  {
    json::parser p (is, name);

    using event = json::event;

    struct record
    {
      string           id;
      workspace_member member;
    };

    vector<record> rs;
    string_set ids;
    cargo_metadata r;

    // Parse the package object.
    //
    // enter: after begin_object
    // leave: after end_object
    //
    auto parse_package = [&p] ()
    {
      record pr;

      while (p.next_expect (event::name, event::end_object))
      {
        string n (p.name ());

        if (n == "name")
          pr.member.name = p.next_expect_string ();
        else if (n == "id")
          pr.id = p.next_expect_string ();
        else if (n == "manifest_path")
          pr.member.manifest = path (p.next_expect_string ());
        else if (n == "dependencies")
        {
          p.next_expect (event::begin_array);

          while (p.next_expect (event::begin_object, event::end_array))
          {
            while (p.next_expect (event::name, event::end_object))
            {
              if (p.name () == "path")
              {
                if (p.next_expect (event::string, event::null))
                  pr.member.dependencies.push_back (path (p.value ()));
              }
              else
                p.next_expect_value_skip ();
            }
          }
        }
        else
          p.next_expect_value_skip ();
      }

      if (pr.id.empty ())
        throw invalid_argument ("package without id");

      if (pr.member.name.empty ())
        throw invalid_argument ("package " + pr.id + " without name");

      if (pr.member.manifest.empty ())
        throw invalid_argument ("package " + pr.member.name +
                                " without manifest_path");

      return pr;
    };

    p.next_expect (event::begin_object);

    while (p.next_expect (event::name, event::end_object))
    {
      string n (p.name ());

      if (n == "packages")
      {
        p.next_expect (event::begin_array);

        while (p.next_expect (event::begin_object, event::end_array))
          rs.push_back (parse_package ());
      }
      else if (n == "workspace_members")
      {
        p.next_expect (event::begin_array);

        while (p.next_expect (event::string, event::end_array))
          ids.insert (p.value ());
      }
      else if (n == "workspace_root")
        r.workspace_root = dir_path (p.next_expect_string ());
      else
        p.next_expect_value_skip ();
    }

    for (record& pr: rs)
    {
      if (ids.find (pr.id) != ids.end ())
        r.members.push_back (move (pr.member));
    }

    return r;
  }

  // Start cargo process.
  //
  template <typename O, typename E, typename... A>
  static process
  start_cargo (const workspace_options& o, O&& out, E&& err, A&&... args)
  {
    process_path pp (search_program (o.cargo ().string ().c_str ()));

    try
    {
      return process_start_callback (
        [] (const char* const args[], size_t n)
        {
          if (verb >= 2)
            print_process (args, n);
        },
        0 /* stdin */,
        forward<O> (out),
        forward<E> (err),
        pp,
        forward<A> (args)...);
    }
    catch (const process_error& e)
    {
      fail << "unable to execute " << o.cargo () << ": " << e << endf;
    }
  }

  static workspace_members
  load_cargo (const workspace_options& o, dir_path& root)
  {
    tracer trace ("load_cargo");

    path mf (root / cargo_manifest_file);
    const char* what ("cargo metadata output");

    fdpipe pipe (open_pipe ());

    process pr (start_cargo (o,
                             pipe, 2 /* stderr */,
                             "metadata",
                             o.cargo_option (),
                             "--format-version", "1",
                             "--no-deps",
                             "--manifest-path", mf));

    // Shouldn't throw, unless something is severely damaged.
    //
    pipe.out.close ();

    try
    {
      ifdstream is (move (pipe.in), fdstream_mode::skip);

      cargo_metadata m (parse_cargo_metadata (is, what));

      is.close ();

      if (pr.wait ())
      {
        if (!m.workspace_root.empty () && m.workspace_root != root)
        {
          l4 ([&]{trace << "workspace root: " << m.workspace_root;});
          root = move (m.workspace_root);
        }

        return move (m.members);
      }

      // Fall through.
    }
    catch (const json::invalid_json_input& e)
    {
      if (pr.wait ())
        fail (location (what, e.line, e.column)) << "invalid json input: "
                                                  << e;

      // Fall through.
    }
    catch (const invalid_argument& e)
    {
      if (pr.wait ())
        fail << "invalid " << what << ": " << e;

      // Fall through.
    }
    catch (const io_error& e)
    {
      if (pr.wait ())
        fail << "unable to read " << what << ": " << e;

      // Fall through.
    }

    // We should only get here if the child exited with an error status.
    //
    assert (!pr.wait ());

    fail << "unable to obtain cargo workspace metadata for " << mf << endf;
  }

  // bdep
  //
  dir_paths
  parse_packages_manifest (istream& is, const string& name)
  {
    manifest_parser p (is, name);
    dir_paths r;

    // The packages manifest is a list of manifests, one per package.
    //
    for (manifest_name_value nv (p.next ()); !nv.empty (); nv = p.next ())
    {
      if (!nv.name.empty ())
        throw manifest_parsing (p.name (), nv.name_line, nv.name_column,
                                "start of package manifest expected");

      if (nv.value != "1")
        throw manifest_parsing (p.name (), nv.value_line, nv.value_column,
                                "unsupported format version");

      optional<dir_path> l;

      for (nv = p.next (); !nv.empty (); nv = p.next ())
      {
        if (nv.name != "location")
          continue;

        if (l)
          throw manifest_parsing (p.name (), nv.name_line, nv.name_column,
                                  "package location redefinition");

        try
        {
          l = dir_path (nv.value);
        }
        catch (const invalid_path&)
        {
          l = nullopt;
        }

        if (!l || l->empty () || l->absolute ())
          throw manifest_parsing (p.name (), nv.value_line, nv.value_column,
                                  "invalid package location");
      }

      if (!l)
        throw manifest_parsing (p.name (), nv.name_line, nv.name_column,
                                "no package location specified");

      r.push_back (move (*l));
    }

    return r;
  }

  package_manifest_info
  parse_package_manifest (istream& is, const string& name)
  {
    manifest_parser p (is, name);
    package_manifest_info r;

    manifest_name_value nv (p.next ());

    if (!nv.name.empty ())
      throw manifest_parsing (p.name (), nv.name_line, nv.name_column,
                              "start of package manifest expected");

    if (nv.value != "1")
      throw manifest_parsing (p.name (), nv.value_line, nv.value_column,
                              "unsupported format version");

    for (nv = p.next (); !nv.empty (); nv = p.next ())
    {
      if (nv.name == "name")
      {
        try
        {
          r.name = package_name (move (nv.value)).string ();
        }
        catch (const invalid_argument& e)
        {
          throw manifest_parsing (p.name (), nv.value_line, nv.value_column,
                                  string ("invalid package name: ") +
                                  e.what ());
        }
      }
      else if (nv.name == "depends")
      {
        try
        {
          dependency_alternatives das (nv.value, package_name ());

          for (dependency_alternative& da: das)
          {
            for (dependency& d: da)
              r.dependencies.push_back (d.name.string ());
          }
        }
        catch (const manifest_parsing& e)
        {
          throw manifest_parsing (p.name (), nv.value_line, nv.value_column,
                                  e.description);
        }
      }
    }

    if (r.name.empty ())
      throw manifest_parsing (p.name (), nv.name_line, nv.name_column,
                              "no package name specified");

    // Make sure this is the end.
    //
    nv = p.next ();
    if (!nv.empty ())
      throw manifest_parsing (p.name (), nv.name_line, nv.name_column,
                              "single package manifest expected");

    return r;
  }

  template <typename R, typename F>
  static R
  parse_manifest_file (const path& f, F&& parse)
  {
    try
    {
      ifdstream is (f);
      R r (parse (is, f.string ()));
      is.close ();
      return r;
    }
    catch (const manifest_parsing& e)
    {
      fail (e.name, e.line, e.column) << e.description << endf;
    }
    catch (const io_error& e)
    {
      fail << "unable to read from " << f << ": " << e << endf;
    }
  }

  static workspace_members
  load_bdep (const dir_path& root)
  {
    tracer trace ("load_bdep");

    // Package directories, relative to root.
    //
    dir_paths ds;
    {
      path f (root / packages_manifest_file);

      if (exists (f))
        ds = parse_manifest_file<dir_paths> (f, parse_packages_manifest);
      else
        ds.push_back (dir_path ()); // Single-package project.
    }

    struct entry
    {
      dir_path              directory;
      path                  manifest;
      package_manifest_info info;
    };
    vector<entry> es;

    std::map<string, dir_path> dirs; // Package name to directory.

    for (dir_path& d: ds)
    {
      dir_path pd (root / d);
      pd.normalize ();

      path mf (pd / package_manifest_file);

      if (!exists (mf))
        fail << "package manifest " << mf << " does not exist" <<
          info << "listed in " << root / packages_manifest_file;

      package_manifest_info pi (
        parse_manifest_file<package_manifest_info> (mf,
                                                    parse_package_manifest));

      l4 ([&]{trace << pi.name << " manifest: " << mf;});

      if (!dirs.emplace (pi.name, pd).second)
        fail << "multiple packages named " << pi.name << " in " << root;

      es.push_back (entry {move (pd), move (mf), move (pi)});
    }

    workspace_members r;

    for (entry& e: es)
    {
      workspace_member m {move (e.info.name), move (e.manifest), {}};

      for (const string& dn: e.info.dependencies)
      {
        auto i (dirs.find (dn));

        if (i != dirs.end ())
          m.dependencies.push_back (i->second);
        else
          l5 ([&]{trace << m.name << " external dependency: " << dn;});
      }

      r.push_back (move (m));
    }

    return r;
  }

  workspace_members
  load_workspace (const workspace_options& o,
                  dir_path& root,
                  workspace_type t)
  {
    tracer trace ("load_workspace");

    l4 ([&]{trace << to_string (t) << " workspace: " << root;});

    switch (t)
    {
    case workspace_type::cargo: return load_cargo (o, root);
    case workspace_type::bdep:  return load_bdep (root);
    }

    assert (false); // Can't be here.
    return workspace_members ();
  }
}
