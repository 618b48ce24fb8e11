// file      : affected/changes.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/changes.hxx>

#include <affected/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  const strings default_extensions {
    "rs", "c", "cpp", "h", "hpp", "cc", "cxx", "toml", "hxx", "ixx", "txx"};

  bool
  considered_file (const path& f, const strings& es)
  {
    string e (f.extension ());

    if (e.empty ())
      return false;

    for (const string& x: es)
    {
      if (icasecmp (e, x) == 0)
        return true;
    }

    return false;
  }

  paths
  parse_changed_files (istream& is, const dir_path& top, const strings& es)
  {
    paths r;

    for (string l; !eof (getline (is, l, '\0')); )
    {
      if (l.empty ())
        continue;

      path f (top / path (move (l)));

      if (considered_file (f, es))
        r.push_back (move (f));
    }

    return r;
  }

  // Start git process.
  //
  template <typename O, typename E, typename... A>
  static process
  start_git (const workspace_options& o, O&& out, E&& err, A&&... args)
  {
    process_path pp (search_program (o.git ().string ().c_str ()));

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
        o.git_option (),
        forward<A> (args)...);
    }
    catch (const process_error& e)
    {
      fail << "unable to execute " << o.git () << ": " << e << endf;
    }
  }

  // Run git process and return its output as a string. Fail if git exits
  // with non-zero code or the output doesn't contain a single line.
  //
  template <typename... A>
  static string
  git_line (const workspace_options& o, const char* what, A&&... args)
  {
    fdpipe pipe (open_pipe ());
    process pr (start_git (o, pipe, 2 /* stderr */, forward<A> (args)...));
    pipe.out.close (); // Shouldn't throw, unless something is severely damaged.

    try
    {
      ifdstream is (move (pipe.in), fdstream_mode::skip);

      optional<string> r;
      if (is.peek () != ifdstream::traits_type::eof ())
      {
        string s;
        getline (is, s);

        if (!is.eof () && is.peek () == ifdstream::traits_type::eof ())
          r = move (s);
      }

      is.close ();

      if (pr.wait ())
      {
        if (r)
          return move (*r);

        fail << "invalid " << what;
      }

      // Fall through.
    }
    catch (const io_error&)
    {
      if (pr.wait ())
        fail << "unable to read " << what;

      // Fall through.
    }

    // We should only get here if the child exited with an error status.
    //
    assert (!pr.wait ());

    fail << "unable to obtain " << what << endf;
  }

  paths
  changed_files (const workspace_options& o, const dir_path& root)
  {
    tracer trace ("changed_files");

    // Relative paths are completed against the workspace root by
    // resolve_affected().
    //
    if (o.changed_file_specified ())
    {
      l4 ([&]{
          for (const path& f: o.changed_file ())
            trace << "changed: " << f;
        });
      return o.changed_file ();
    }

    const strings& es (o.extension_specified ()
                       ? o.extension ()
                       : default_extensions);

    dir_path top;
    {
      string s (git_line (o,
                          "git repository top directory",
                          "-C", root,
                          "rev-parse",
                          "--show-toplevel"));
      try
      {
        top = dir_path (move (s));
        top.normalize ();
      }
      catch (const invalid_path& e)
      {
        fail << "invalid git repository top directory '" << e.path << "'";
      }
    }

    l4 ([&]{trace << "git repository: " << top;});

    fdpipe pipe (open_pipe ());

    process pr (start_git (o,
                           pipe, 2 /* stderr */,
                           "-C", root,
                           "diff",
                           "--name-only",
                           "--no-renames",
                           "-z",
                           o.base (),
                           o.head ()));

    // Shouldn't throw, unless something is severely damaged.
    //
    pipe.out.close ();

    try
    {
      ifdstream is (move (pipe.in), fdstream_mode::skip, ifdstream::badbit);

      paths r (parse_changed_files (is, top, es));

      is.close ();

      if (pr.wait ())
      {
        l4 ([&]{for (const path& f: r) trace << "changed: " << f;});
        return r;
      }

      // Fall through.
    }
    catch (const invalid_path& e)
    {
      if (pr.wait ())
        fail << "invalid path '" << e.path << "' in git diff output";

      // Fall through.
    }
    catch (const io_error& e)
    {
      if (pr.wait ())
        fail << "unable to read git diff output: " << e;

      // Fall through.
    }

    // We should only get here if the child exited with an error status.
    //
    assert (!pr.wait ());

    fail << "unable to obtain changes between " << o.base () << " and "
         << o.head () << endf;
  }
}
