// file      : affected/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/utility.hxx>

#include <affected/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  const path cargo_manifest_file    ("Cargo.toml");
  const path packages_manifest_file ("packages.manifest");
  const path package_manifest_file  ("manifest");

  const dir_path current_dir (".");

  dir_path&
  normalize (dir_path& d, const char* what)
  {
    try
    {
      if (!d.complete ().normalized ())
        d.normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid " << what << " directory " << e.path;
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e;
    }

    return d;
  }

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  fdpipe
  open_pipe ()
  {
    try
    {
      return fdopen_pipe ();
    }
    catch (const io_error& e)
    {
      fail << "unable to open pipe: " << e << endf;
    }
  }

  dir_path exec_dir;

  process_path
  search_program (const char* n)
  {
    try
    {
      // Use our executable directory as a fallback search.
      //
      return process::path_search (n, true /* init */, exec_dir);
    }
    catch (const process_error& e)
    {
      fail << "unable to execute " << n << ": " << e << endf;
    }
  }
}
