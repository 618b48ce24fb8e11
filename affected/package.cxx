// file      : affected/package.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/package.hxx>

#include <affected/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  // package_map
  //
  void package_map::
  insert (package&& p)
  {
    if (map_.find (p.directory) != map_.end ())
      throw invalid_argument ("multiple packages in directory " +
                              p.directory.representation ());

    dir_path d (p.directory);
    map_.emplace (move (d), move (p));
  }

  const package* package_map::
  find_owner (const dir_path& d) const
  {
    auto i (map_.find_sup (d));
    return i != map_.end () ? &i->second : nullptr;
  }

  package_map
  build_package_map (const dir_path& root, workspace_members&& ms)
  {
    tracer trace ("build_package_map");

    assert (root.absolute () && root.normalized ());

    package_map r;
    string_set names;

    for (workspace_member& m: ms)
    {
      if (m.manifest.relative ())
        throw invalid_argument ("relative manifest path '" +
                                m.manifest.string () + "' for package " +
                                m.name);

      if (!names.insert (m.name).second)
        throw invalid_argument ("multiple packages named " + m.name);

      dir_path d (m.manifest.directory ());
      d.normalize ();

      if (!d.sub (root))
        throw invalid_argument ("package " + m.name + " directory " +
                                d.representation () + " is outside " +
                                "workspace root " + root.representation ());

      l4 ([&]{trace << m.name << " directory: " << d;});

      package p {move (m.name), d, move (m.manifest), {}};

      for (const path& dp: m.dependencies)
      {
        dir_path dd (path_cast<dir_path> (dp));

        if (dd.relative ())
          dd = d / dd;

        dd.normalize ();

        // Note that a registry package may have the same name as a
        // workspace package, so we go by the path.
        //
        if (dd.sub (root))
          p.dependencies.insert (move (dd));
        else
          l5 ([&]{trace << p.name << " external dependency: " << dd;});
      }

      r.insert (move (p));
    }

    return r;
  }
}
