// file      : affected/closure.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/closure.hxx>

#include <map>

#include <affected/diagnostics.hxx>

using namespace std;

namespace affected
{
  // Propagate the affected status from the packages on the queue to their
  // dependents until no more packages are added.
  //
  // Note that the result doesn't depend on the order in which the queued
  // packages are processed.
  //
  static void
  propagate (const package_map& pm,
             affected_packages& r,
             vector<const package*>& queue)
  {
    tracer trace ("propagate");

    map<const package*, vector<const package*>> dependents;

    for (const auto& e: pm)
    {
      const package& p (e.second);

      for (const dir_path& d: p.dependencies)
      {
        if (const package* dp = pm.find_owner (d))
          dependents[dp].push_back (&p);
        else
          l5 ([&]{trace << p.name << " dependency " << d << " does not "
                        << "resolve to a package";});
      }
    }

    while (!queue.empty ())
    {
      const package* p (queue.back ());
      queue.pop_back ();

      auto i (dependents.find (p));
      if (i == dependents.end ())
        continue;

      for (const package* d: i->second)
      {
        if (r.directories.insert (d->directory).second)
        {
          l4 ([&]{trace << d->name << " depends on " << p->name;});

          r.names.insert (d->name);
          queue.push_back (d);
        }
      }
    }
  }

  affected_packages
  resolve_affected (const package_map& pm,
                    const dir_path& root,
                    const paths& fs)
  {
    tracer trace ("resolve_affected");

    affected_packages r;
    vector<const package*> queue;

    for (const path& f: fs)
    {
      // Ownership is decided by comparing path components, so resolve any
      // .. components first.
      //
      path c (f.relative () ? root / f : f);

      try
      {
        c.normalize ();
      }
      catch (const invalid_path&)
      {
        l5 ([&]{trace << f << " is not a valid path";});
        continue;
      }

      const package* p (pm.find_owner (c));

      if (p == nullptr)
      {
        l5 ([&]{trace << f << " is not owned by any package";});
        continue;
      }

      if (r.directories.insert (p->directory).second)
      {
        l4 ([&]{trace << p->name << " owns " << f;});

        r.names.insert (p->name);
        queue.push_back (p);
      }
    }

    propagate (pm, r, queue);
    return r;
  }

  affected_packages
  resolve_affected (const package_map& pm, const affected_packages& a)
  {
    affected_packages r;
    vector<const package*> queue;

    for (const dir_path& d: a.directories)
    {
      if (const package* p = pm.find_owner (d))
      {
        if (r.directories.insert (p->directory).second)
        {
          r.names.insert (p->name);
          queue.push_back (p);
        }
      }
    }

    propagate (pm, r, queue);
    return r;
  }
}
