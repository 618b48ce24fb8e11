// file      : affected/command.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/command.hxx>

#include <cstdlib> // exit()

#include <libbutl/process-io.hxx> // operator<<(ostream, process_args)

#include <affected/diagnostics.hxx>
#include <affected/command-template.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  string_set
  exclude_list (const package_map& pm, const string_set& included)
  {
    string_set r;

    for (const auto& e: pm)
    {
      const string& n (e.second.name);

      if (included.find (n) == included.end ())
        r.insert (n);
    }

    return r;
  }

  static void
  verify_variables (const command_template& t)
  {
    for (const string& v: t.variables ())
    {
      if (v != "packages" && v != "excludes" && v != "args")
        throw unsupported_variable (v);
    }
  }

  void
  verify_template (const string& tmpl)
  {
    verify_variables (command_template (tmpl));
  }

  strings
  split_command (const string& s)
  {
    strings r;

    string w;
    bool word (false); // Word is started, possibly empty (for example, '').

    for (size_t i (0), n (s.size ()); i != n; ++i)
    {
      char c (s[i]);

      switch (c)
      {
      case ' ':
      case '\t':
      case '\n':
        {
          if (word)
          {
            r.push_back (move (w));
            w.clear ();
            word = false;
          }

          break;
        }
      case '\\':
        {
          if (++i == n)
            throw invalid_argument ("trailing backslash in '" + s + "'");

          if (s[i] != '\n') // Line continuation.
          {
            w += s[i];
            word = true;
          }

          break;
        }
      case '\'':
        {
          size_t e (s.find ('\'', i + 1));

          if (e == string::npos)
            throw invalid_argument ("unterminated single quote in '" + s +
                                    "'");

          w.append (s, i + 1, e - i - 1);
          word = true;
          i = e;
          break;
        }
      case '"':
        {
          for (++i;; ++i)
          {
            if (i == n)
              throw invalid_argument ("unterminated double quote in '" + s +
                                      "'");

            c = s[i];

            if (c == '"')
              break;

            if (c == '\\' && i + 1 != n)
            {
              char e (s[i + 1]);

              if (e == '"' || e == '\\' || e == '$' || e == '`' || e == '\n')
              {
                if (e != '\n')
                  w += e;

                ++i;
                continue;
              }
            }

            w += c;
          }

          word = true;
          break;
        }
      default:
        {
          w += c;
          word = true;
          break;
        }
      }
    }

    if (word)
      r.push_back (move (w));

    return r;
  }

  strings
  generate_command (const string& tmpl,
                    const package_map& pm,
                    const string_set& included,
                    const strings& args)
  {
    tracer trace ("generate_command");

    command_template t (tmpl);
    verify_variables (t);

    string_set excluded (exclude_list (pm, included));

    command_template::variable_map vm {
      {"packages", strings (included.begin (), included.end ())},
      {"excludes", strings (excluded.begin (), excluded.end ())},
      {"args",     args}};

    string s (t.render (vm));
    l4 ([&]{trace << "rendered command: " << s;});

    strings r (split_command (s));

    if (r.empty ())
      throw invalid_argument ("no program name in command '" + s + "'");

    return r;
  }

  int
  run_command (const strings& cmd)
  {
    assert (!cmd.empty ());

    process_path pp (search_program (cmd[0].c_str ()));

    try
    {
      process pr (
        process_start_callback (
          [] (const char* const args[], size_t n)
          {
            if (verb >= 2)
              print_process (args, n);
          },
          0 /* stdin */,
          1 /* stdout */,
          2 /* stderr */,
          pp,
          strings (cmd.begin () + 1, cmd.end ())));

      pr.wait ();

      const process_exit& e (*pr.exit);

      if (!e.normal ())
        fail << "process " << cmd[0] << " " << e;

      return e.code ();
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << cmd[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  void
  print_command (ostream& os, const strings& cmd)
  {
    cstrings args;
    for (const string& a: cmd)
      args.push_back (a.c_str ());

    os << process_args {args.data (), args.size ()};
  }
}
