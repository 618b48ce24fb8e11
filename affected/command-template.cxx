// file      : affected/command-template.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/command-template.hxx>

using namespace std;
using namespace butl;

namespace affected
{
  static inline bool
  identifier (const string& s)
  {
    if (s.empty () || !(alpha (s[0]) || s[0] == '_'))
      return false;

    for (char c: s)
    {
      if (!(alnum (c) || c == '_'))
        return false;
    }

    return true;
  }

  // Find the closing delimiter starting from the specified position. If
  // requested, skip the quoted literals. Return string::npos if not found.
  //
  static size_t
  find_close (const string& s, size_t p, const char* d, bool quotes)
  {
    for (char q ('\0'); p < s.size (); ++p)
    {
      char c (s[p]);

      if (q != '\0')
      {
        if (c == q)
          q = '\0';
      }
      else if (quotes && (c == '\'' || c == '"'))
        q = c;
      else if (c == d[0] && p + 1 != s.size () && s[p + 1] == d[1])
        return p;
    }

    return string::npos;
  }

  command_template::
  command_template (const string& s)
  {
    size_t n (s.size ());

    auto fail = [&s] (size_t p, const string& d)
    {
      uint64_t l (1);
      size_t b (0); // Beginning of the line.

      for (size_t i (0); i != p; ++i)
      {
        if (s[i] == '\n')
        {
          ++l;
          b = i + 1;
        }
      }

      return invalid_template (l, p - b + 1, d);
    };

    // The currently open blocks: the top-level one and the body of each
    // unclosed for-loop, together with the loop variable and the position of
    // the for tag.
    //
    struct block
    {
      vector<node>* nodes;
      string        var;
      size_t        pos;
    };
    vector<block> blocks {block {&nodes_, string (), 0}};

    auto bound = [&blocks] (const string& v)
    {
      for (const block& b: blocks)
      {
        if (b.var == v)
          return true;
      }
      return false;
    };

    bool strip (false); // Strip leading whitespaces of the next text.

    for (size_t p (0); p != n; )
    {
      // Find the beginning of the next tag.
      //
      size_t b (p);
      for (; (b = s.find ('{', b)) != string::npos; ++b)
      {
        if (b + 1 != n && (s[b + 1] == '{' || s[b + 1] == '%' ||
                           s[b + 1] == '#'))
          break;
      }

      bool ls (b != string::npos && b + 2 < n && s[b + 2] == '-');

      string t (s, p, b != string::npos ? b - p : string::npos);

      if (strip)
        trim_left (t);

      if (ls)
        trim_right (t);

      if (!t.empty ())
        blocks.back ().nodes->push_back (node {node::text, move (t), "", {}});

      if (b == string::npos)
        break;

      char k (s[b + 1]);

      size_t cb (b + 2);
      if (ls)
        ++cb;

      size_t e (find_close (s,
                            cb,
                            k == '{' ? "}}" : k == '%' ? "%}" : "#}",
                            k != '#'));

      if (e == string::npos)
        throw fail (b, k == '{' ? "unterminated expression" :
                       k == '%' ? "unterminated statement" :
                                  "unterminated comment");

      size_t ce (e);
      strip = ce != cb && s[ce - 1] == '-';

      if (strip && k != '#')
        --ce;

      string c (s, cb, ce - cb);
      trim (c);

      p = e + 2;

      if (k == '#')
        continue;

      if (k == '{')
      {
        if (c.empty ())
          throw fail (b, "expected expression");

        if (c[0] == '\'' || c[0] == '"')
        {
          if (c.size () < 2 || c.back () != c[0] ||
              c.find (c[0], 1) != c.size () - 1)
            throw fail (b, "invalid string literal " + c);

          string v (c, 1, c.size () - 2);

          if (!v.empty ())
            blocks.back ().nodes->push_back (
              node {node::text, move (v), "", {}});
        }
        else
        {
          if (!identifier (c))
            throw fail (b, "invalid expression '" + c + "'");

          if (!bound (c))
            variables_.insert (c);

          blocks.back ().nodes->push_back (
            node {node::substitution, move (c), "", {}});
        }

        continue;
      }

      // Statement.
      //
      strings ws;
      for (size_t wb (0), we (0); next_word (c, wb, we); )
        ws.push_back (string (c, wb, we - wb));

      if (ws.empty ())
        throw fail (b, "expected statement");

      if (ws[0] == "for")
      {
        if (ws.size () != 4 || ws[2] != "in")
          throw fail (b, "expected 'for <variable> in <name>'");

        const string& v (ws[1]);
        const string& l (ws[3]);

        if (!identifier (v))
          throw fail (b, "invalid loop variable name '" + v + "'");

        if (!identifier (l))
          throw fail (b, "invalid loop list name '" + l + "'");

        if (bound (l))
          throw fail (b, "cannot iterate over loop variable '" + l + "'");

        variables_.insert (l);

        vector<node>& ns (*blocks.back ().nodes);
        ns.push_back (node {node::loop, l, v, {}});

        blocks.push_back (block {&ns.back ().body, v, b});
      }
      else if (ws[0] == "endfor")
      {
        if (ws.size () != 1)
          throw fail (b, "unexpected '" + ws[1] + "' after endfor");

        if (blocks.size () == 1)
          throw fail (b, "endfor without matching for");

        blocks.pop_back ();
      }
      else
        throw fail (b, "unknown statement '" + ws[0] + "'");
    }

    if (blocks.size () != 1)
      throw fail (blocks.back ().pos, "for without matching endfor");
  }

  string command_template::
  render (const variable_map& vm) const
  {
    string r;
    scalar_map sm;
    render (nodes_, vm, sm, r);
    return r;
  }

  void command_template::
  render (const vector<node>& ns,
          const variable_map& vm,
          scalar_map& sm,
          string& r) const
  {
    auto lookup = [&vm] (const string& n) -> const strings&
    {
      auto i (vm.find (n));

      if (i == vm.end ())
        throw invalid_argument ("no value for variable '" + n + "'");

      return i->second;
    };

    for (const node& n: ns)
    {
      switch (n.kind)
      {
      case node::text:
        {
          r += n.value;
          break;
        }
      case node::substitution:
        {
          auto i (sm.find (n.value));

          if (i != sm.end ())
          {
            r += *i->second;
            break;
          }

          const strings& vs (lookup (n.value));

          for (auto b (vs.begin ()), i (b); i != vs.end (); ++i)
          {
            if (i != b)
              r += ' ';

            r += *i;
          }

          break;
        }
      case node::loop:
        {
          const strings& vs (lookup (n.value));

          // Restore the hidden loop variable, if any, on the way out.
          //
          auto i (sm.find (n.var));
          const string* h (i != sm.end () ? i->second : nullptr);

          for (const string& v: vs)
          {
            sm[n.var] = &v;
            render (n.body, vm, sm, r);
          }

          if (h != nullptr)
            sm[n.var] = h;
          else
            sm.erase (n.var);

          break;
        }
      }
    }
  }
}
