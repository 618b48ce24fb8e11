// file      : affected/command-template.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef AFFECTED_COMMAND_TEMPLATE_HXX
#define AFFECTED_COMMAND_TEMPLATE_HXX

#include <map>

#include <affected/types.hxx>
#include <affected/utility.hxx>

namespace affected
{
  // Template parsing error. The line and column are 1-based positions in
  // the template text.
  //
  class invalid_template: public invalid_argument
  {
  public:
    invalid_template (uint64_t l, uint64_t c, const string& d)
        : invalid_argument (d), line (l), column (c), description (d) {}

    uint64_t line;
    uint64_t column;
    string   description;
  };

  // Command line template.
  //
  // The syntax is a small subset of Jinja:
  //
  // {{ <name> }}                       variable substitution
  // {{ '<text>' }}                     literal (single or double quoted)
  // {% for <var> in <name> %} {% endfor %}
  // {# <text> #}                       comment
  //
  // All the variables are lists of strings. Substituting a list produces its
  // elements separated with spaces. The loop variable is bound to the
  // elements in turn and hides a variable of the same name in the loop body.
  // Specifying '-' next to the tag delimiter (for example, {{- or -%})
  // strips the whitespaces on that side of the tag.
  //
  class command_template
  {
  public:
    using variable_map = std::map<string, strings>;

    // Throw invalid_template if the text is not a valid template.
    //
    explicit
    command_template (const string&);

    // Names of variables referenced in the template and not bound by an
    // enclosing for-loop.
    //
    const string_set&
    variables () const {return variables_;}

    // Throw invalid_argument if there is no value for a referenced variable.
    //
    string
    render (const variable_map&) const;

  private:
    struct node
    {
      enum kind_type {text, substitution, loop};

      kind_type    kind;
      string       value;    // Text, variable name, or loop list name.
      string       var;      // Loop variable name.
      vector<node> body;     // Loop body.
    };

    using scalar_map = std::map<string, const string*>;

    void
    render (const vector<node>&,
            const variable_map&,
            scalar_map&,
            string&) const;

    vector<node> nodes_;
    string_set   variables_;
  };
}

#endif // AFFECTED_COMMAND_TEMPLATE_HXX
