// file      : affected/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <affected/diagnostics.hxx>

#include <libbutl/process.hxx>    // process_args
#include <libbutl/process-io.hxx> // operator<<(ostream, process_args)

using namespace std;
using namespace butl;

namespace affected
{
  // print_process
  //
  void
  print_process (const char* const args[], size_t n)
  {
    diag_record dr (text);
    print_process (dr, args, n);
  }

  void
  print_process (diag_record& dr, const char* const args[], size_t n)
  {
    dr << process_args {args, n};
  }

  // Diagnostics verbosity level.
  //
  uint16_t verb = 1;

  // Diagnostic facility, project specifics.
  //

  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  void location_prologue_base::
  operator() (const diag_record& r) const
  {
    if (!loc_.empty ())
    {
      r << loc_.file << ':';

      if (loc_.line != 0)
      {
        r << loc_.line << ':';

        if (loc_.column != 0)
          r << loc_.column << ':';
      }

      r << ' ';
    }

    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr);
  const fail_mark  fail  ("error");
  const fail_end   endf;
}
