#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <restep/adapter/source-adapter.hxx>
#include <restep/generation-error.hxx>
#include <restep/generator/generator.hxx>
#include <restep/restep-options.hxx>
#include <restep/schema/schema-resolver.hxx>
#include <restep/template/template-types.hxx>

#include <restep/version.hxx>

namespace restep
{
  namespace fs = std::filesystem;

  using namespace std;

  static string
  read_file (const string& f)
  {
    ifstream ifs (f, ios::binary);

    if (!ifs)
      throw runtime_error ("unable to open " + f);

    string r ((istreambuf_iterator<char> (ifs)), istreambuf_iterator<char> ());

    if (ifs.bad ())
      throw runtime_error ("unable to read " + f);

    return r;
  }

  // Write into a temporary next to the target and rename it over. A failed
  // write must not leave a truncated output that looks up to date.
  //
  static void
  write_file (const string& f, const string& s)
  {
    fs::path p (f);
    fs::path t (p);
    t += ".tmp";

    {
      ofstream ofs (t, ios::binary | ios::trunc);

      if (!ofs)
        throw runtime_error ("unable to open " + t.string ());

      ofs << s;
      ofs.close ();

      if (!ofs)
      {
        error_code ec;
        fs::remove (t, ec);
        throw runtime_error ("unable to write " + t.string ());
      }
    }

    error_code ec;
    fs::rename (t, p, ec);

    if (ec)
    {
      error_code rec;
      fs::remove (t, rec);
      throw runtime_error ("unable to rename " + t.string () + " to " + f +
                           ": " + ec.message ());
    }
  }

  static char
  delimiter (const string& v, const char* o)
  {
    if (v.size () != 1)
      throw invalid_argument (string ("invalid ") + o + " value '" + v +
                              "': single character expected");

    return v[0];
  }

  static ostream&
  operator<< (ostream& o, const source_location& l)
  {
    return o << l.line << ':' << l.column;
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace restep;

  try
  {
    int end (0);
    options opt (argc, argv, end);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "restep " << RESTEP_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: restep [options] <input>" << "\n"
        << "options:"                        << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (end == argc)
    {
      cerr << "error: input file expected" << "\n"
           << "  info: run 'restep --help' for more information" << endl;
      return 1;
    }

    if (argc - end != 1)
    {
      cerr << "error: unexpected argument '" << argv[end + 1] << "'" << endl;
      return 1;
    }

    const string in (argv[end]);

    // Map the command line options to the generation context.
    //
    generation_context ctx;

    ctx.delim = delimiters (delimiter (opt.open_delimiter (),
                                       "--open-delimiter"),
                            delimiter (opt.close_delimiter (),
                                       "--close-delimiter"));
    ctx.delim.validate ();

    ctx.unused = opt.allow_unused_schema ()
      ? unused_schema_policy::permissive
      : unused_schema_policy::strict;

    // Load the schemas.
    //
    schema_registry schemas;

    for (const string& f: opt.schema ())
    {
      size_t n (schemas.load_file (f));

      if (opt.verbose ())
        cerr << f << ": info: loaded " << n << " schema(s)" << endl;
    }

    ctx.schemas = &schemas;

    // Rewrite the input.
    //
    string src (read_file (in));

    source_adapter a (
      ctx,
      !opt.no_line (),
      [&in] (const source_location& l, const string& m)
      {
        cerr << in << ':' << l << ": warning: " << m << endl;
      });

    string r;
    try
    {
      r = a.adapt (src, in);
    }
    catch (const generation_error& e)
    {
      cerr << in;

      if (e.located ())
        cerr << ':' << e.line () << ':' << e.column ();

      cerr << ": error: " << e.what () << endl;
      return 1;
    }

    if (opt.verbose ())
    {
      for (const adapted_endpoint& ep: a.endpoints ())
        cerr << in << ':' << ep.location << ": info: generated "
             << ep.function.style << " helper "
             << ep.function.signature () << endl;
    }

    if (opt.output_specified ())
      write_file (opt.output (), r);
    else
    {
      cout << r;
      cout.flush ();

      if (!cout)
        throw runtime_error ("unable to write to stdout");
    }

    return 0;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
