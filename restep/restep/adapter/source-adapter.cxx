#include <restep/adapter/source-adapter.hxx>

#include <restep/adapter/annotation-parser.hxx>
#include <restep/generation-error.hxx>
#include <restep/template/template-types.hxx>

#include <cstring>
#include <set>
#include <utility>

using namespace std;

namespace restep
{
  source_adapter::
  source_adapter (const generation_context& c, bool l, located_sink d)
    : ctx_ (c), line_directives_ (l), diag_ (move (d))
  {
  }

  static inline generation_error
  located (const generation_error& e, const source_location& l)
  {
    return generation_error (e, l.line, l.column);
  }

  static inline generation_error
  invalid (const string& d, const source_location& l)
  {
    return located (generation_error (error_kind::invalid_annotation, d), l);
  }

  static string
  line_directive (size_t line, const string& file)
  {
    return "#line " + to_string (line) + ' ' + cxx_string_literal (file) +
      '\n';
  }

  // Return the position of the opening brace of the definition body that
  // follows the declaration header starting at i, or npos if the
  // declaration ends without one.
  //
  // Parentheses and brackets are skipped as a whole since they may contain
  // braces (default arguments, lambdas in decltype, etc). So is a
  // constructor's member initializer list, whose initializers may be
  // braced.
  //
  static size_t
  find_body (const source_scanner& sc, size_t i, const source_location& al)
  {
    const string& s (sc.source ());
    size_t n (s.size ());

    auto skip_group = [&sc, &al] (size_t k)
    {
      size_t e (sc.match (k));
      if (e == source_scanner::npos)
        throw invalid ("unbalanced brackets in annotated declaration", al);

      return e + 1;
    };

    size_t angle (0);
    bool params (false); // Seen a function parameter list.
    string word;         // Last identifier.

    for (size_t k (i); k < n;)
    {
      size_t j (sc.skip_non_code (k));
      if (j != k)
      {
        k = j;
        continue;
      }

      char c (s[k]);

      if (c == '#' && sc.line_start (k))
      {
        k = sc.skip_directive (k);
        continue;
      }

      if (size_t w = sc.identifier (k))
      {
        word.assign (s, k, w);
        k += w;
        continue;
      }

      if (c == '(')
      {
        if (angle == 0 &&
            word != "decltype" && word != "noexcept" && word != "alignas" &&
            word != "__attribute__" && word != "__declspec")
          params = true;

        word.clear ();
        k = skip_group (k);
        continue;
      }

      word.clear ();

      if (c == '[')
      {
        k = skip_group (k);
        continue;
      }

      if (c == '<')
        ++angle;
      else if (c == '>' && angle != 0 && s[k - 1] != '-')
        --angle;
      else if (c == ':' && params && angle == 0 &&
               s.compare (k, 2, "::") != 0 && s[k - 1] != ':')
      {
        // Member initializer list: name (...) or name {...}, comma-separated.
        //
        for (k = sc.skip_space (k + 1);;)
        {
          while (k < n && s[k] != '(' && s[k] != '{')
          {
            if (s[k] == ';' || s[k] == '}')
              return source_scanner::npos;

            size_t j (sc.skip_non_code (k));
            k = j != k ? j : k + 1;
          }

          if (k == n)
            return source_scanner::npos;

          k = sc.skip_space (skip_group (k));

          if (s.compare (k, 3, "...") == 0)
            k = sc.skip_space (k + 3);

          if (k < n && s[k] == ',')
          {
            k = sc.skip_space (k + 1);
            continue;
          }

          break;
        }

        continue;
      }
      else if (c == '{')
        return k;
      else if (c == ';' || c == '}')
        return source_scanner::npos;

      ++k;
    }

    return source_scanner::npos;
  }

  string source_adapter::
  adapt (const string& s, const string& file)
  {
    endpoints_.clear ();

    source_scanner sc (s);
    size_t n (s.size ());
    size_t an (strlen (annotation_name));

    string body;     // Rewritten source (without the prologue).
    size_t last (0); // Copied up to here.

    set<string> headers;

    for (size_t i (0); i < n;)
    {
      size_t j (sc.skip_non_code (i));
      if (j != i)
      {
        i = j;
        continue;
      }

      // Preprocessor directives, including our own #define.
      //
      if (s[i] == '#' && sc.line_start (i))
      {
        i = sc.skip_directive (i);
        continue;
      }

      size_t w (sc.identifier (i));

      if (w == 0)
      {
        ++i;
        continue;
      }

      if (w != an || s.compare (i, an, annotation_name) != 0)
      {
        i += w;
        continue;
      }

      size_t a (i);
      source_location al (sc.location (a));

      // Annotation arguments.
      //
      size_t ao (sc.skip_space (a + w));
      if (ao == n || s[ao] != '(')
        throw invalid (string ("expected '(' after ") + annotation_name, al);

      size_t ac (sc.match (ao));
      if (ac == source_scanner::npos)
        throw invalid ("unbalanced parentheses in annotation", al);

      annotation an_args;
      try
      {
        an_args = annotation_parser::parse_arguments (
          s.substr (ao + 1, ac - ao - 1));
      }
      catch (const generation_error& e)
      {
        throw located (e,
                       sc.location (e.offset () != generation_error::npos
                                    ? ao + 1 + e.offset ()
                                    : a));
      }

      if (an_args.name &&
          (!valid_identifier (*an_args.name) || cxx_keyword (*an_args.name)))
        throw invalid ("helper name '" + *an_args.name +
                       "' is not a valid identifier",
                       al);

      size_t ob (find_body (sc, ac + 1, al));

      if (ob == source_scanner::npos)
        throw invalid ("annotated declaration has no definition body", al);

      declaration d;
      try
      {
        d = annotation_parser::parse_declaration (
          s.substr (ac + 1, ob - ac - 1));
      }
      catch (const generation_error& e)
      {
        throw located (e,
                       sc.location (e.offset () != generation_error::npos
                                    ? ac + 1 + e.offset ()
                                    : a));
      }

      // Generate.
      //
      generation_context c (ctx_);

      if (an_args.name)
        c.helper_name = *an_args.name;

      c.style = d.kind == declaration_kind::function
        ? emission_style::local
        : emission_style::member;

      if (diag_)
        c.diag = [this, &al] (const string& m) {diag_ (al, m);};
      else
        c.diag = diagnostic_sink ();

      adapted_endpoint ep;
      ep.location = al;

      try
      {
        ep.function = restep::generate (an_args.path,
                                        an_args.params,
                                        d.parameters,
                                        c);
      }
      catch (const generation_error& e)
      {
        throw located (e, al);
      }

      // Blank out the annotation, keeping the line breaks.
      //
      body.append (s, last, a - last);

      for (size_t k (a); k <= ac; ++k)
        body += (s[k] == '\n' ? '\n' : ' ');

      // Copy the declaration through the opening brace and insert the
      // helper after it.
      //
      body.append (s, ac + 1, ob - ac);
      body += '\n';
      body += ep.function.code (sc.indentation (ob) + "  ");

      if (line_directives_)
        body += line_directive (sc.location (ob).line, file);

      for (string& h: ep.function.headers ())
        headers.insert (move (h));

      endpoints_.push_back (move (ep));

      // Continue inside the body.
      //
      last = i = ob + 1;
    }

    body.append (s, last, string::npos);

    // Prologue.
    //
    string r ("// Generated by restep from " + file + ", do not edit.\n");

    if (!headers.empty ())
    {
      r += '\n';

      for (const string& h: headers)
        r += "#include <" + h + ">\n";
    }

    r += '\n';

    if (line_directives_)
      r += line_directive (1, file);

    r += body;
    return r;
  }
}
