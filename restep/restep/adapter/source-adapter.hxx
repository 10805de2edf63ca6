#pragma once

#include <restep/adapter/source-scanner.hxx>
#include <restep/generator/generator.hxx>

#include <functional>
#include <string>
#include <vector>

namespace restep
{
  // Helper generated for one annotation.
  //
  struct adapted_endpoint
  {
    generated_function function;
    source_location location; // Of the annotation.
  };

  // Warning callback that also receives the annotation's location.
  //
  using located_sink =
    std::function<void (const source_location&, const std::string&)>;

  // Source adapter.
  //
  // Rewrite annotated C++ source: for each RESTEP_ENDPOINT (...) that
  // precedes a function or class definition, blank out the annotation
  // (preserving line breaks), generate the helper, and insert it right after
  // the definition's opening brace. Annotations within a definition body are
  // processed as well.
  //
  // Unless disabled, #line directives are emitted so that compiler
  // diagnostics for the rewritten source refer to the original lines.
  //
  class source_adapter
  {
  public:
    // The context supplies the schemas, delimiters, default helper name, and
    // the unused schema policy. Its style and diagnostic sink are ignored:
    // the style follows from the annotated definition and warnings go to the
    // located sink.
    //
    explicit
    source_adapter (const generation_context&,
                    bool line_directives = true,
                    located_sink = located_sink ());

    // Return the rewritten source. The file name is only used for the
    // #line directives and the banner.
    //
    // Throw generation_error with the line and column set on failure.
    //
    std::string
    adapt (const std::string& source, const std::string& file);

    // Helpers generated by the last adapt() call, in source order.
    //
    const std::vector<adapted_endpoint>&
    endpoints () const noexcept
    {
      return endpoints_;
    }

    static constexpr const char annotation_name[] = "RESTEP_ENDPOINT";

  private:
    const generation_context& ctx_;
    bool line_directives_;
    located_sink diag_;

    std::vector<adapted_endpoint> endpoints_;
  };
}
