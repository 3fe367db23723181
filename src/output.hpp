#ifndef TWCSS_OUTPUT_H
#define TWCSS_OUTPUT_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <string>
#include <vector>

#include "emitter.hpp"
#include "ast_nodes.hpp"
#include "visitor_ast.hpp"

namespace Twcss {

  // Renders a forest into css text. One instance per render,
  // the hoisted nodes and seen `@property` rules belong to it.
  class Output : public Emitter, public AstVisitor<void> {

  public:
    Output(const TwcssOutputOptionsCpp& opt, Logger* logger = nullptr);
    virtual ~Output();

  protected:
    // Optional diagnostics sink
    Logger* logger;
    // Children of `@at-root` rules, printed after everything else
    AstNodes hoisted;
    // Depth-0 `@property` selectors already printed
    UnorderedSet<tw::string> seenAtProperties;
    // Current recursion depth
    size_t nestings;

  public:
    // Print `nodes` and flush all hoisted nodes
    tw::string render(const AstNodes& nodes);

    void visitNodes(const AstNodes& nodes);

    void visitRule(Rule* rule) override;
    void visitDeclaration(Declaration* decl) override;
    void visitComment(Comment* comment) override;

  };

  // Render `nodes` to css. Appends destination mappings to all
  // printed nodes if `opt.trackDestination` is enabled.
  tw::string toCss(const AstNodes& nodes,
    const TwcssOutputOptionsCpp& opt = TwcssOutputOptionsCpp(),
    Logger* logger = nullptr);

}

#endif
