// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <cstring>

#include "output.hpp"
#include "logger.hpp"
#include "constants.hpp"
#include "string_utils.hpp"
#include "error_handling.hpp"

namespace Twcss {

  Output::Output(const TwcssOutputOptionsCpp& opt, Logger* logger)
    : Emitter(opt),
    logger(logger),
    hoisted(),
    seenAtProperties(),
    nestings(0)
  {}

  Output::~Output() { }

  tw::string Output::render(const AstNodes& nodes)
  {
    visitNodes(nodes);
    // Hoisted nodes may bring their own `@at-root` rules
    while (!hoisted.empty()) {
      AstNodes deferred;
      deferred.swap(hoisted);
      LOCAL_COUNT(indentation, 0);
      visitNodes(deferred);
    }
    return wbuf.buffer;
  }

  void Output::visitNodes(const AstNodes& nodes)
  {
    RECURSION_GUARD(nestings);
    for (const AstNodeObj& node : nodes) {
      node->accept(*this);
    }
  }

  void Output::visitRule(Rule* rule)
  {
    const tw::string& selector = rule->selector();

    if (selector == Constants::at_root_selector) {
      if (logger) logger->addDebug("Hoisting " + std::to_string(rule->size())
        + " node(s) of @at-root to the root level");
      hoisted.insert(hoisted.end(),
        rule->nodes().begin(), rule->nodes().end());
      return;
    }

    if (selector == Constants::utilities_selector) {
      visitNodes(rule->nodes());
      return;
    }

    // Print at-rules without children as statements,
    // e.g. `@layer base, components, utilities;`
    if (rule->isAtRule() && rule->empty()) {
      add_open_mapping(rule);
      append_indentation();
      append_string(selector);
      append_char(';');
      append_mandatory_linefeed();
      add_lines(1);
      return;
    }

    if (indentation == 0 && StringUtils::startsWith(selector,
      Constants::at_property_prefix, std::strlen(Constants::at_property_prefix)))
    {
      if (!seenAtProperties.insert(selector).second) {
        if (logger) logger->addDebug("Skipping duplicate " + selector);
        return;
      }
    }

    add_open_mapping(rule);
    append_indentation();
    append_string(selector);
    append_scope_opener();
    add_lines(1);

    indentation += 1;
    visitNodes(rule->nodes());
    indentation -= 1;

    append_scope_closer();
    add_lines(1);
  }

  void Output::visitDeclaration(Declaration* decl)
  {
    // Internal marker, must never reach the output
    if (decl->property() == Constants::sort_property) return;

    if (!decl->hasValue()) {
      if (logger) logger->addWarning("Declaration `" + decl->property()
        + "` has no value and was not printed.");
      return;
    }

    add_open_mapping(decl);
    append_indentation();
    append_string(decl->property());
    append_string(": ");
    append_string(decl->value());
    if (decl->important()) {
      append_string(Constants::important_suffix);
    }
    append_char(';');
    append_mandatory_linefeed();
    // Custom property values may span multiple lines
    add_lines(1 + StringUtils::countLinefeeds(decl->value()));
  }

  void Output::visitComment(Comment* comment)
  {
    add_open_mapping(comment);
    append_indentation();
    append_string("/*");
    append_string(comment->value());
    append_string("*/");
    append_mandatory_linefeed();
    add_lines(1 + StringUtils::countLinefeeds(comment->value()));
  }

  tw::string toCss(const AstNodes& nodes,
    const TwcssOutputOptionsCpp& opt, Logger* logger)
  {
    Output output(opt, logger);
    return output.render(nodes);
  }

}
