#ifndef TWCSS_DEBUGGER_H
#define TWCSS_DEBUGGER_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <string>
#include <sstream>
#include "ast_nodes.hpp"
#include "string_utils.hpp"

namespace Twcss {

  inline void debug_ast(tw::ostream& out, const AstNodes& nodes, tw::string ind = "");

  inline void debug_ast(tw::ostream& out, AstNode* node, tw::string ind = "")
  {
    if (node == nullptr) return;
    out << ind;
    if (Rule* rule = node->getRule()) {
      out << "Rule " << rule->selector();
    }
    else if (Declaration* decl = node->getDeclaration()) {
      out << "Declaration " << decl->property() << ": ";
      if (decl->hasValue()) out << StringUtils::escapeLinefeeds(decl->value());
      else out << "<none>";
      if (decl->important()) out << " !important";
    }
    else if (Comment* comment = node->getComment()) {
      out << "Comment /*" << StringUtils::escapeLinefeeds(comment->value()) << "*/";
    }
    if (!node->mappings().empty()) {
      out << " (mappings: " << node->mappings().size() << ")";
    }
    out << STRMLF;
    if (Rule* rule = node->getRule()) {
      debug_ast(out, rule->nodes(), ind + "  ");
    }
  }

  inline void debug_ast(tw::ostream& out, const AstNodes& nodes, tw::string ind)
  {
    for (const AstNodeObj& node : nodes) {
      debug_ast(out, node.ptr(), ind);
    }
  }

  // Human readable dump of the whole forest
  inline tw::string debug_ast(const AstNodes& nodes)
  {
    tw::ostream out;
    debug_ast(out, nodes);
    return out.str();
  }

}

#endif
