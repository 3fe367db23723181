#ifndef TWCSS_VISITOR_AST_H
#define TWCSS_VISITOR_AST_H

#include "ast_fwd_decl.hpp"

namespace Twcss {

  // An interface for [visitors][] that traverse the css tree.
  // [visitors]: https://en.wikipedia.org/wiki/Visitor_pattern

  template <typename T>
  class AstVisitor {
  public:

    virtual T visitRule(Rule* node) = 0;
    virtual T visitDeclaration(Declaration* node) = 0;
    virtual T visitComment(Comment* node) = 0;

    virtual ~AstVisitor() {}

  };

}

#endif
