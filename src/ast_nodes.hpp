#ifndef TWCSS_AST_NODES_H
#define TWCSS_AST_NODES_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <stdexcept>

#include "mapping.hpp"
#include "visitor_ast.hpp"
#include "ast_fwd_decl.hpp"
#include "ast_def_macros.hpp"

namespace Twcss {

  /////////////////////////////////////////////////////////////////////////
  // Base of the three node shapes. The set is closed, the
  // `kind` discriminant tells which one we are dealing with.
  /////////////////////////////////////////////////////////////////////////
  class AstNode : public SharedObj {
    // Append-only records, one more each time the node is printed
    ADD_REF(Mappings, mappings);
  protected:
    NodeKind kind_;
    AstNode(NodeKind kind, Mappings&& mappings);
  public:
    NodeKind kind() const { return kind_; }

    bool isRule() const { return kind_ == TWCSS_NODE_RULE; }
    bool isDeclaration() const { return kind_ == TWCSS_NODE_DECLARATION; }
    bool isComment() const { return kind_ == TWCSS_NODE_COMMENT; }

    BASE_GET_OPERATIONS(Rule);
    BASE_GET_OPERATIONS(Declaration);
    BASE_GET_OPERATIONS(Comment);

    // Dispatch to the matching visit method
    template <typename T>
    T accept(AstVisitor<T>& visitor);

    DECLARE_CAPI_WRAPPER(AstNode, TwcssNode);
  };

  /////////////////////////////////////////////////////////////////////////
  // A qualified rule (selector plus block) or an at-rule
  // if the selector starts with an `@` character.
  /////////////////////////////////////////////////////////////////////////
  class Rule final : public AstNode {
    ADD_PROPERTY(tw::string, selector);
    // Child order is significant
    ADD_REF(AstNodes, nodes);
  public:
    Rule(const tw::string& selector,
      AstNodes nodes,
      Mappings mappings = Mappings());

    bool isAtRule() const {
      return !selector_.empty()
        && selector_[0] == '@';
    }

    bool empty() const { return nodes_.empty(); }
    size_t size() const { return nodes_.size(); }

    void append(const AstNodeObj& node) {
      nodes_.push_back(node);
    }

    tw::string to_string() const override final;

    FINAL_GET_OPERATIONS(Rule);
  };

  /////////////////////////////////////////////////////////////////////////
  // A single `property: value` pair. The value may be absent,
  // in which case the declaration never reaches the output.
  /////////////////////////////////////////////////////////////////////////
  class Declaration final : public AstNode {
    ADD_PROPERTY(tw::string, property);
    ADD_PROPERTY(bool, important);
  protected:
    tw::string value_;
    bool hasValue_;
  public:
    Declaration(const tw::string& property,
      const tw::string& value,
      Mappings mappings = Mappings());

    // Declaration without a value
    explicit Declaration(const tw::string& property);

    bool hasValue() const { return hasValue_; }
    const tw::string& value() const { return value_; }

    void value(const tw::string& value) {
      value_ = value;
      hasValue_ = true;
    }

    void clearValue() {
      value_.clear();
      hasValue_ = false;
    }

    tw::string to_string() const override final;

    FINAL_GET_OPERATIONS(Declaration);
  };

  /////////////////////////////////////////////////////////////////////////
  // Raw comment body without the delimiters.
  /////////////////////////////////////////////////////////////////////////
  class Comment final : public AstNode {
    ADD_PROPERTY(tw::string, value);
  public:
    Comment(const tw::string& value,
      Mappings mappings = Mappings());

    tw::string to_string() const override final;

    FINAL_GET_OPERATIONS(Comment);
  };

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  template <typename T>
  T AstNode::accept(AstVisitor<T>& visitor)
  {
    switch (kind_) {
    case TWCSS_NODE_RULE:
      return visitor.visitRule(static_cast<Rule*>(this));
    case TWCSS_NODE_DECLARATION:
      return visitor.visitDeclaration(static_cast<Declaration*>(this));
    case TWCSS_NODE_COMMENT:
    case TWCSS_NODE_NONE:
      break;
    }
    return visitor.visitComment(static_cast<Comment*>(this));
  }

}

#endif
