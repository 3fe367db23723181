// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "ast_nodes.hpp"

namespace Twcss {

  AstNode::AstNode(NodeKind kind, Mappings&& mappings) :
    mappings_(std::move(mappings)),
    kind_(kind)
  {}

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  Rule::Rule(const tw::string& selector,
    AstNodes nodes, Mappings mappings) :
    AstNode(TWCSS_NODE_RULE, std::move(mappings)),
    selector_(selector),
    nodes_(std::move(nodes))
  {}

  tw::string Rule::to_string() const
  {
    return selector_ + " { ... }";
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  Declaration::Declaration(const tw::string& property,
    const tw::string& value, Mappings mappings) :
    AstNode(TWCSS_NODE_DECLARATION, std::move(mappings)),
    property_(property),
    important_(false),
    value_(value),
    hasValue_(true)
  {}

  Declaration::Declaration(const tw::string& property) :
    AstNode(TWCSS_NODE_DECLARATION, Mappings()),
    property_(property),
    important_(false),
    value_(),
    hasValue_(false)
  {}

  tw::string Declaration::to_string() const
  {
    if (!hasValue_) return property_ + ": <none>";
    return property_ + ": " + value_;
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  Comment::Comment(const tw::string& value, Mappings mappings) :
    AstNode(TWCSS_NODE_COMMENT, std::move(mappings)),
    value_(value)
  {}

  tw::string Comment::to_string() const
  {
    return "/*" + value_ + "*/";
  }

}
