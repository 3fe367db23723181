#ifndef TWCSS_AST_FWD_DECL_H
#define TWCSS_AST_FWD_DECL_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <vector>
#include <string>
#include "memory/shared_ptr.hpp"

/////////////////////////////////////////////
// Forward declarations for the AST visitors.
/////////////////////////////////////////////
namespace Twcss {

  class Location;
  class Range;
  class Mapping;

  class AstNode;
  class Rule;
  class Declaration;
  class Comment;

  class Logger;
  class Output;
  class SourceMap;
  class LineTable;
  class WalkUtils;

  template <typename T>
  class AstVisitor;

  #define IMPL_MEM_OBJ(type) \
    typedef SharedImpl<type> type##Obj; \

  IMPL_MEM_OBJ(AstNode);
  IMPL_MEM_OBJ(Rule);
  IMPL_MEM_OBJ(Declaration);
  IMPL_MEM_OBJ(Comment);

  // An ordered forest of nodes
  typedef tw::vector<AstNodeObj> AstNodes;

  typedef tw::vector<Mapping> Mappings;

}

#endif
