/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
#ifndef TWCSS_CAPI_AST_HPP
#define TWCSS_CAPI_AST_HPP

// twcss.hpp must go before all system headers
// to get the __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "twcss/ast.h"
#include "ast_nodes.hpp"
#include "walker.hpp"

// Top level forest handed out to C
struct TwcssNodeList {
  Twcss::AstNodes nodes;
};

// Result of a render call
struct TwcssOutput {
  enum TwcssStatus status;
  Twcss::tw::string css;
  Twcss::tw::string what;
  Twcss::tw::string logs;
  TwcssOutput() : status(TWCSS_STATUS_OK) {}
};

// Lives only during one visit of `twcss_walk`
struct TwcssWalker {
  Twcss::WalkUtils& utils;
  TwcssWalker(Twcss::WalkUtils& utils) : utils(utils) {}
};

#endif
