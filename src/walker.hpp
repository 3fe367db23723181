#ifndef TWCSS_WALKER_H
#define TWCSS_WALKER_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <functional>
#include "ast_nodes.hpp"

namespace Twcss {

  /////////////////////////////////////////////////////////////////////////
  // Handed to the visitor for every node. Gives access to
  // the splice point of the currently visited node.
  /////////////////////////////////////////////////////////////////////////
  class WalkUtils {

  private:

    // The sequence holding the current node
    AstNodes& nodes;
    // Position of the current node
    size_t index;
    // Items at `index` owned by this visit
    size_t span;
    // Whether `replaceWith` was called
    bool replaced_;

  public:

    WalkUtils(AstNodes& nodes, size_t index);

    // Replace the current node by `node`
    void replaceWith(const AstNodeObj& node);

    // Replace the current node by all `nodes` (may be empty).
    // Calling it again replaces what was inserted before.
    void replaceWith(const AstNodes& replacement);

    bool replaced() const { return replaced_; }

  };

  typedef std::function<WalkAction(AstNode* node, WalkUtils& utils)> WalkCallback;

  // Depth-first pre-order traversal of `nodes`. Nodes inserted via
  // `replaceWith` are visited before the walk moves past their position.
  // Returns false if the visitor stopped the walk.
  bool walk(AstNodes& nodes, const WalkCallback& visit);

}

#endif
