// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "walker.hpp"
#include "error_handling.hpp"

namespace Twcss {

  WalkUtils::WalkUtils(AstNodes& nodes, size_t index) :
    nodes(nodes),
    index(index),
    span(1),
    replaced_(false)
  {}

  void WalkUtils::replaceWith(const AstNodeObj& node)
  {
    replaceWith(AstNodes{ node });
  }

  void WalkUtils::replaceWith(const AstNodes& replacement)
  {
    auto begin = nodes.begin() + index;
    nodes.erase(begin, begin + span);
    nodes.insert(nodes.begin() + index,
      replacement.begin(), replacement.end());
    span = replacement.size();
    replaced_ = true;
  }

  namespace {

    bool walkNodes(AstNodes& nodes, const WalkCallback& visit, size_t& nestings)
    {
      RECURSION_GUARD(nestings);
      size_t i = 0;
      while (i < nodes.size()) {
        // Keep the node alive even if it gets replaced
        AstNodeObj node = nodes[i];
        WalkUtils utils(nodes, i);
        WalkAction action = visit(node.ptr(), utils);
        // Pending replacement was already applied
        if (action == WALK_STOP) return false;
        // Visit the inserted nodes at the same position
        if (utils.replaced()) continue;
        if (action == WALK_CONTINUE) {
          if (Rule* rule = node->getRule()) {
            if (!walkNodes(rule->nodes(), visit, nestings)) {
              return false;
            }
          }
        }
        i += 1;
      }
      return true;
    }

  }

  bool walk(AstNodes& nodes, const WalkCallback& visit)
  {
    size_t nestings = 0;
    return walkNodes(nodes, visit, nestings);
  }

}
