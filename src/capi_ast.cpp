/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "capi_ast.hpp"
#include "output.hpp"
#include "logger.hpp"
#include "error_handling.hpp"

using namespace Twcss;

// Convert the currently handled exception into a status
static enum TwcssStatus handle_error(TwcssOutput& output)
{
  // Re-throw last error
  try { throw; }
  // Nesting too deep for our stack
  catch (Exception::RecursionLimitError& e) {
    output.what = e.what();
    output.status = TWCSS_STATUS_RECURSION;
  }
  // Other errors should not really happen and indicate more severe issues!
  catch (std::exception& e) {
    output.what = e.what();
    output.status = TWCSS_STATUS_ERROR;
  }
  catch (...) {
    output.what = "unknown";
    output.status = TWCSS_STATUS_ERROR;
  }
  // Return the error state
  return output.status;
}
// EO handle_error

// Unwrap helpers returning null for null
// handles or for nodes of another kind
static AstNode* unwrapNode(struct TwcssNode* node)
{
  return node ? &AstNode::unwrap(node) : nullptr;
}

static Rule* unwrapRule(struct TwcssNode* node)
{
  return node ? AstNode::unwrap(node).getRule() : nullptr;
}

static Declaration* unwrapDeclaration(struct TwcssNode* node)
{
  return node ? AstNode::unwrap(node).getDeclaration() : nullptr;
}

static Comment* unwrapComment(struct TwcssNode* node)
{
  return node ? AstNode::unwrap(node).getComment() : nullptr;
}

#ifdef __cplusplus
extern "C" {
#endif

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  struct TwcssNode* ADDCALL twcss_make_rule(const char* selector)
  {
    if (selector == nullptr) return nullptr;
    return TWCSS_MEMORY_NEW(Rule, selector, AstNodes())->wrap();
  }

  struct TwcssNode* ADDCALL twcss_make_decl(const char* property, const char* value)
  {
    if (value == nullptr) return twcss_make_decl_novalue(property);
    if (property == nullptr) return nullptr;
    return TWCSS_MEMORY_NEW(Declaration, property, value)->wrap();
  }

  struct TwcssNode* ADDCALL twcss_make_decl_novalue(const char* property)
  {
    if (property == nullptr) return nullptr;
    return TWCSS_MEMORY_NEW(Declaration, property)->wrap();
  }

  struct TwcssNode* ADDCALL twcss_make_comment(const char* value)
  {
    if (value == nullptr) return nullptr;
    return TWCSS_MEMORY_NEW(Comment, value)->wrap();
  }

  void ADDCALL twcss_delete_node(struct TwcssNode* node)
  {
    if (node == nullptr) return;
    AstNode& unwrapped(AstNode::unwrap(node));
    // Owned nodes are released by their parent
    if (unwrapped.getRefCount() == 0) {
      delete &unwrapped;
    }
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  enum TwcssNodeKind ADDCALL twcss_node_get_kind(struct TwcssNode* node)
  {
    AstNode* unwrapped = unwrapNode(node);
    return unwrapped ? unwrapped->kind() : TWCSS_NODE_NONE;
  }

  const char* ADDCALL twcss_rule_get_selector(struct TwcssNode* rule)
  {
    Rule* unwrapped = unwrapRule(rule);
    return unwrapped ? unwrapped->selector().c_str() : nullptr;
  }

  void ADDCALL twcss_rule_set_selector(struct TwcssNode* rule, const char* selector)
  {
    Rule* unwrapped = unwrapRule(rule);
    if (unwrapped && selector) unwrapped->selector(selector);
  }

  size_t ADDCALL twcss_rule_get_size(struct TwcssNode* rule)
  {
    Rule* unwrapped = unwrapRule(rule);
    return unwrapped ? unwrapped->size() : 0;
  }

  struct TwcssNode* ADDCALL twcss_rule_get_child(struct TwcssNode* rule, size_t i)
  {
    Rule* unwrapped = unwrapRule(rule);
    if (unwrapped == nullptr || i >= unwrapped->size()) return nullptr;
    return unwrapped->nodes()[i]->wrap();
  }

  bool ADDCALL twcss_rule_append_child(struct TwcssNode* rule, struct TwcssNode* child)
  {
    Rule* unwrapped = unwrapRule(rule);
    if (unwrapped == nullptr || child == nullptr) return false;
    unwrapped->append(&AstNode::unwrap(child));
    return true;
  }

  const char* ADDCALL twcss_decl_get_property(struct TwcssNode* decl)
  {
    Declaration* unwrapped = unwrapDeclaration(decl);
    return unwrapped ? unwrapped->property().c_str() : nullptr;
  }

  const char* ADDCALL twcss_decl_get_value(struct TwcssNode* decl)
  {
    Declaration* unwrapped = unwrapDeclaration(decl);
    if (unwrapped == nullptr || !unwrapped->hasValue()) return nullptr;
    return unwrapped->value().c_str();
  }

  void ADDCALL twcss_decl_set_value(struct TwcssNode* decl, const char* value)
  {
    Declaration* unwrapped = unwrapDeclaration(decl);
    if (unwrapped == nullptr) return;
    if (value) unwrapped->value(value);
    else unwrapped->clearValue();
  }

  bool ADDCALL twcss_decl_get_important(struct TwcssNode* decl)
  {
    Declaration* unwrapped = unwrapDeclaration(decl);
    return unwrapped ? unwrapped->important() : false;
  }

  void ADDCALL twcss_decl_set_important(struct TwcssNode* decl, bool important)
  {
    Declaration* unwrapped = unwrapDeclaration(decl);
    if (unwrapped) unwrapped->important(important);
  }

  const char* ADDCALL twcss_comment_get_value(struct TwcssNode* comment)
  {
    Comment* unwrapped = unwrapComment(comment);
    return unwrapped ? unwrapped->value().c_str() : nullptr;
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  size_t ADDCALL twcss_node_count_mappings(struct TwcssNode* node)
  {
    AstNode* unwrapped = unwrapNode(node);
    return unwrapped ? unwrapped->mappings().size() : 0;
  }

  bool ADDCALL twcss_node_get_destination(struct TwcssNode* node, size_t i, size_t* line, size_t* column)
  {
    AstNode* unwrapped = unwrapNode(node);
    if (unwrapped == nullptr) return false;
    const Mappings& mappings(unwrapped->mappings());
    if (i >= mappings.size() || !mappings[i].hasDestination) return false;
    if (line) *line = mappings[i].destination.start.line;
    if (column) *column = mappings[i].destination.start.column;
    return true;
  }

  bool ADDCALL twcss_node_get_source(struct TwcssNode* node, size_t i, size_t* line, size_t* column)
  {
    AstNode* unwrapped = unwrapNode(node);
    if (unwrapped == nullptr) return false;
    const Mappings& mappings(unwrapped->mappings());
    if (i >= mappings.size() || !mappings[i].hasSource) return false;
    if (line) *line = mappings[i].source.start.line;
    if (column) *column = mappings[i].source.start.column;
    return true;
  }

  void ADDCALL twcss_node_add_source(struct TwcssNode* node, size_t line, size_t column)
  {
    AstNode* unwrapped = unwrapNode(node);
    if (unwrapped == nullptr) return;
    Location start(static_cast<uint32_t>(line), static_cast<uint32_t>(column));
    unwrapped->mappings().push_back(
      Mapping::fromSource(Range::at(start)));
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  struct TwcssNodeList* ADDCALL twcss_make_node_list(void)
  {
    return new TwcssNodeList;
  }

  void ADDCALL twcss_delete_node_list(struct TwcssNodeList* list)
  {
    delete list;
  }

  void ADDCALL twcss_node_list_append(struct TwcssNodeList* list, struct TwcssNode* node)
  {
    if (list == nullptr || node == nullptr) return;
    list->nodes.push_back(&AstNode::unwrap(node));
  }

  size_t ADDCALL twcss_node_list_get_size(struct TwcssNodeList* list)
  {
    return list ? list->nodes.size() : 0;
  }

  struct TwcssNode* ADDCALL twcss_node_list_get(struct TwcssNodeList* list, size_t i)
  {
    if (list == nullptr || i >= list->nodes.size()) return nullptr;
    return list->nodes[i]->wrap();
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  enum TwcssStatus ADDCALL twcss_walk(struct TwcssNodeList* list, TwcssWalkCallback callback, void* cookie)
  {
    if (list == nullptr || callback == nullptr) return TWCSS_STATUS_ERROR;
    TwcssOutput status;
    try {
      walk(list->nodes, [&](AstNode* node, WalkUtils& utils) {
        TwcssWalker walker(utils);
        return callback(node->wrap(), &walker, cookie);
      });
    }
    catch (...) { return handle_error(status); }
    return status.status;
  }

  void ADDCALL twcss_walker_replace_with(struct TwcssWalker* walker, struct TwcssNode** nodes, size_t count)
  {
    if (walker == nullptr) return;
    if (nodes == nullptr && count > 0) return;
    AstNodes replacement;
    for (size_t i = 0; i < count; i++) {
      if (nodes[i] == nullptr) continue;
      replacement.push_back(&AstNode::unwrap(nodes[i]));
    }
    walker->utils.replaceWith(replacement);
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  struct TwcssOutput* ADDCALL twcss_render_css(struct TwcssNodeList* list, bool track_destination)
  {
    TwcssOutput* output = new TwcssOutput;
    if (list == nullptr) {
      output->status = TWCSS_STATUS_ERROR;
      output->what = "No node list given";
      return output;
    }
    Logger logger(TWCSS_LOGGER_MONO);
    try {
      TwcssOutputOptionsCpp options(track_destination);
      output->css = toCss(list->nodes, options, &logger);
    }
    catch (...) { handle_error(*output); }
    output->logs = logger.getLogs();
    return output;
  }

  void ADDCALL twcss_delete_output(struct TwcssOutput* output)
  {
    delete output;
  }

  enum TwcssStatus ADDCALL twcss_output_get_status(struct TwcssOutput* output)
  {
    return output->status;
  }

  const char* ADDCALL twcss_output_get_css(struct TwcssOutput* output)
  {
    return output->css.c_str();
  }

  const char* ADDCALL twcss_output_get_error(struct TwcssOutput* output)
  {
    return output->what.c_str();
  }

  const char* ADDCALL twcss_output_get_logs(struct TwcssOutput* output)
  {
    return output->logs.c_str();
  }

#ifdef __cplusplus
} // __cplusplus defined.
#endif
