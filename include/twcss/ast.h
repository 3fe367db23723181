/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
#ifndef TWCSS_C_AST_H
#define TWCSS_C_AST_H

#include <stddef.h>
#include <stdbool.h>
#include <twcss/base.h>

#ifdef __cplusplus
extern "C" {
#endif

  // Create new nodes. The returned node is owned by the caller until it
  // is appended to a list or a rule, which then takes over ownership.
  // NULL strings yield NULL, except a NULL declaration value which
  // creates a declaration without value.
  ADDAPI struct TwcssNode* ADDCALL twcss_make_rule(const char* selector);
  ADDAPI struct TwcssNode* ADDCALL twcss_make_decl(const char* property, const char* value);
  ADDAPI struct TwcssNode* ADDCALL twcss_make_decl_novalue(const char* property);
  ADDAPI struct TwcssNode* ADDCALL twcss_make_comment(const char* value);

  // Release a node that was never appended anywhere
  ADDAPI void ADDCALL twcss_delete_node(struct TwcssNode* node);

  // Getters and setters for node properties. A NULL node or a node of
  // another kind yields NULL, 0, false or `TWCSS_NODE_NONE`.
  ADDAPI enum TwcssNodeKind ADDCALL twcss_node_get_kind(struct TwcssNode* node);
  ADDAPI const char* ADDCALL twcss_rule_get_selector(struct TwcssNode* rule);
  ADDAPI void ADDCALL twcss_rule_set_selector(struct TwcssNode* rule, const char* selector);
  ADDAPI size_t ADDCALL twcss_rule_get_size(struct TwcssNode* rule);
  ADDAPI struct TwcssNode* ADDCALL twcss_rule_get_child(struct TwcssNode* rule, size_t i);
  ADDAPI bool ADDCALL twcss_rule_append_child(struct TwcssNode* rule, struct TwcssNode* child);
  ADDAPI const char* ADDCALL twcss_decl_get_property(struct TwcssNode* decl);
  ADDAPI const char* ADDCALL twcss_decl_get_value(struct TwcssNode* decl);
  ADDAPI void ADDCALL twcss_decl_set_value(struct TwcssNode* decl, const char* value);
  ADDAPI bool ADDCALL twcss_decl_get_important(struct TwcssNode* decl);
  ADDAPI void ADDCALL twcss_decl_set_important(struct TwcssNode* decl, bool important);
  ADDAPI const char* ADDCALL twcss_comment_get_value(struct TwcssNode* comment);

  // Mapping records appended to the node (e.g. by rendering)
  ADDAPI size_t ADDCALL twcss_node_count_mappings(struct TwcssNode* node);
  ADDAPI bool ADDCALL twcss_node_get_destination(struct TwcssNode* node, size_t i, size_t* line, size_t* column);
  ADDAPI bool ADDCALL twcss_node_get_source(struct TwcssNode* node, size_t i, size_t* line, size_t* column);
  ADDAPI void ADDCALL twcss_node_add_source(struct TwcssNode* node, size_t line, size_t column);

  // Ordered forest of top-level nodes
  ADDAPI struct TwcssNodeList* ADDCALL twcss_make_node_list(void);
  ADDAPI void ADDCALL twcss_delete_node_list(struct TwcssNodeList* list);
  ADDAPI void ADDCALL twcss_node_list_append(struct TwcssNodeList* list, struct TwcssNode* node);
  ADDAPI size_t ADDCALL twcss_node_list_get_size(struct TwcssNodeList* list);
  ADDAPI struct TwcssNode* ADDCALL twcss_node_list_get(struct TwcssNodeList* list, size_t i);

  // Visitor invoked for every node by `twcss_walk`
  typedef enum TwcssWalkAction (*TwcssWalkCallback)
    (struct TwcssNode* node, struct TwcssWalker* walker, void* cookie);

  // Walk the forest depth-first (a stopped walk still reports success)
  ADDAPI enum TwcssStatus ADDCALL twcss_walk(struct TwcssNodeList* list, TwcssWalkCallback callback, void* cookie);
  // Replace the node currently visited by the given nodes (ownership moves)
  ADDAPI void ADDCALL twcss_walker_replace_with(struct TwcssWalker* walker, struct TwcssNode** nodes, size_t count);

  // Render the forest to css text
  ADDAPI struct TwcssOutput* ADDCALL twcss_render_css(struct TwcssNodeList* list, bool track_destination);
  ADDAPI void ADDCALL twcss_delete_output(struct TwcssOutput* output);
  ADDAPI enum TwcssStatus ADDCALL twcss_output_get_status(struct TwcssOutput* output);
  ADDAPI const char* ADDCALL twcss_output_get_css(struct TwcssOutput* output);
  ADDAPI const char* ADDCALL twcss_output_get_error(struct TwcssOutput* output);
  ADDAPI const char* ADDCALL twcss_output_get_logs(struct TwcssOutput* output);

#ifdef __cplusplus
} // __cplusplus defined.
#endif

#endif
