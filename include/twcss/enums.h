/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
#ifndef TWCSS_ENUMS_H
#define TWCSS_ENUMS_H

#ifdef __cplusplus
extern "C" {
#endif

  // The three node shapes of the tree
  enum TwcssNodeKind {
    TWCSS_NODE_RULE,
    TWCSS_NODE_DECLARATION,
    TWCSS_NODE_COMMENT,
    // Reported for NULL handles only
    TWCSS_NODE_NONE
  };

  // Returned by walk visitors
  enum TwcssWalkAction {
    // Descend into children, then go on
    TWCSS_WALK_CONTINUE,
    // Don't visit the children of this node
    TWCSS_WALK_SKIP,
    // Stop the walk entirely
    TWCSS_WALK_STOP
  };

  #define TWCSS_LOGGER_MONO 1
  #define TWCSS_LOGGER_COLOR 2

  // Status codes reported by the C-API
  enum TwcssStatus {
    TWCSS_STATUS_OK = 0,
    TWCSS_STATUS_ERROR = 1,
    TWCSS_STATUS_RECURSION = 2,
  };

#ifdef __cplusplus
} // __cplusplus defined.
#endif

#endif
