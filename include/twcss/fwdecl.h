/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
#ifndef TWCSS_FWDECL_H
#define TWCSS_FWDECL_H

#ifdef __cplusplus
extern "C" {
#endif

  // Forward declare anonymous structs
  // C never sees any implementation
  struct TwcssNode;
  struct TwcssNodeList;
  struct TwcssOutput;
  struct TwcssWalker;

#ifdef __cplusplus
} // __cplusplus defined.
#endif

#endif
