#ifndef TWCSS_C_BASE_H
#define TWCSS_C_BASE_H

// #define DEBUG

#ifdef _MSC_VER
  #pragma warning(disable : 4503)
  #ifndef _SCL_SECURE_NO_WARNINGS
    #define _SCL_SECURE_NO_WARNINGS
  #endif
  #ifndef _CRT_SECURE_NO_WARNINGS
    #define _CRT_SECURE_NO_WARNINGS
  #endif
  #ifndef _CRT_NONSTDC_NO_DEPRECATE
    #define _CRT_NONSTDC_NO_DEPRECATE
  #endif
#endif

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef _WIN32

  /* You should define ADD_EXPORTS *only* when building the DLL. */
  #ifdef ADD_EXPORTS
    #define ADDAPI __declspec(dllexport)
    #define ADDCALL __cdecl
  #else
    #define ADDAPI
    #define ADDCALL
  #endif

#else /* _WIN32 not defined. */

  /* Define with no value on non-Windows OSes. */
  #define ADDAPI
  #define ADDCALL

#endif

#ifdef __cplusplus
extern "C" {
#endif

  // to allocate a buffer from existing string
  ADDAPI char* ADDCALL twcss_copy_c_string(const char* str);
  // to free overtaken memory when done
  ADDAPI void ADDCALL twcss_free_c_string(char* ptr);

  // Version of the library
  ADDAPI const char* ADDCALL libtwcss_version(void);

#ifdef __cplusplus
} // __cplusplus defined.
#endif

// Include forward declarations
#include <twcss/fwdecl.h>

// Include enumerations
#include <twcss/enums.h>

#endif
