// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <cstdlib>
#include <cstring>
#include <twcss/base.h>

#ifndef LIBTWCSS_VERSION
#define LIBTWCSS_VERSION "[NA]"
#endif

#ifdef __cplusplus
extern "C" {
#endif

  char* ADDCALL twcss_copy_c_string(const char* str)
  {
    if (str == nullptr) return nullptr;
    size_t len = std::strlen(str) + 1;
    char* cpy = static_cast<char*>(std::malloc(len));
    if (cpy == nullptr) return nullptr;
    std::memcpy(cpy, str, len);
    return cpy;
  }

  void ADDCALL twcss_free_c_string(char* ptr)
  {
    std::free(ptr);
  }

  const char* ADDCALL libtwcss_version(void)
  {
    return LIBTWCSS_VERSION;
  }

#ifdef __cplusplus
} // __cplusplus defined.
#endif
