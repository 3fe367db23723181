#ifndef TWCSS_STRING_UTILS_H
#define TWCSS_STRING_UTILS_H

#include "twcss.hpp"

namespace Twcss {
  namespace StringUtils {

    bool startsWith(const tw::string& str, const char* prefix, size_t len);

    // Number of `\n` characters in `str`
    size_t countLinefeeds(const tw::string& str);

    // Replace line breaks with visible `\n` escapes
    tw::string escapeLinefeeds(const tw::string& str);

  }
}

#endif
