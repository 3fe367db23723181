// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <algorithm>
#include "string_utils.hpp"

namespace Twcss {
  namespace StringUtils {

    bool startsWith(const tw::string& str, const char* prefix, size_t len) {
      return len <= str.size() && std::equal(prefix, prefix + len, str.begin());
    }

    size_t countLinefeeds(const tw::string& str) {
      return static_cast<size_t>(std::count(str.begin(), str.end(), '\n'));
    }

    tw::string escapeLinefeeds(const tw::string& str) {
      tw::string escaped;
      escaped.reserve(str.size());
      for (char chr : str) {
        if (chr == '\n') escaped += "\\n";
        else if (chr == '\r') escaped += "\\r";
        else escaped += chr;
      }
      return escaped;
    }

  }
}
