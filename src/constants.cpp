// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "constants.hpp"

namespace Twcss {
  namespace Constants {

    extern const char at_root_selector[] = "@at-root";
    extern const char utilities_selector[] = "@tailwind utilities";
    extern const char at_property_prefix[] = "@property ";
    extern const char sort_property[] = "--tw-sort";

    extern const char important_suffix[] = "!important";

    extern const char empty[] = "";

  }
}
