/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
#ifndef TWCSS_LOGGER_HPP
#define TWCSS_LOGGER_HPP

// twcss.hpp must go before all system headers
// to get the __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <sstream>
#include "constants.hpp"
#include "terminal.hpp"

namespace Twcss {

  // Print the `input` string onto the output stream `os` and
  // wrap words around to fit into the given column `width`.
  void print_wrapped(tw::string const& input, size_t width, tw::ostream& os);

  // Collects diagnostics of a render or walk
  class Logger {

  public:

    // warning buffers
    tw::ostream logstrm;

    // Combination of TWCSS_LOGGER_* flags
    int style;

    // Record messages passed to `addDebug`
    bool verbose;

    // Number of warnings written so far
    size_t warnings;

  private:

    // Write warning header to log stream
    void writeWarnHead();

  public:

    // Helper function to ease color output. Returns the
    // passed color if color output is enable, otherwise
    // it will simply return an empty string.
    inline const char* getColor(const char* color) {
      if (style & TWCSS_LOGGER_COLOR) {
        return color;
      }
      return Constants::empty;
    }

  public:

    // Default constructor
    Logger(int style = TWCSS_LOGGER_MONO, bool verbose = false);

    // Print a warning
    void addWarning(const tw::string& message);

    // Print a debug message (only if verbose)
    void addDebug(const tw::string& message);

    // Everything written so far
    tw::string getLogs() const { return logstrm.str(); }

  };

}

#endif
