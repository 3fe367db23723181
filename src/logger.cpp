// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <string>

#include "logger.hpp"
#include "terminal.hpp"

namespace Twcss {

  Logger::Logger(int style, bool verbose) :
    style(style),
    verbose(verbose),
    warnings(0)
  {}

  // Write warning header to log stream
  void Logger::writeWarnHead()
  {
    if (style & TWCSS_LOGGER_COLOR) {
      logstrm << getColor(Terminal::yellow);
      logstrm << "Warning";
      logstrm << getColor(Terminal::reset);
    }
    else {
      logstrm << "WARNING";
    }
  }

  void print_wrapped(tw::string const& input, size_t width, tw::ostream& os)
  {
    std::istringstream in(input);

    size_t current = 0;
    tw::string word;

    while (in >> word) {
      if (current != 0) {
        if (current + word.size() + 1 > width) {
          os << STRMLF;
          current = 0;
        }
        else {
          os << ' ';
          current += 1;
        }
      }
      os << word;
      current += word.size();
    }
    if (current != 0) {
      os << STRMLF;
    }
  }

  void Logger::addWarning(const tw::string& message)
  {
    warnings += 1;
    writeWarnHead();
    logstrm << ": ";
    print_wrapped(message, 80, logstrm);
  }

  void Logger::addDebug(const tw::string& message)
  {
    if (!verbose) return;
    logstrm << getColor(Terminal::cyan);
    logstrm << "DEBUG";
    logstrm << getColor(Terminal::reset);
    logstrm << ": " << message << STRMLF;
  }

}
