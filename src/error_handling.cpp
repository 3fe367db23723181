// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "error_handling.hpp"

namespace Twcss {

  namespace Exception {

    Base::Base(tw::string msg)
    : std::runtime_error(msg.c_str()), msg(msg)
    { }

    RecursionLimitError::RecursionLimitError()
      : Base(msg_recursion_limit) {}

    InvalidPosition::InvalidPosition(size_t offset, size_t size)
      : Base(def_msg)
    {
      tw::sstream msg_stream;
      msg_stream << "Offset " << offset
        << " is outside of the text (size " << size << ").";
      msg = msg_stream.str();
    }

    InvalidPosition::InvalidPosition(const Location& location, size_t lines)
      : Base(def_msg)
    {
      tw::sstream msg_stream;
      msg_stream << "Line " << location.line
        << " is outside of the text (" << lines << " lines).";
      msg = msg_stream.str();
    }

    InvalidUnicode::InvalidUnicode(size_t line)
      : Base(def_msg)
    {
      msg = "Invalid UTF-8 sequence on line "
        + std::to_string(line) + ".";
    }

    InvalidMapping::InvalidMapping(const Location& location)
      : Base(def_msg)
    {
      msg = "Invalid mapping position "
        + location.to_string() + " (lines start at 1).";
    }

  }

}
