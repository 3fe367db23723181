#ifndef TWCSS_ERROR_HANDLING_H
#define TWCSS_ERROR_HANDLING_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <string>
#include <sstream>
#include <stdexcept>
#include "location.hpp"

namespace Twcss {

  namespace Exception {

    const tw::string def_msg("Invalid css tree detected");

    const tw::string msg_recursion_limit =
      "Too deep recursion detected. This can be caused by too deep level nesting.\n"
      "LibTwcss will abort here in order to avoid a possible stack overflow.\n";

    class Base : public std::runtime_error {
      protected:
        tw::string msg;
      public:
        Base(tw::string msg = def_msg);
        virtual const char* errtype() const { return "Error"; }
        virtual const char* what() const throw() { return msg.c_str(); }
        virtual ~Base() noexcept {};
    };

    class RecursionLimitError : public Base {
      public:
        RecursionLimitError();
        virtual ~RecursionLimitError() noexcept {};
    };

    class InvalidPosition : public Base {
      public:
        // Byte offset outside of the text
        InvalidPosition(size_t offset, size_t size);
        // Line outside of the text
        InvalidPosition(const Location& location, size_t lines);
        virtual ~InvalidPosition() noexcept {};
    };

    class InvalidUnicode : public Base {
      public:
        InvalidUnicode(size_t line);
        virtual ~InvalidUnicode() noexcept {};
    };

    class InvalidMapping : public Base {
      public:
        InvalidMapping(const Location& location);
        virtual ~InvalidMapping() noexcept {};
    };

  }

}

#endif
