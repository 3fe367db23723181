// must be the first include in all compile units
#ifndef TWCSS_TWCSS_H
#define TWCSS_TWCSS_H

// Undefine extensions macro to tell sys includes
// that we do not want any macros to be exported
// mainly fixes an issue on SmartOS (SEC macro)
#undef __EXTENSIONS__

#ifdef _MSC_VER
#pragma warning(disable : 4005)
#endif

// applies to MSVC and MinGW
#ifdef _WIN32
// we do not want the ERROR macro
# ifndef NOGDI
#  define NOGDI
# endif
// we do not want the min/max macro
# ifndef NOMINMAX
#  define NOMINMAX
# endif
#endif

// OS specific line feed
// since std::endl flushes
#ifndef STRMLF
# define STRMLF '\n'
#endif

// include C-API header
#include "twcss/base.h"

// Include allocator
#include "memory.hpp"

#include <unordered_set>
#define UnorderedSet std::unordered_set

// For C++ helper
#include <string>
#include <cstdint>
#include <vector>

namespace Twcss {

  // create some C++ aliases for the C enums
  const static TwcssWalkAction WALK_CONTINUE = TWCSS_WALK_CONTINUE;
  const static TwcssWalkAction WALK_SKIP = TWCSS_WALK_SKIP;
  const static TwcssWalkAction WALK_STOP = TWCSS_WALK_STOP;

  typedef TwcssWalkAction WalkAction;
  typedef TwcssNodeKind NodeKind;

}

// output config options structure
struct TwcssOutputOptionsCpp {

  // Append a destination mapping to
  // every node that produces output
  bool trackDestination;

  // String to be used for indentation
  const char* indent;
  // String to be used to for line feeds
  const char* linefeed;

  // initialization list (constructor with defaults)
  TwcssOutputOptionsCpp(bool trackDestination = false,
                        const char* indent = "  ",
                        const char* linefeed = "\n")
  : trackDestination(trackDestination),
    indent(indent), linefeed(linefeed)
  { }

};

#endif
