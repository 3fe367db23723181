#ifndef TWCSS_LOCATION_H
#define TWCSS_LOCATION_H

#include "twcss.hpp"
#include <string>
#include <stdint.h>

#include "ast_def_macros.hpp"

namespace Twcss {

  // A single point in a text file. Used for
  // the logical source and the generated output.
  class Location {

  public:

    // One based line number
    uint32_t line;
    // Zero based column
    uint32_t column;

    // Start of any text
    Location();

    // Create location with given `line` and `column`
    Location(uint32_t line, uint32_t column);

    // Implement equal and derive unequal
    ATTACH_EQ_OPERATIONS(Location);

    // Implement `<`, derive `<=`, `>`, `>=`
    ATTACH_CMP_OPERATIONS(Location);

    // Returns "line:column"
    tw::string to_string() const;

  };

  // A contiguous span between two locations
  class Range {

  public:

    Location start;
    Location end;

    Range();

    Range(const Location& start, const Location& end);

    // Zero-width range at the given point
    static Range at(const Location& point);

    bool empty() const { return start == end; }

    ATTACH_EQ_OPERATIONS(Range);

  };

}

#endif
