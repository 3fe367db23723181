// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "location.hpp"

namespace Twcss {

  Location::Location() :
    line(1),
    column(0)
  {}

  Location::Location(uint32_t line, uint32_t column) :
    line(line),
    column(column)
  {}

  bool Location::operator==(const Location& rhs) const
  {
    return line == rhs.line
      && column == rhs.column;
  }

  bool Location::operator<(const Location& rhs) const
  {
    if (line != rhs.line) return line < rhs.line;
    return column < rhs.column;
  }

  tw::string Location::to_string() const
  {
    return std::to_string(line) + ":" + std::to_string(column);
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  Range::Range() :
    start(),
    end()
  {}

  Range::Range(const Location& start, const Location& end) :
    start(start),
    end(end)
  {}

  Range Range::at(const Location& point)
  {
    return Range(point, point);
  }

  bool Range::operator==(const Range& rhs) const
  {
    return start == rhs.start
      && end == rhs.end;
  }

}
