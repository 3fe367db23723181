#ifndef TWCSS_LINE_TABLE_H
#define TWCSS_LINE_TABLE_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <vector>
#include "location.hpp"

namespace Twcss {

  // Converts between byte offsets into a utf8 source text and
  // line/column locations. Producers use this to fill in the
  // source side of a node's mappings.
  class LineTable {

  private:

    // Copy of the indexed text
    tw::string source;

    // Byte offset where each line starts
    tw::vector<size_t> lineStarts;

    // Byte offset after the last character of line `idx` (zero based)
    size_t lineEnd(size_t idx) const;

  public:

    LineTable(const tw::string& source);

    // Number of lines (at least one)
    size_t lines() const { return lineStarts.size(); }

    // Location of the byte at `offset`. The column
    // is counted in code points. Throws if `offset`
    // is past the end of the text.
    Location find(size_t offset) const;

    // Byte offset of `location`. Columns past the end of
    // the line clamp to its end. Throws on invalid lines.
    size_t findOffset(const Location& location) const;

  };

}

#endif
