// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <algorithm>
#include "utf8/checked.h"

#include "line_table.hpp"
#include "error_handling.hpp"

namespace Twcss {

  LineTable::LineTable(const tw::string& source) :
    source(source),
    lineStarts()
  {
    lineStarts.push_back(0);
    for (size_t i = 0; i < source.size(); i++) {
      if (source[i] == '\n') lineStarts.push_back(i + 1);
    }
  }

  size_t LineTable::lineEnd(size_t idx) const
  {
    if (idx + 1 < lineStarts.size()) {
      // Exclude the linefeed itself
      return lineStarts[idx + 1] - 1;
    }
    return source.size();
  }

  Location LineTable::find(size_t offset) const
  {
    if (offset > source.size()) {
      throw Exception::InvalidPosition(offset, source.size());
    }
    // First line starting after offset
    auto it = std::upper_bound(
      lineStarts.begin(), lineStarts.end(), offset);
    size_t idx = static_cast<size_t>(it - lineStarts.begin()) - 1;
    try {
      auto distance = utf8::distance(
        source.begin() + lineStarts[idx],
        source.begin() + offset);
      return Location(static_cast<uint32_t>(idx + 1),
        static_cast<uint32_t>(distance));
    }
    catch (const utf8::exception&) {
      throw Exception::InvalidUnicode(idx + 1);
    }
  }

  size_t LineTable::findOffset(const Location& location) const
  {
    if (location.line == 0 || location.line > lineStarts.size()) {
      throw Exception::InvalidPosition(location, lineStarts.size());
    }
    size_t idx = location.line - 1;
    auto it = source.begin() + lineStarts[idx];
    auto end = source.begin() + lineEnd(idx);
    try {
      for (uint32_t i = 0; i < location.column; i++) {
        if (it == end) break;
        utf8::next(it, end);
      }
    }
    catch (const utf8::exception&) {
      throw Exception::InvalidUnicode(location.line);
    }
    return static_cast<size_t>(it - source.begin());
  }

}
