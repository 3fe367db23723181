#ifndef TWCSS_MEMORY_ALLOCATOR_H
#define TWCSS_MEMORY_ALLOCATOR_H

#include <string>
#include <vector>
#include <sstream>

namespace Twcss {

  // Central place for the string and container types.
  // Swap these for allocator aware variants if needed.
  namespace tw {

    template <typename T> using vector = std::vector<T>;
    typedef std::string string;
    typedef std::stringstream sstream;
    typedef std::ostringstream ostream;

  }

}

#endif
