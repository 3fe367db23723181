#ifndef TWCSS_MAPPING_H
#define TWCSS_MAPPING_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <vector>
#include "location.hpp"

namespace Twcss {

  // Links a span in the original input to a span in the
  // generated output. Either side may be absent, e.g. a
  // node with no known origin or one not yet printed.
  class Mapping {
  public:
    Range source;
    Range destination;
    bool hasSource;
    bool hasDestination;

    // Both sides absent
    Mapping();

    Mapping(const Range& source, const Range& destination);

    // Only the origin is known
    static Mapping fromSource(const Range& source);

    // Only the output position is known
    static Mapping fromDestination(const Range& destination);

  };

  typedef tw::vector<Mapping> Mappings;

}

#endif
