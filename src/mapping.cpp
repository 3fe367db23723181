// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include "mapping.hpp"

namespace Twcss {

  Mapping::Mapping() :
    source(),
    destination(),
    hasSource(false),
    hasDestination(false)
  {}

  Mapping::Mapping(const Range& source, const Range& destination) :
    source(source),
    destination(destination),
    hasSource(true),
    hasDestination(true)
  {}

  Mapping Mapping::fromSource(const Range& source)
  {
    Mapping mapping;
    mapping.source = source;
    mapping.hasSource = true;
    return mapping;
  }

  Mapping Mapping::fromDestination(const Range& destination)
  {
    Mapping mapping;
    mapping.destination = destination;
    mapping.hasDestination = true;
    return mapping;
  }

}
