/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
#ifndef TWCSS_SOURCE_MAP_H
#define TWCSS_SOURCE_MAP_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <vector>
#include "location.hpp"
#include "ast_fwd_decl.hpp"

namespace Twcss {

  // Encoder for the base64 variable length quantities
  // used in the `mappings` field of source maps (v3).
  class Base64VLQ {
  public:
    void encode(tw::string& result, int number) const;
  private:
    char base64_encode(int number) const;
    int to_vlq_signed(int number) const;
    static const char* CHARACTERS;
    static const int VLQ_BASE_SHIFT;
    static const int VLQ_BASE;
    static const int VLQ_BASE_MASK;
    static const int VLQ_CONTINUATION_BIT;
  };

  // One generated position pointing back into the source
  class SourceMapEntry {
  public:
    Location generated;
    Location original;
    SourceMapEntry(const Location& generated, const Location& original)
    : generated(generated), original(original) { }
  };

  class SourceMap {

  public:

    // Collected entries (in collection order)
    tw::vector<SourceMapEntry> entries;

  private:

    // Optional diagnostics sink
    Logger* logger;

    void collectNodes(const AstNodes& nodes, size_t& nestings);

  public:

    SourceMap(Logger* logger = nullptr);

    // Add one entry by hand
    void add(const Location& generated, const Location& original);

    // Gather the entries of all printed nodes in pre-order.
    // Destinations are paired with the mapping's own source
    // or else with the first source recorded on the node.
    void collect(const AstNodes& nodes);

    // Render the `mappings` string for a single source
    tw::string render() const;

  };

}

#endif
