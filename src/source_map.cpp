/*****************************************************************************/
/* Part of LibTwcss, released under the MIT license (See LICENSE.txt).       */
/*****************************************************************************/
// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <algorithm>

#include "source_map.hpp"
#include "ast_nodes.hpp"
#include "logger.hpp"
#include "error_handling.hpp"

namespace Twcss {

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  const char* Base64VLQ::CHARACTERS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  const int Base64VLQ::VLQ_BASE_SHIFT = 5;
  const int Base64VLQ::VLQ_BASE = 1 << VLQ_BASE_SHIFT;
  const int Base64VLQ::VLQ_BASE_MASK = VLQ_BASE - 1;
  const int Base64VLQ::VLQ_CONTINUATION_BIT = VLQ_BASE;

  void Base64VLQ::encode(tw::string& result, int number) const
  {
    int vlq = to_vlq_signed(number);
    do {
      int digit = vlq & VLQ_BASE_MASK;
      vlq = static_cast<int>(static_cast<unsigned int>(vlq) >> VLQ_BASE_SHIFT);
      if (vlq > 0) digit |= VLQ_CONTINUATION_BIT;
      result += base64_encode(digit);
    } while (vlq > 0);
  }

  char Base64VLQ::base64_encode(int number) const
  {
    return CHARACTERS[number];
  }

  int Base64VLQ::to_vlq_signed(int number) const
  {
    return (number < 0) ? ((-number) << 1) + 1 : (number << 1) + 0;
  }

  /////////////////////////////////////////////////////////////////////////
  /////////////////////////////////////////////////////////////////////////

  SourceMap::SourceMap(Logger* logger) :
    entries(),
    logger(logger)
  {}

  void SourceMap::add(const Location& generated, const Location& original)
  {
    entries.emplace_back(generated, original);
  }

  void SourceMap::collect(const AstNodes& nodes)
  {
    size_t nestings = 0;
    collectNodes(nodes, nestings);
  }

  void SourceMap::collectNodes(const AstNodes& nodes, size_t& nestings)
  {
    RECURSION_GUARD(nestings);
    for (const AstNodeObj& node : nodes) {
      const Mapping* origin = nullptr;
      for (const Mapping& mapping : node->mappings()) {
        if (mapping.hasSource) {
          origin = &mapping;
          break;
        }
      }
      for (const Mapping& mapping : node->mappings()) {
        if (!mapping.hasDestination) continue;
        const Mapping* source = mapping.hasSource ? &mapping : origin;
        if (source == nullptr) {
          if (logger) logger->addDebug("No source position for `"
            + node->to_string() + "` printed at "
            + mapping.destination.start.to_string());
          continue;
        }
        add(mapping.destination.start, source->source.start);
        if (!mapping.destination.empty()) {
          add(mapping.destination.end, source->source.end);
        }
      }
      if (Rule* rule = node->getRule()) {
        collectNodes(rule->nodes(), nestings);
      }
    }
  }

  tw::string SourceMap::render() const
  {

    tw::string result;

    // Object for encoding state
    Base64VLQ base64vlq;

    // Hoisted nodes are collected out of output order
    tw::vector<SourceMapEntry> sorted(entries);
    std::stable_sort(sorted.begin(), sorted.end(),
      [](const SourceMapEntry& lhs, const SourceMapEntry& rhs) {
        return lhs.generated < rhs.generated;
      });

    // We can make an educated guess here
    result.reserve(sorted.size() * 5);

    int previous_generated_line = 0;
    int previous_generated_column = 0;
    int previous_original_line = 0;
    int previous_original_column = 0;

    for (size_t i = 0; i < sorted.size(); ++i) {
      const SourceMapEntry& entry = sorted[i];
      if (entry.generated.line == 0) throw Exception::InvalidMapping(entry.generated);
      if (entry.original.line == 0) throw Exception::InvalidMapping(entry.original);
      // Source maps count lines from zero
      int generated_line = static_cast<int>(entry.generated.line) - 1;
      int generated_column = static_cast<int>(entry.generated.column);
      int original_line = static_cast<int>(entry.original.line) - 1;
      int original_column = static_cast<int>(entry.original.column);
      bool linefeed = generated_line != previous_generated_line;

      if (linefeed) {
        previous_generated_column = 0;
        result += tw::string(size_t(generated_line - previous_generated_line), ';');
        previous_generated_line = generated_line;
      }

      auto generated_offset = generated_column - previous_generated_column;
      auto line_delta = original_line - previous_original_line;
      auto col_delta = original_column - previous_original_column;

      // Only emit mappings if it is actually pointing at something new
      if (!i || linefeed || generated_offset || line_delta || col_delta) {
        if (!linefeed && i) result += ',';
        base64vlq.encode(result, generated_offset);
        base64vlq.encode(result, 0);
        base64vlq.encode(result, line_delta);
        base64vlq.encode(result, col_delta);
      }

      previous_generated_column = generated_column;
      previous_original_column = original_column;
      previous_original_line = original_line;
    }

    return result;
  }

}
