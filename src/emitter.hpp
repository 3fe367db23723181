#ifndef TWCSS_EMITTER_H
#define TWCSS_EMITTER_H

// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <string>
#include "location.hpp"
#include "ast_fwd_decl.hpp"

namespace Twcss {

  // The rendered text plus the running output
  // cursor if destination tracking is enabled.
  class OutputBuffer {
  public:
    tw::string buffer;
    bool tracking;
    // Line of the next emitted statement
    Location position;
  public:
    OutputBuffer(bool tracking = false) noexcept;
  };

  class Emitter {

    protected:
      TwcssOutputOptionsCpp opt;
      OutputBuffer wbuf;

    public:
      Emitter(const TwcssOutputOptionsCpp& opt);
      virtual ~Emitter();

      // current nesting level
      size_t indentation;

      // Width of the current indentation in characters
      size_t indentWidth() const;

    public:
      // append some text or token to the buffer
      void append_string(const tw::string& text);
      // append a single character to buffer
      void append_char(const char chr);
      // append indentation for the current nesting level
      void append_indentation();
      // linefeed after each statement
      void append_mandatory_linefeed();
      // " {" after a selector
      void append_scope_opener();
      // indented "}" after all children
      void append_scope_closer();

    public:
      // Record where `node` starts in the output (if tracking)
      void add_open_mapping(AstNode* node);
      // Move the cursor down by `lines` (if tracking)
      void add_lines(size_t lines);

  };

}

#endif
