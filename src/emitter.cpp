// twcss.hpp must go before all system headers to get the
// __EXTENSIONS__ fix on Solaris.
#include "twcss.hpp"

#include <cstring>
#include "emitter.hpp"
#include "mapping.hpp"
#include "ast_nodes.hpp"

namespace Twcss {

  OutputBuffer::OutputBuffer(bool tracking) noexcept :
    buffer(),
    tracking(tracking),
    position(1, 0)
  {}

  Emitter::Emitter(const TwcssOutputOptionsCpp& opt) :
    opt(opt),
    wbuf(opt.trackDestination),
    indentation(0)
  {}

  Emitter::~Emitter() { }

  size_t Emitter::indentWidth() const
  {
    return std::strlen(opt.indent) * indentation;
  }

  void Emitter::append_string(const tw::string& text)
  {
    wbuf.buffer.append(text);
  }

  void Emitter::append_char(const char chr)
  {
    wbuf.buffer += chr;
  }

  void Emitter::append_indentation()
  {
    for (size_t i = 0; i < indentation; i++) {
      wbuf.buffer.append(opt.indent);
    }
  }

  void Emitter::append_mandatory_linefeed()
  {
    wbuf.buffer.append(opt.linefeed);
  }

  void Emitter::append_scope_opener()
  {
    append_string(" {");
    append_mandatory_linefeed();
  }

  void Emitter::append_scope_closer()
  {
    append_indentation();
    append_char('}');
    append_mandatory_linefeed();
  }

  void Emitter::add_open_mapping(AstNode* node)
  {
    if (!wbuf.tracking) return;
    Location start(wbuf.position.line,
      static_cast<uint32_t>(indentWidth()));
    node->mappings().push_back(
      Mapping::fromDestination(Range::at(start)));
  }

  void Emitter::add_lines(size_t lines)
  {
    if (!wbuf.tracking) return;
    wbuf.position.line += static_cast<uint32_t>(lines);
  }

}
