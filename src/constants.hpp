#ifndef TWCSS_CONSTANTS_H
#define TWCSS_CONSTANTS_H

namespace Twcss {
  namespace Constants {

    // Selector whose children are appended at the root level
    extern const char at_root_selector[];
    // Selector whose children are inlined at the current depth
    extern const char utilities_selector[];
    // Prefix of custom property registrations
    extern const char at_property_prefix[];
    // Internal ordering marker, never printed
    extern const char sort_property[];

    // Appended after declaration values
    extern const char important_suffix[];

    extern const char empty[];

  }
}

#endif
