#ifndef APPDECK_ICONS_H_
#define APPDECK_ICONS_H_

#include <string>

#define APPDECK_DEFAULT_ICON "📱"

// Returns the glyph of the first table pattern contained in `app_name`
// (case-sensitive), or APPDECK_DEFAULT_ICON.
const char* icon_resolve(const std::string& app_name);

#endif  // APPDECK_ICONS_H_
