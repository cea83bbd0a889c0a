#include "icons.h"

typedef struct IconEntry {
  const char* pattern;
  const char* glyph;
} IconEntry;

// First match wins. Keep the order: later entries are shadowed by earlier
// ones ("iTerm" before "iTerm2", "Edge" before "Microsoft Edge").
static const IconEntry kAppIcons[] = {
    // Browsers
    {"Safari", "🌐"},
    {"Firefox", "🦊"},
    {"Chrome", "🌐"},
    {"Edge", "🌐"},
    {"Microsoft Edge", "🌐"},
    {"Arc", "🌍"},

    // Terminals
    {"Terminal", "💻"},
    {"iTerm", "💻"},
    {"iTerm2", "💻"},
    {"Warp", "🚀"},
    {"kitty", "🐱"},
    {"Ghostty", "👻"},

    // System utilities
    {"Finder", "📁"},
    {"System Settings", "⚙️"},
    {"Activity Monitor", "📊"},
    {"Memory Diag", "🧠"},
    {"App Store", "🛍️"},
    {"Font Book", "🔤"},
    {"Keychain", "🔑"},
    {"Paste", "📋"},
    {"Magnet", "🧲"},
    {"Windsurf", "🏄"},
    {"keymapp", "⌨️"},

    // Development
    {"Visual Studio Code", "💻"},
    {"Xcode", "🛠️"},
    {"Cursor", "📝"},
    {"Rancher Desktop", "🐮"},
    {"Docker", "🐳"},
    {"Postgres", "🐘"},
    {"DB Browser for SQLite", "🗄️"},
    {"pgAdmin", "🐘"},
    {"Lens", "🔍"},
    {"Authy", "🔐"},
    {"1Password", "🔐"},
    {"Github", "🐙"},
    {"HubAI", "🧠"},
    {"Repo Prompt", "💬"},

    // Creative
    {"Final Cut Pro", "🎬"},
    {"iMovie", "🎥"},
    {"GarageBand", "🎸"},
    {"Numbers", "🔢"},
    {"Pages", "📄"},
    {"Keynote", "📊"},
    {"Insta360", "📸"},

    // Communication
    {"Mail", "✉️"},
    {"Messages", "💬"},
    {"Slack", "💬"},
    {"Discord", "💬"},
    {"Klack", "⌨️"},
    {"Zoom", "🎦"},
    {"zoom.us", "🎦"},
    {"FaceTime", "📹"},
    {"Claude", "🧠"},
    {"Notion", "📝"},
    {"Copilot", "🤖"},

    // Media
    {"Music", "🎵"},
    {"Spotify", "🎵"},
    {"Photos", "🖼️"},
    {"Preview", "👁️"},
    {"Books", "📚"},

    // Utilities
    {"Calendar", "📅"},
    {"Notes", "📝"},
    {"Calculator", "🧮"},
    {"Maps", "🗺️"},
    {"Reminders", "📋"},
    {"Siri", "🔍"},
    {"TextEdit", "📄"},
    {"TestFlight", "✈️"},

    // VPN & security
    {"ExpressVPN", "🔒"},
    {"AWS VPN Client", "🔒"},
    {"VPN", "🔒"},
};

const char* icon_resolve(const std::string& app_name) {
  for (const IconEntry& entry : kAppIcons) {
    if (app_name.find(entry.pattern) != std::string::npos)
      return entry.glyph;
  }
  return APPDECK_DEFAULT_ICON;
}
