#ifndef FONT_UTILS_H
#define FONT_UTILS_H

#include "include/core/SkFont.h"
#include "include/core/SkFontMgr.h"
#include "include/core/SkFontStyle.h"
#include "include/core/SkScalar.h"
#include "include/core/SkTypeface.h"
#include <string>
#include <vector>

// Map a style name ("Bold", "Italic", "Bold Italic", ...) to an SkFontStyle
SkFontStyle getSkFontStyle(const std::string& styleStr);

// Process-wide fontconfig font manager, created on first use
// Falls back to the empty manager if fontconfig cannot be initialized
sk_sp<SkFontMgr> getFontManager();

// Find a typeface for family/style, falling back to the default family
// May return nullptr if the manager has no fonts at all
sk_sp<SkTypeface> matchTypeface(
    SkFontMgr* fontMgr,
    const std::string& fontFamily,
    const std::string& fontStyle
);

// Split on '\n'; an empty input yields no lines, a trailing newline keeps an empty last line
std::vector<std::string> splitTextLines(const std::string& text);

// Width of the longest line of text with the given font
SkScalar measureTextWidth(const SkFont& font, const std::string& text);

#endif // FONT_UTILS_H
