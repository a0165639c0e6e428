#include "font_utils.h"
#include "../utils/logging.h"
#include "include/core/SkFontTypes.h"
#include "include/core/SkRect.h"
#include "include/ports/SkFontScanner_FreeType.h"
#include "include/ports/SkFontMgr_fontconfig.h"
#include <fontconfig/fontconfig.h>
#include <algorithm>
#include <mutex>

SkFontStyle getSkFontStyle(const std::string& styleStr) {
    if (styleStr.find("Bold") != std::string::npos && styleStr.find("Italic") != std::string::npos) {
        return SkFontStyle::BoldItalic();
    } else if (styleStr.find("Bold") != std::string::npos) {
        return SkFontStyle::Bold();
    } else if (styleStr.find("Italic") != std::string::npos) {
        return SkFontStyle::Italic();
    }
    return SkFontStyle::Normal();
}

sk_sp<SkFontMgr> getFontManager() {
    static std::once_flag once;
    static sk_sp<SkFontMgr> fontMgr;
    std::call_once(once, []() {
        const auto fcInitOk = FcInit();
        LOG_DEBUG("FcInit() returned " << (fcInitOk ? "true" : "false"));

        auto scanner = SkFontScanner_Make_FreeType();
        if (!scanner) {
            LOG_CERR("[ERROR] SkFontScanner_Make_FreeType() returned nullptr; cannot use fontconfig");
        } else {
            fontMgr = SkFontMgr_New_FontConfig(nullptr, std::move(scanner));
        }
        if (fontMgr) {
            LOG_DEBUG("Fontconfig font manager created successfully");
        } else {
            LOG_CERR("[WARNING] Failed to create fontconfig font manager, text will use the empty font manager");
            fontMgr = SkFontMgr::RefEmpty();
        }
    });
    return fontMgr;
}

sk_sp<SkTypeface> matchTypeface(
    SkFontMgr* fontMgr,
    const std::string& fontFamily,
    const std::string& fontStyle
) {
    SkFontStyle style = getSkFontStyle(fontStyle);
    sk_sp<SkTypeface> typeface;
    if (!fontFamily.empty()) {
        typeface = fontMgr->matchFamilyStyle(fontFamily.c_str(), style);
    }

    // Fall back to whatever fontconfig considers the default family
    if (!typeface) {
        typeface = fontMgr->legacyMakeTypeface(nullptr, style);
        if (!fontFamily.empty()) {
            LOG_DEBUG("Could not find typeface for " << fontFamily << " " << fontStyle << ", using default");
        }
    }
    return typeface;
}

std::vector<std::string> splitTextLines(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }
    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

SkScalar measureTextWidth(const SkFont& font, const std::string& text) {
    SkScalar maxWidth = 0.0f;
    for (const auto& line : splitTextLines(text)) {
        if (line.empty()) {
            continue;
        }
        SkScalar width = font.measureText(line.c_str(), line.length(), SkTextEncoding::kUTF8);
        maxWidth = std::max(maxWidth, width);
    }
    return maxWidth;
}
