#include "text_sizing.h"
#include "font_utils.h"
#include "../utils/logging.h"
#include <algorithm>

static bool textFits(const SkFont& baseFont, const std::string& text, float size,
                     const TextFitConstraint& constraint) {
    SkFont font(baseFont);
    font.setSize(size);
    if (constraint.boxWidth > 0.0f && measureTextWidth(font, text) > constraint.boxWidth) {
        return false;
    }
    if (constraint.boxHeight > 0.0f) {
        size_t lineCount = std::max<size_t>(1, splitTextLines(text).size());
        float blockHeight = size * (1.0f + constraint.lineSpacing * static_cast<float>(lineCount - 1));
        if (blockHeight > constraint.boxHeight) {
            return false;
        }
    }
    return true;
}

float calculateFitFontSize(
    const SkFont& baseFont,
    const std::string& text,
    const TextFitConstraint& constraint
) {
    float maxSize = constraint.maxSize;
    float minSize = std::min(constraint.minSize, maxSize);
    if (minSize <= 0.0f || textFits(baseFont, text, maxSize, constraint)) {
        return maxSize;
    }
    if (!textFits(baseFont, text, minSize, constraint)) {
        LOG_DEBUG("calculateFitFontSize: text doesn't fit at minSize (" << minSize << "), using it anyway");
        return minSize;
    }

    // Binary search for the largest size that fits (between minSize and maxSize)
    float low = minSize;
    float high = maxSize;
    float bestSize = minSize;
    for (int i = 0; i < 15; i++) {
        float testSize = (low + high) / 2.0f;
        if (textFits(baseFont, text, testSize, constraint)) {
            bestSize = testSize;
            low = testSize;
        } else {
            high = testSize;
        }
        if ((high - low) < 0.1f) {
            break;
        }
    }

    LOG_DEBUG("calculateFitFontSize: reduced from " << maxSize << " to " << bestSize
              << " (box " << constraint.boxWidth << "x" << constraint.boxHeight << ")");
    return bestSize;
}
