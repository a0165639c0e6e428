#ifndef TEXT_SIZING_H
#define TEXT_SIZING_H

#include "include/core/SkFont.h"
#include <string>

// Box a block of text has to fit in
struct TextFitConstraint {
    float maxSize = 0.0f;       // size the author asked for
    float minSize = 0.0f;       // smallest size allowed
    float boxWidth = 0.0f;      // <= 0 means unconstrained
    float boxHeight = 0.0f;     // <= 0 means unconstrained
    float lineSpacing = 1.2f;   // line advance as a multiple of the font size
};

// Largest font size in [minSize, maxSize] at which every line of text fits the box
// Returns maxSize when it already fits and minSize when nothing fits
float calculateFitFontSize(
    const SkFont& baseFont,
    const std::string& text,
    const TextFitConstraint& constraint
);

#endif // TEXT_SIZING_H
