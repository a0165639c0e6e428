#ifndef RENDERER_H
#define RENDERER_H

#include "vector_document.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkImage.h"
#include <cstdint>
#include <string>

// Result of rendering one slide
struct RenderResult {
    sk_sp<SkImage> image;
    std::string error;

    bool success() const { return image != nullptr && error.empty(); }
};

// Register the image decoders used for slide images (PNG, JPEG). Safe to call repeatedly.
void registerImageCodecs();

// Draw the document in its own coordinate space (0,0)-(width,height),
// background included. Used for raster output and for the SVG canvas.
// Returns false and sets error on the first element that cannot be drawn.
bool drawDocument(SkCanvas* canvas, const VectorDocument& document, std::string& error);

// Rasterize a slide to widthPx x heightPx on the CPU.
// The document is scaled to fit and centered; the bars are filled with fillColor (ARGB).
RenderResult renderSlide(const VectorDocument& document, int widthPx, int heightPx, uint32_t fillColor);

#endif // RENDERER_H
