#ifndef FRAME_ENCODER_H
#define FRAME_ENCODER_H

#include "export_format.h"
#include "export_request.h"
#include "export_result.h"
#include "presentation.h"
#include "vector_document.h"
#include "include/core/SkData.h"
#include "include/core/SkImage.h"
#include <string>
#include <vector>

// Encoded bytes of one artifact
struct EncodedArtifact {
    sk_sp<SkData> data;
    ErrorKind error_kind = ErrorKind::kRenderError;
    std::string error;

    bool success() const { return data != nullptr && error.empty(); }
};

// Encode a rendered slide as PNG (fast zlib level) or JPEG (options.jpeg_quality)
// Any other format is reported as UnsupportedFormat
EncodedArtifact encodeRaster(const sk_sp<SkImage>& image, ExportFormat format, const RenderOptions& options);

// Re-serialize the vector document through Skia's SVG canvas at its intrinsic size
EncodedArtifact encodeSvg(const VectorDocument& document);

// JSON sidecar: presentation identity, remote metadata and the normalized slide documents
EncodedArtifact encodeMetadata(const Presentation& presentation, const std::vector<Slide>& slides);

#endif // FRAME_ENCODER_H
