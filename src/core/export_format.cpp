#include "export_format.h"
#include "export_result.h"
#include "../utils/string_utils.h"
#include <algorithm>

const std::vector<ExportFormat>& allExportFormats() {
    static const std::vector<ExportFormat> formats = {
        ExportFormat::kSvg, ExportFormat::kPng, ExportFormat::kJpeg,
        ExportFormat::kJson, ExportFormat::kMp4,
    };
    return formats;
}

bool isKnownFormat(ExportFormat format) {
    int value = static_cast<int>(format);
    return value >= static_cast<int>(ExportFormat::kSvg) &&
           value <= static_cast<int>(ExportFormat::kMp4);
}

const char* formatName(ExportFormat format) {
    switch (format) {
        case ExportFormat::kSvg:  return "svg";
        case ExportFormat::kPng:  return "png";
        case ExportFormat::kJpeg: return "jpeg";
        case ExportFormat::kJson: return "json";
        case ExportFormat::kMp4:  return "mp4";
    }
    return "unknown";
}

const char* formatExtension(ExportFormat format) {
    return format == ExportFormat::kJpeg ? "jpg" : formatName(format);
}

bool isRasterFormat(ExportFormat format) {
    return format == ExportFormat::kPng || format == ExportFormat::kJpeg;
}

ExportFormat parseExportFormat(const std::string& tag) {
    std::string lowered = toLowerCopy(trimCopy(tag));
    if (lowered == "jpg") {
        return ExportFormat::kJpeg;
    }
    for (ExportFormat format : allExportFormats()) {
        if (lowered == formatName(format)) {
            return format;
        }
    }
    throw InvalidRequestError("unknown export format: '" + tag + "'");
}

std::vector<ExportFormat> normalizeFormats(const std::vector<ExportFormat>& formats) {
    std::vector<ExportFormat> result;
    for (ExportFormat format : formats) {
        if (!isKnownFormat(format)) {
            throw InvalidRequestError("unknown export format tag " + std::to_string(static_cast<int>(format)));
        }
        result.push_back(format);
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}
