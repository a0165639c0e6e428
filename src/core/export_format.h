#ifndef EXPORT_FORMAT_H
#define EXPORT_FORMAT_H

#include <string>
#include <vector>

// Output formats, declared in canonical (sort) order
enum class ExportFormat {
    kSvg = 0,
    kPng = 1,
    kJpeg = 2,
    kJson = 3,
    kMp4 = 4,
};

// All valid formats in canonical order
const std::vector<ExportFormat>& allExportFormats();

// True if the value is one of the declared enumerators
bool isKnownFormat(ExportFormat format);

// Lowercase tag ("svg", "png", "jpeg", "json", "mp4")
const char* formatName(ExportFormat format);

// File extension without the dot ("jpeg" is written as "jpg")
const char* formatExtension(ExportFormat format);

// Still raster formats are produced per slide from a rendered image
bool isRasterFormat(ExportFormat format);

// Parse a format tag, case-insensitive; "jpg" is accepted for JPEG
// Throws InvalidRequestError for unknown tags
ExportFormat parseExportFormat(const std::string& tag);

// Sorted, de-duplicated copy; throws InvalidRequestError on unknown values
std::vector<ExportFormat> normalizeFormats(const std::vector<ExportFormat>& formats);

#endif // EXPORT_FORMAT_H
