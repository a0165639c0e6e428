#ifndef OPTIONS_KEY_H
#define OPTIONS_KEY_H

#include "export_request.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Fingerprint of a normalized export request: 64-bit FNV-1a over the
// canonical JSON form, as 16 lowercase hex digits. Not a security token.
//
// The key is independent of format order and codec option order, and
// changes with every field of RenderOptions, the presentation identity,
// its slide list and durations, and the output root.
//
// Throws InvalidRequestError if the request does not validate.
std::string computeOptionsKey(const ExportRequest& request);

// Key for the request narrowed to a single format; cache entries use this
std::string computeFormatKey(const ExportRequest& request, ExportFormat format);

// Canonical form hashed by the functions above (formats already normalized)
nlohmann::json canonicalRequestJson(const ExportRequest& request, const std::vector<ExportFormat>& formats);

#endif // OPTIONS_KEY_H
