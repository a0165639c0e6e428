#ifndef ARGUMENT_PARSER_H
#define ARGUMENT_PARSER_H

#include "export_format.h"
#include "export_request.h"
#include "presentation.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Command-line arguments structure
struct Arguments {
    std::vector<ExportFormat> formats;
    std::vector<std::string> presentation_ids;
    std::vector<std::string> folder_ids;           // "root" walks the whole library
    std::vector<SlideRef> explicit_slides;         // --slides, one explicit composition
    std::string explicit_name;
    RenderOptions options;
    size_t fetch_workers = 4;
    size_t render_workers = 0;
    size_t presentation_workers = 0;
    int retries = 3;
    int timeout_ms = 30000;
    int max_depth = 10;
    std::string cache_index;                       // default: <output_dir>/.slidecast-cache.json
    bool debug_mode = false;
    bool quiet_mode = false;
    std::string library_dir;
    std::string output_dir;
};

// Parse command-line arguments
// Returns 0 on success, 1 on error (and prints error message), 2 if help or version was shown
int parseArguments(int argc, char* argv[], Arguments& args);

// Apply a JSON request (same keys as the long options, snake_case) on top of args
// Returns false and sets error on unknown keys or bad values
bool applyRequestJson(const nlohmann::json& request, Arguments& args, std::string& error);

// Parse "pid:sid[@seconds],pid:sid..." into slide references
bool parseSlideList(const std::string& value, std::vector<SlideRef>& slides, std::string& error);

// Print usage/help message
void printUsage(const char* program_name);

#endif // ARGUMENT_PARSER_H
