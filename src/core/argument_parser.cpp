#include "argument_parser.h"
#include "export_result.h"
#include "vector_document.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include "../utils/version.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

void printUsage(const char* program_name) {
    LOG_CERR("Usage: " << program_name << " [formats] [sources] [options] <library-dir> <output-dir>");
    LOG_CERR("Formats (at least one):");
    LOG_CERR("  --png --jpeg --svg --json --mp4");
    LOG_CERR("Sources (at least one):");
    LOG_CERR("  --presentation <id>     Export one presentation (repeatable)");
    LOG_CERR("  --folder <id>           Export a folder recursively, 'root' for the whole library (repeatable)");
    LOG_CERR("  --slides <pid:sid,...>  Export an explicit slide list; 'pid:sid@secs' sets a slide's duration");
    LOG_CERR("  --name <name>           Name of the --slides composition (default: batch)");
    LOG_CERR("Rendering:");
    LOG_CERR("  --width <px> --height <px>   Still resolution (default: 1920x1080, 0x0 to use --dpi)");
    LOG_CERR("  --dpi <dpi>                  Derive the resolution from the slide size");
    LOG_CERR("  --video-width <px> --video-height <px>  Video resolution (default: still resolution)");
    LOG_CERR("  --fps <fps>                  Video frame rate (default: 10)");
    LOG_CERR("  --duration <secs>            Seconds per slide in video (default: 20)");
    LOG_CERR("  --total-duration <secs>      Total video length, spread evenly across slides");
    LOG_CERR("  --jpeg-quality <1-100>       JPEG quality (default: 90)");
    LOG_CERR("  --fill <#AARRGGBB>           Letterbox color (default: #FF000000)");
    LOG_CERR("  --naming index|named         Slide file names (default: index)");
    LOG_CERR("  --codec <name>               Video encoder (default: libx264, falls back to mpeg4)");
    LOG_CERR("  --codec-option <k=v>         Encoder option (repeatable)");
    LOG_CERR("Execution:");
    LOG_CERR("  --fetch-workers <n> --render-workers <n> --presentation-workers <n>");
    LOG_CERR("  --retries <n>                Attempts per remote call (default: 3)");
    LOG_CERR("  --timeout-ms <ms>            Remote call timeout (default: 30000)");
    LOG_CERR("  --max-depth <n>              Deepest folder level walked (default: 10)");
    LOG_CERR("  --request <file.json>        Read options from a JSON request; later flags override it");
    LOG_CERR("  --cache-index <file>         Cache index file (default: <output-dir>/.slidecast-cache.json)");
    LOG_CERR("  --debug --quiet --version --help");
}

namespace {

bool parseIntValue(const std::string& text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDoubleValue(const std::string& text, double& out) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseWorkerCount(const std::string& text, size_t& out) {
    int value = 0;
    if (!parseIntValue(text, value) || value < 0) {
        return false;
    }
    out = static_cast<size_t>(value);
    return true;
}

bool parseCodecOption(const std::string& text, std::pair<std::string, std::string>& out) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    out = {trimCopy(text.substr(0, eq)), trimCopy(text.substr(eq + 1))};
    return true;
}

bool loadRequestFile(const std::string& path, Arguments& args, std::string& error) {
    std::ifstream f(path);
    if (!f.is_open()) {
        error = "could not open request file: " + path;
        return false;
    }
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        error = "request file " + path + " is not valid JSON: " + e.what();
        return false;
    }
    if (!applyRequestJson(request, args, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

} // namespace

bool parseSlideList(const std::string& value, std::vector<SlideRef>& slides, std::string& error) {
    for (const auto& rawItem : splitString(value, ',')) {
        std::string item = trimCopy(rawItem);
        if (item.empty()) {
            continue;
        }
        SlideRef ref;
        size_t at = item.find('@');
        if (at != std::string::npos) {
            double seconds = 0.0;
            if (!parseDoubleValue(item.substr(at + 1), seconds)) {
                error = "invalid slide duration in '" + item + "'";
                return false;
            }
            ref.duration_secs = seconds;
            item = item.substr(0, at);
        }
        size_t colon = item.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == item.size()) {
            error = "slide reference '" + item + "' must look like presentation:slide";
            return false;
        }
        ref.presentation_id = item.substr(0, colon);
        ref.slide_id = item.substr(colon + 1);
        slides.push_back(std::move(ref));
    }
    return true;
}

bool applyRequestJson(const nlohmann::json& request, Arguments& args, std::string& error) {
    if (!request.is_object()) {
        error = "request must be a JSON object";
        return false;
    }

    try {
        for (auto it = request.begin(); it != request.end(); ++it) {
            const std::string& key = it.key();
            const nlohmann::json& value = it.value();
            RenderOptions& o = args.options;

            if (key == "formats") {
                args.formats.clear();
                for (const auto& tag : value) {
                    args.formats.push_back(parseExportFormat(tag.get<std::string>()));
                }
            } else if (key == "presentations") {
                args.presentation_ids = value.get<std::vector<std::string>>();
            } else if (key == "folders") {
                args.folder_ids = value.get<std::vector<std::string>>();
            } else if (key == "slides") {
                args.explicit_slides.clear();
                for (const auto& item : value) {
                    if (item.is_string()) {
                        if (!parseSlideList(item.get<std::string>(), args.explicit_slides, error)) {
                            return false;
                        }
                    } else {
                        SlideRef ref;
                        ref.presentation_id = item.at("presentation").get<std::string>();
                        ref.slide_id = item.at("slide").get<std::string>();
                        if (item.contains("duration")) {
                            ref.duration_secs = item["duration"].get<double>();
                        }
                        args.explicit_slides.push_back(std::move(ref));
                    }
                }
            } else if (key == "name") {
                args.explicit_name = value.get<std::string>();
            } else if (key == "width") {
                o.width = value.get<int>();
            } else if (key == "height") {
                o.height = value.get<int>();
            } else if (key == "dpi") {
                o.dpi = value.get<float>();
            } else if (key == "video_width") {
                o.video_width = value.get<int>();
            } else if (key == "video_height") {
                o.video_height = value.get<int>();
            } else if (key == "fps") {
                o.fps = value.get<double>();
            } else if (key == "duration") {
                o.slide_duration_secs = value.get<double>();
            } else if (key == "total_duration") {
                o.total_video_duration_secs = value.get<double>();
            } else if (key == "jpeg_quality") {
                o.jpeg_quality = value.get<int>();
            } else if (key == "fill") {
                if (!parseColor(value.get<std::string>(), o.fill_color)) {
                    error = "invalid fill color";
                    return false;
                }
            } else if (key == "naming") {
                o.naming = parseNamingScheme(value.get<std::string>());
            } else if (key == "codec") {
                o.video_codec = value.get<std::string>();
            } else if (key == "codec_options") {
                o.codec_options.clear();
                for (auto opt = value.begin(); opt != value.end(); ++opt) {
                    o.codec_options.emplace_back(opt.key(), opt.value().get<std::string>());
                }
            } else if (key == "fetch_workers") {
                args.fetch_workers = value.get<size_t>();
            } else if (key == "render_workers") {
                args.render_workers = value.get<size_t>();
            } else if (key == "presentation_workers") {
                args.presentation_workers = value.get<size_t>();
            } else if (key == "retries") {
                args.retries = value.get<int>();
            } else if (key == "timeout_ms") {
                args.timeout_ms = value.get<int>();
            } else if (key == "max_depth") {
                args.max_depth = value.get<int>();
            } else if (key == "cache_index") {
                args.cache_index = value.get<std::string>();
            } else if (key == "library") {
                args.library_dir = value.get<std::string>();
            } else if (key == "output") {
                args.output_dir = value.get<std::string>();
            } else {
                error = "unknown request key '" + key + "'";
                return false;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("bad request value: ") + e.what();
        return false;
    } catch (const InvalidRequestError& e) {
        error = e.what();
        return false;
    }
    return true;
}

int parseArguments(int argc, char* argv[], Arguments& args) {
    std::vector<std::string> positionals;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // Options that take a value
        auto takeValue = [&](std::string& out) -> bool {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            LOG_CERR("Error: " << arg << " requires a value");
            return false;
        };
        std::string value;
        RenderOptions& o = args.options;

        if (arg == "--png") {
            args.formats.push_back(ExportFormat::kPng);
        } else if (arg == "--jpeg" || arg == "--jpg") {
            args.formats.push_back(ExportFormat::kJpeg);
        } else if (arg == "--svg") {
            args.formats.push_back(ExportFormat::kSvg);
        } else if (arg == "--json") {
            args.formats.push_back(ExportFormat::kJson);
        } else if (arg == "--mp4") {
            args.formats.push_back(ExportFormat::kMp4);
        } else if (arg == "--debug") {
            args.debug_mode = true;
        } else if (arg == "--quiet") {
            args.quiet_mode = true;
        } else if (arg == "--version") {
            LOG_COUT("slidecast " << getSlidecastVersion());
            return 2;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 2;
        } else if (arg == "--presentation") {
            if (!takeValue(value)) return 1;
            args.presentation_ids.push_back(value);
        } else if (arg == "--folder") {
            if (!takeValue(value)) return 1;
            args.folder_ids.push_back(value);
        } else if (arg == "--slides") {
            if (!takeValue(value)) return 1;
            std::string error;
            if (!parseSlideList(value, args.explicit_slides, error)) {
                LOG_CERR("Error: " << error);
                return 1;
            }
        } else if (arg == "--name") {
            if (!takeValue(args.explicit_name)) return 1;
        } else if (arg == "--width" || arg == "--height" || arg == "--video-width" || arg == "--video-height" ||
                   arg == "--jpeg-quality" || arg == "--retries" || arg == "--timeout-ms" || arg == "--max-depth") {
            if (!takeValue(value)) return 1;
            int number = 0;
            if (!parseIntValue(value, number)) {
                LOG_CERR("Error: Invalid " << arg << " value: " << value);
                return 1;
            }
            if (arg == "--width") o.width = number;
            else if (arg == "--height") o.height = number;
            else if (arg == "--video-width") o.video_width = number;
            else if (arg == "--video-height") o.video_height = number;
            else if (arg == "--jpeg-quality") o.jpeg_quality = number;
            else if (arg == "--retries") args.retries = number;
            else if (arg == "--timeout-ms") args.timeout_ms = number;
            else args.max_depth = number;
        } else if (arg == "--dpi" || arg == "--fps" || arg == "--duration" || arg == "--total-duration") {
            if (!takeValue(value)) return 1;
            double number = 0.0;
            if (!parseDoubleValue(value, number)) {
                LOG_CERR("Error: Invalid " << arg << " value: " << value);
                return 1;
            }
            if (arg == "--dpi") o.dpi = static_cast<float>(number);
            else if (arg == "--fps") o.fps = number;
            else if (arg == "--duration") o.slide_duration_secs = number;
            else o.total_video_duration_secs = number;
        } else if (arg == "--fetch-workers" || arg == "--render-workers" || arg == "--presentation-workers") {
            if (!takeValue(value)) return 1;
            size_t count = 0;
            if (!parseWorkerCount(value, count)) {
                LOG_CERR("Error: Invalid " << arg << " value: " << value);
                return 1;
            }
            if (arg == "--fetch-workers") args.fetch_workers = count;
            else if (arg == "--render-workers") args.render_workers = count;
            else args.presentation_workers = count;
        } else if (arg == "--fill") {
            if (!takeValue(value)) return 1;
            if (!parseColor(value, o.fill_color)) {
                LOG_CERR("Error: Invalid --fill color (expected #RRGGBB or #AARRGGBB): " << value);
                return 1;
            }
        } else if (arg == "--naming") {
            if (!takeValue(value)) return 1;
            try {
                o.naming = parseNamingScheme(value);
            } catch (const InvalidRequestError& e) {
                LOG_CERR("Error: " << e.what());
                return 1;
            }
        } else if (arg == "--codec") {
            if (!takeValue(o.video_codec)) return 1;
        } else if (arg == "--codec-option") {
            if (!takeValue(value)) return 1;
            std::pair<std::string, std::string> option;
            if (!parseCodecOption(value, option)) {
                LOG_CERR("Error: --codec-option expects key=value, got: " << value);
                return 1;
            }
            o.codec_options.push_back(std::move(option));
        } else if (arg == "--request") {
            if (!takeValue(value)) return 1;
            std::string error;
            if (!loadRequestFile(value, args, error)) {
                LOG_CERR("Error: " << error);
                return 1;
            }
        } else if (arg == "--cache-index") {
            if (!takeValue(args.cache_index)) return 1;
        } else if (arg.empty() || arg[0] != '-') {
            positionals.push_back(arg);
        } else {
            LOG_CERR("Error: Unknown option: " << arg);
            LOG_CERR("Use --help for usage information.");
            return 1;
        }
    }

    if (positionals.size() > 2) {
        LOG_CERR("Error: Unexpected argument: " << positionals[2]);
        return 1;
    }
    if (positionals.size() >= 1) args.library_dir = positionals[0];
    if (positionals.size() >= 2) args.output_dir = positionals[1];

    // Validate arguments
    if (args.formats.empty()) {
        LOG_CERR("Error: At least one of --png, --jpeg, --svg, --json or --mp4 must be specified.");
        LOG_CERR("Use --help for usage information.");
        return 1;
    }
    if (args.presentation_ids.empty() && args.folder_ids.empty() && args.explicit_slides.empty()) {
        LOG_CERR("Error: Nothing to export; use --presentation, --folder or --slides.");
        return 1;
    }
    if (args.retries < 1) {
        LOG_CERR("Error: --retries must be at least 1");
        return 1;
    }
    if (args.timeout_ms <= 0) {
        LOG_CERR("Error: --timeout-ms must be positive");
        return 1;
    }
    if (args.library_dir.empty() || args.output_dir.empty()) {
        LOG_CERR("Error: Missing library directory or output directory.");
        printUsage(argv[0]);
        return 1;
    }

    std::filesystem::path library_path(args.library_dir);
    if (!std::filesystem::is_directory(library_path)) {
        LOG_CERR("Error: Library directory does not exist: " << args.library_dir);
        return 1;
    }

    // Create output directory if it doesn't exist
    std::filesystem::path output_path(args.output_dir);
    if (!std::filesystem::exists(output_path)) {
        std::error_code ec;
        if (!std::filesystem::create_directories(output_path, ec)) {
            LOG_CERR("Error: Could not create output directory: " << args.output_dir);
            LOG_CERR("  " << ec.message());
            return 1;
        }
        LOG_DEBUG("Created output directory: " << args.output_dir);
    } else if (!std::filesystem::is_directory(output_path)) {
        LOG_CERR("Error: Output path exists but is not a directory: " << args.output_dir);
        return 1;
    }

    if (args.cache_index.empty()) {
        args.cache_index = (output_path / ".slidecast-cache.json").string();
    }
    return 0;
}
