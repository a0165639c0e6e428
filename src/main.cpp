
// Export presentations from a slide library to PNG, JPEG, SVG, JSON and MP4
// Results are cached by options key; re-running an unchanged export fetches nothing
// Usage: slidecast [--png] [--mp4] ... --folder root <library-dir> <output-dir>

#include "utils/logging.h"
#include "utils/crash_handler.h"
#include "core/argument_parser.h"
#include "core/cancellation.h"
#include "core/folder_exporter.h"
#include "core/local_source.h"
#include "core/presentation_exporter.h"
#include "core/result_cache.h"

int main(int argc, char* argv[]) {
    installCrashHandlers();
    installExceptionHandlers();
    installInterruptHandler();

    // Parse command-line arguments
    Arguments args;
    int parse_result = parseArguments(argc, argv, args);
    if (parse_result == 2) {
        // Help or version was shown - exit successfully
        return 0;
    }
    if (parse_result != 0) {
        return 1;
    }

    // Set global flags (affect logging behavior)
    g_debug_mode = args.debug_mode;
    g_quiet_mode = args.quiet_mode;

    LocalLibrarySource source(args.library_dir);
    std::string error;
    if (!source.load(error)) {
        LOG_CERR("Error: " << error);
        return 1;
    }

    JsonCacheStore cache(args.cache_index);
    if (!cache.load(error)) {
        LOG_CERR("[WARNING] " << error << "; starting with an empty cache");
    }

    ExporterConfig config;
    config.fetch_workers = args.fetch_workers;
    config.render_workers = args.render_workers;
    config.retry.max_attempts = args.retries;
    config.call_timeout = std::chrono::milliseconds(args.timeout_ms);

    PresentationExporter exporter(source, cache, config);
    FolderExporter folderExporter(exporter, args.presentation_workers);

    // Ctrl-C cancels outstanding work; partial results are still reported
    CancellationToken cancel;
    CancellationWatcher watcher(cancel, []() {
        if (!interruptRequested()) {
            return false;
        }
        LOG_CERR("[WARNING] Interrupted, cancelling export");
        return true;
    });

    FolderExportSpec spec;
    spec.output_root = args.output_dir;
    spec.max_depth = args.max_depth;
    spec.presentation_ids = args.presentation_ids;
    for (const auto& folderId : args.folder_ids) {
        if (folderId == kRootContainerId) {
            spec.include_root = true;
        } else {
            spec.folder_ids.push_back(folderId);
        }
    }
    if (!args.explicit_slides.empty()) {
        std::string id = args.explicit_name.empty() ? "batch" : args.explicit_name;
        spec.presentations.push_back(Presentation::explicitSlides(id, args.explicit_name, {}, args.explicit_slides));
    }

    int exit_code = 0;
    try {
        TreeExportResult result = folderExporter.exportTree(spec, args.formats, args.options, &cancel);
        for (const auto& presentation : result.presentations) {
            size_t cached = 0;
            for (const auto& artifact : presentation.artifacts) {
                if (artifact.from_cache) cached++;
            }
            LOG_COUT("[INFO] " << presentation.presentation_name << ": " << presentation.artifacts.size()
                     << " artifact(s), " << cached << " from cache, key " << presentation.options_key);
        }
        for (const auto& e : result.allErrors()) {
            LOG_CERR("[ERROR] " << describeError(e));
        }
        exit_code = result.success() ? 0 : 1;
    } catch (const InvalidRequestError& e) {
        LOG_CERR("Error: Invalid request: " << e.what());
        exit_code = 1;
    } catch (const std::exception& e) {
        LOG_CERR("Error: Export failed: " << e.what());
        exit_code = 1;
    }
    return exit_code;
}
