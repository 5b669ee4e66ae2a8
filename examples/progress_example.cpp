// EN: Example collaborator - a page loop reporting through a weighted emitter tree.
// FR: Exemple de collaborateur - une boucle de pages qui rapporte via un arbre d'émetteurs pondérés.

#include "infrastructure/config/progress_config.hpp"
#include "infrastructure/logging/logger.hpp"
#include "progress/progress_reporting.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace AFP;
using namespace AFP::Progress;

namespace {

void printUsage() {
    std::cout << "Usage: progress_example [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --pages N         Number of pages to simulate (default 20)" << std::endl;
    std::cout << "  --progress        Show a progress bar (or throttled log lines when not a terminal)" << std::endl;
    std::cout << "  --verbose         Same as --progress, plus debug logging" << std::endl;
    std::cout << "  --config FILE     YAML file with a 'progress:' section" << std::endl;
    std::cout << "  --fail-at N       Abort after page N to show early-exit cleanup" << std::endl;
    std::cout << "  --legacy          Also report through an old-style (current, total) callback" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::getInstance();
    logger.setCorrelationId(logger.generateCorrelationId());

    ReportingOptions options;
    int64_t pages = 20;
    int64_t fail_at = -1;
    bool legacy = false;
    std::string config_file;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--progress") {
            options.progress = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--legacy") {
            legacy = true;
        } else if ((arg == "--pages" || arg == "--fail-at") && i + 1 < argc) {
            try {
                (arg == "--pages" ? pages : fail_at) = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid number for " << arg << ": " << argv[i] << std::endl;
                return 2;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return 2;
        }
    }

    ProgressConfig config;
    if (!config_file.empty() && !config.loadFromFile(config_file)) {
        return 1;
    }
    config.loadEnvironmentOverrides();

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            LOG_ERROR("progress_example", error);
        }
        return 1;
    }

    const ProgressSettings& settings = config.getSettings();
    logger.setLogLevel(options.verbose ? LogLevel::DEBUG : settings.log_level);

    try {
        // EN: One root per top-level operation, one weighted child per phase
        // FR: Une racine par opération, un enfant pondéré par phase
        ProgressEmitter root(pages, std::string("Extracting document"), settings.throttle_interval);
        attachReporter(root, options, settings);
        if (legacy) {
            adaptLegacyCallback(root, [](int64_t current, std::optional<int64_t> total) {
                LOG_DEBUG_META("legacy_callback", "progress",
                               (Logger::Metadata{{"current", std::to_string(current)},
                                                 {"total", total ? std::to_string(*total) : "none"}}));
            });
        }

        ProgressScope scope(root);
        ProgressEmitter& text_phase = root.createChild(pages, 0.7, std::string("Page text"));
        ProgressEmitter& image_phase = root.createChild(std::nullopt, 0.3, std::string("Image descriptions"));

        for (int64_t page = 1; page <= pages; ++page) {
            if (page == fail_at) {
                scope.fail("simulated failure on page " + std::to_string(page));
                LOG_ERROR("progress_example", "Aborting at page " + std::to_string(page));
                return 1;
            }
            text_phase.setMetadata("page", page);
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            text_phase.update(1);
        }
        text_phase.complete();

        // EN: Image count is only known after the text pass
        // FR: Le nombre d'images n'est connu qu'après le passage texte
        const int64_t images = pages / 4;
        image_phase.updateTotal(images);
        for (int64_t image = 0; image < images; ++image) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            image_phase.update(1);
        }
        image_phase.complete();
        root.complete();

    } catch (const std::invalid_argument& e) {
        LOG_ERROR("progress_example", e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
