#include "ssh_session.hpp"
#include "transfer_api.hpp"
#include "transfer_logger.hpp"
#include <csignal>
#include <iostream>

volatile std::sig_atomic_t gCancelFlag = 0;

void signalHandler(int /*sig*/) {
    gCancelFlag = 1;
}

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <file>] [--path <remote path>] [--verbose] [--no-cleanup] [--report-json <file>]"
              << std::endl;
}

void printSummary(const TransferReport& report) {
    if (report.success()) {
        std::cout << "Transfer completed successfully." << std::endl;
        std::cout << "  Files:       " << report.fileCount() << std::endl;
        std::cout << "  Directories: " << report.directoryCount() << std::endl;
        std::cout << "  Size:        " << formatDecimal(report.totalSizeBytes() / (1024.0 * 1024.0)) << " MB" << std::endl;
        std::cout << "  Duration:    " << formatDecimal(report.durationSeconds()) << " s" << std::endl;
        std::cout << "  Speed:       " << formatDecimal(report.averageSpeedMBps()) << " MB/s" << std::endl;
    } else {
        std::cerr << "Transfer failed:" << std::endl;
        for (const auto& error : report.errors()) {
            std::cerr << "  - " << error << std::endl;
        }
    }
    for (const auto& warning : report.warnings()) {
        std::cerr << "  warning: " << warning << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "siterelay.json";
    Json::Value overrides(Json::objectValue);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--path" && i + 1 < argc) {
            overrides["path"] = argv[++i];
        } else if (arg == "--verbose") {
            overrides["verbose"] = true;
        } else if (arg == "--no-cleanup") {
            overrides["cleanup_temp_files"] = false;
        } else if (arg == "--report-json" && i + 1 < argc) {
            overrides["report"]["json"] = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto config = TransferAPI::loadConfig(configFile, overrides);
    if (!config) {
        std::cerr << "Error: " << config.error() << std::endl;
        return 1;
    }

    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    TransferLogger logger(config->logFile, config->verbose ? LogLevel::Debug : LogLevel::Info);
    ConsoleProgressObserver progress;

    auto report = TransferAPI::startTransfer(*config, SshSession::connector(config->connectTimeout), logger,
                                             &progress, [] { return gCancelFlag != 0; });
    if (!report) {
        logger.error(report.error());
        return 1;
    }

    auto saved = TransferAPI::saveReports(*report, *config);
    if (!saved) {
        logger.error("Failed to save transfer report: " + saved.error());
    }

    printSummary(*report);
    return report->success() ? 0 : 1;
}
