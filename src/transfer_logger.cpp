#include "transfer_logger.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

TransferLogger::TransferLogger(std::string logFile, LogLevel level, bool console)
    : logFile_(std::move(logFile)), level_(level), console_(console) {}

void TransferLogger::debug(const std::string& message) const {
    write(LogLevel::Debug, message);
}

void TransferLogger::info(const std::string& message) const {
    write(LogLevel::Info, message);
}

void TransferLogger::warning(const std::string& message) const {
    write(LogLevel::Warning, message);
}

void TransferLogger::error(const std::string& message) const {
    write(LogLevel::Error, message);
}

void TransferLogger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

std::string TransferLogger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

void TransferLogger::write(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    std::string logEntry = std::string("[") + timeBuf + "] " + levelName(level) + " " + message;

    if (console_) {
        if (level >= LogLevel::Warning) {
            std::cerr << logEntry << std::endl;
        } else {
            std::cout << logEntry << std::endl;
        }
    }

    if (logFile_.empty()) {
        return;
    }

    std::error_code ec;
    fs::path logPath(logFile_);
    if (logPath.has_parent_path()) {
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(logFile_, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else if (console_) {
        std::cerr << "Error: Cannot write to log file: " << logFile_ << std::endl;
    }
}

void ConsoleProgressObserver::onProgress(const ProgressSample& sample) {
    std::cout << "\r" << formatSample(sample) << "   " << std::flush;
    lineOpen_ = true;
}

void ConsoleProgressObserver::onFinished() {
    if (lineOpen_) {
        std::cout << std::endl;
        lineOpen_ = false;
    }
}

std::string ConsoleProgressObserver::formatSample(const ProgressSample& sample) {
    auto percent = static_cast<long>(std::lround(sample.fractionComplete * 100.0));
    std::string line = "Download Progress: " + std::to_string(percent) + "% (" + sample.sizeToken + ") @ " +
                       sample.rateToken + " - ";
    line += sample.etaToken ? "eta " + *sample.etaToken : std::string("calculating...");
    return line;
}
