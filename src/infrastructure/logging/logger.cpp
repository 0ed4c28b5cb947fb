// EN: Implementation of the Logger class. Provides thread-safe NDJSON logging with correlation IDs.
// FR: Implémentation de la classe Logger. Fournit un logging NDJSON thread-safe avec IDs de corrélation.

#include "infrastructure/logging/logger.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

namespace DTP {

LogLevel parseLogLevel(const std::string& level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;

    throw ValidationError("Unknown log level '" + level + "' (expected debug, info, warn or error)");
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

// EN: Get the singleton logger instance.
// FR: Obtient l'instance singleton du logger.
Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : console_stream_(&std::cout) {}

// EN: Destructor ensures all logs are flushed.
// FR: Le destructeur assure que tous les logs sont vidés.
Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

// EN: Set output file and disable console output.
// FR: Définit le fichier de sortie et désactive la sortie console.
void Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->close();
    }
    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!log_file_->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        log_file_.reset();
    } else {
        console_output_ = false;
    }
}

void Logger::resetConsoleStream() {
    setConsoleStream(std::cout);
}

void Logger::setConsoleStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_stream_ = &stream;
    console_output_ = true;
    if (log_file_) {
        log_file_->close();
        log_file_.reset();
    }
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

void Logger::clearGlobalMetadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_.clear();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    log(level, module, message, {});
}

// EN: Log message with specified level and metadata.
// FR: Enregistre un message avec le niveau spécifié et des métadonnées.
void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const std::unordered_map<std::string, std::string>& metadata) {
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) {
            return;
        }
        entry.correlation_id = correlation_id_;
        entry.metadata = metadata;

        // EN: Merge global metadata, preserving entry-specific metadata.
        // FR: Fusionne les métadonnées globales, préservant les métadonnées spécifiques à l'entrée.
        for (const auto& [key, value] : global_metadata_) {
            entry.metadata.emplace(key, value);
        }
    }

    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.module = module;
    entry.thread_id = getThreadId();

    writeEntry(entry);
}

void Logger::debug(const std::string& module, const std::string& message) {
    log(LogLevel::DEBUG, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
    log(LogLevel::INFO, module, message);
}

void Logger::warn(const std::string& module, const std::string& message) {
    log(LogLevel::WARN, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
    log(LogLevel::ERROR, module, message);
}

void Logger::debug(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::DEBUG, module, message, metadata);
}

void Logger::info(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::INFO, module, message, metadata);
}

void Logger::warn(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::WARN, module, message, metadata);
}

void Logger::error(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::ERROR, module, message, metadata);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
    }
    if (console_output_ && console_stream_) {
        console_stream_->flush();
    }
}

// EN: Generate a UUID-like correlation ID for tracing one CLI invocation.
// FR: Génère un ID de corrélation similaire à UUID pour tracer une invocation CLI.
std::string Logger::generateCorrelationId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << "-";
        }
        ss << dis(gen);
    }
    return ss.str();
}

void Logger::writeEntry(const LogEntry& entry) {
    std::string ndjson = formatAsNDJSON(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_ && log_file_->is_open()) {
        *log_file_ << ndjson << '\n';
    }

    if (console_output_ && console_stream_) {
        *console_stream_ << ndjson << std::endl;
    }
}

// EN: Metadata keys never override the fixed fields.
// FR: Les clés de métadonnées n'écrasent jamais les champs fixes.
std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    nlohmann::json line;
    line["timestamp"] = timestampToISO8601(entry.timestamp);
    line["level"] = logLevelToString(entry.level);
    line["message"] = entry.message;
    line["module"] = entry.module;
    line["thread_id"] = entry.thread_id;

    if (!entry.correlation_id.empty()) {
        line["correlation_id"] = entry.correlation_id;
    }

    for (const auto& [key, value] : entry.metadata) {
        if (!line.contains(key)) {
            line[key] = value;
        }
    }

    // EN: Invalid UTF-8 (user specs, file contents) is replaced by U+FFFD instead of throwing
    // FR: L'UTF-8 invalide (specs utilisateur, contenu de fichiers) est remplacé par U+FFFD au lieu de lever
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::timestampToISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

std::string Logger::getThreadId() {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

} // namespace DTP
