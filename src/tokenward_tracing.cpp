#include "tokenward_tracing.hpp"
#include "oauth2_error.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iomanip>

namespace tokenward {

namespace {

const char* TRACE_FILE_NAME = "tokenward_trace.log";

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool IsTruthy(const std::string& value) {
    auto lower = ToLower(value);
    return lower == "1" || lower == "true" || lower == "on" || lower == "yes";
}

} // namespace

TraceLevel TraceLevelFromString(const std::string& level_str) {
    auto upper = ToUpper(level_str);
    if (upper == "NONE") {
        return TraceLevel::NONE;
    } else if (upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (upper == "WARN") {
        return TraceLevel::WARN;
    } else if (upper == "INFO") {
        return TraceLevel::INFO;
    } else if (upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (upper == "TRACE") {
        return TraceLevel::TRACE;
    }
    throw OAuthError(OAuthErrorKind::CONFIGURATION,
                     "Invalid trace level: " + level_str + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string TraceLevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

std::string TruncateSecret(const std::string& secret, size_t visible) {
    if (secret.size() <= visible) {
        return std::string(secret.size(), '*');
    }
    return secret.substr(0, visible) + "...";
}

TokenwardTracer& TokenwardTracer::Instance() {
    static TokenwardTracer instance;
    return instance;
}

void TokenwardTracer::SetEnabled(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    this->enabled = enabled;

    if (enabled && !trace_file && output_mode != "console") {
        OpenTraceFile();
    } else if (!enabled && trace_file) {
        if (trace_file->is_open()) {
            trace_file->close();
        }
        trace_file.reset();
    }
}

void TokenwardTracer::SetLevel(TraceLevel level) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    this->level = level;
    Info("TRACER", "Trace level set to: " + TraceLevelToString(level));
}

void TokenwardTracer::SetTraceDirectory(const std::string& directory) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    trace_directory = directory;

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "Failed to create trace directory: " << directory << " (" << ec.message() << ")" << std::endl;
    }

    if (trace_file) {
        trace_file.reset();
        OpenTraceFile();
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void TokenwardTracer::SetOutputMode(const std::string& output_mode) {
    auto mode = ToLower(output_mode);
    if (mode != "console" && mode != "file" && mode != "both") {
        throw OAuthError(OAuthErrorKind::CONFIGURATION,
                         "Invalid trace output: " + output_mode + ". Valid outputs are: console, file, both");
    }

    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    this->output_mode = mode;
    if (enabled && mode != "console" && !trace_file) {
        OpenTraceFile();
    }
    Info("TRACER", "Trace output mode set to: " + mode);
}

void TokenwardTracer::SetMaxFileSize(int64_t max_size) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    max_file_size = max_size;
}

void TokenwardTracer::SetRotation(bool rotation) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);
    rotation_enabled = rotation;
}

void TokenwardTracer::ConfigureFromEnvironment() {
    if (const char* dir = std::getenv("TOKENWARD_TRACE_DIR")) {
        SetTraceDirectory(dir);
    }
    if (const char* output = std::getenv("TOKENWARD_TRACE_OUTPUT")) {
        SetOutputMode(output);
    }
    if (const char* level_str = std::getenv("TOKENWARD_TRACE_LEVEL")) {
        SetLevel(TraceLevelFromString(level_str));
    }
    if (const char* flag = std::getenv("TOKENWARD_TRACE")) {
        SetEnabled(IsTruthy(flag));
    }
}

void TokenwardTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    Trace(msg_level, component, message, std::string());
}

void TokenwardTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!enabled || msg_level > level || msg_level == TraceLevel::NONE) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += TraceLevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    Emit(log_message);
}

void TokenwardTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void TokenwardTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void TokenwardTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void TokenwardTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void TokenwardTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void TokenwardTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void TokenwardTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void TokenwardTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void TokenwardTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void TokenwardTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void TokenwardTracer::Emit(const std::string& message) {
    std::lock_guard<std::recursive_mutex> lock(trace_mutex);

    if (output_mode == "console" || output_mode == "both") {
        // stderr keeps stdout free for the URLs and user codes shown to the user
        std::cerr << message << std::endl;
    }

    if (output_mode == "file" || output_mode == "both") {
        RotateIfNeeded();
        if (trace_file && trace_file->is_open()) {
            *trace_file << message << std::endl;
            trace_file->flush();
        }
    }
}

void TokenwardTracer::OpenTraceFile() {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;

    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path.string() << std::endl;
    }
}

void TokenwardTracer::RotateIfNeeded() {
    if (!rotation_enabled || max_file_size <= 0 || !trace_file) {
        return;
    }

    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;

    std::error_code ec;
    auto size = std::filesystem::file_size(trace_path, ec);
    if (ec || static_cast<int64_t>(size) < max_file_size) {
        return;
    }

    trace_file.reset();
    auto rotated = trace_path;
    rotated += ".1";
    std::filesystem::rename(trace_path, rotated, ec);
    OpenTraceFile();
}

std::string TokenwardTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif

    std::ostringstream timestamp;
    timestamp << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count();
    return timestamp.str();
}

} // namespace tokenward
