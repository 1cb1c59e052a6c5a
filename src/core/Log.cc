#include "chroma/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <string>

namespace chroma::log {

namespace {
quill::Logger* g_logger = nullptr;

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "ChromaLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);
}

} // namespace

void init() {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");

    g_logger = quill::Frontend::create_or_get_logger("chroma", console_sink, makePattern());
    g_logger->set_log_level(quill::LogLevel::Info);
}

void init(const char* log_file_path) {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto file_sink = quill::Frontend::create_or_get_sink<quill::FileSink>(log_file_path, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        return cfg;
    }());

    // Root logger: console + caller file
    g_logger = quill::Frontend::create_or_get_logger("chroma", {console_sink, file_sink}, makePattern());
    g_logger->set_log_level(quill::LogLevel::Info);
}

void shutdown() {
    if (g_logger) {
        g_logger->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    if (!g_logger) {
        // Library callers that never called init() get console output
        init();
    }
    return g_logger;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

std::optional<quill::LogLevel> parseLevel(std::string_view name) {
    if (name == "trace")
        return quill::LogLevel::TraceL1;
    if (name == "debug")
        return quill::LogLevel::Debug;
    if (name == "info")
        return quill::LogLevel::Info;
    if (name == "warning")
        return quill::LogLevel::Warning;
    if (name == "error")
        return quill::LogLevel::Error;
    if (name == "critical")
        return quill::LogLevel::Critical;
    return std::nullopt;
}

} // namespace chroma::log
