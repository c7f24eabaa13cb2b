#include "pktlib/utils/log_config.hpp"
#include "pktlib/utils/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>
#include <system_error>

namespace pktlib::utils {

namespace {

std::string level_label(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRIT";
        default: return "OFF";
    }
}

std::tm to_local_tm(const std::chrono::system_clock::time_point& tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

// UnifiedLogFormatter
UnifiedLogFormatter::UnifiedLogFormatter() : config_{} {}
UnifiedLogFormatter::UnifiedLogFormatter(const FormatConfig& config) : config_(config) {}

std::string UnifiedLogFormatter::format_timestamp(const std::chrono::system_clock::time_point& tp) const {
    std::tm tm = to_local_tm(tp);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), config_.timestamp_format.c_str(), &tm);
    return std::string(buf, n);
}

std::string UnifiedLogFormatter::format_metadata(const std::unordered_map<std::string, std::string>& md) const {
    if (!config_.include_metadata || md.empty()) return "";
    // unordered_map の順序に依存しないようキーでソート
    std::vector<std::pair<std::string, std::string>> items(md.begin(), md.end());
    std::sort(items.begin(), items.end());
    std::ostringstream ss;
    ss << '[';
    bool first = true;
    for (const auto& [k, v] : items) {
        if (!first) ss << ',';
        first = false;
        ss << k << '=' << v;
    }
    ss << ']';
    return ss.str();
}

std::string UnifiedLogFormatter::format(const LogEntry& e) const {
    std::ostringstream ss;
    ss << format_timestamp(e.timestamp) << config_.field_separator << level_label(e.level)
       << config_.field_separator << e.logger_name;
    if (config_.include_file_info && !e.file.empty()) {
        ss << config_.field_separator << std::filesystem::path(e.file).filename().string() << ':' << e.line;
    }
    ss << config_.field_separator << e.message;
    auto md = format_metadata(e.metadata);
    if (!md.empty()) ss << config_.field_separator << md;
    return ss.str();
}

// LogSink
void LogSink::set_formatter(std::shared_ptr<const UnifiedLogFormatter> formatter) {
    if (formatter) formatter_ = std::move(formatter);
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(bool use_colors) : ConsoleLogSink(std::cerr, use_colors) {}
ConsoleLogSink::ConsoleLogSink(std::ostream& out, bool use_colors) : out_(out), use_colors_(use_colors) {}

std::string ConsoleLogSink::colorize(LogLevel level, const std::string& text) const {
    if (!use_colors_) return text;
    const char* c = "\033[0m";
    switch (level) {
        case LogLevel::Trace: c = "\033[37m"; break;
        case LogLevel::Debug: c = "\033[36m"; break;
        case LogLevel::Info: c = "\033[32m"; break;
        case LogLevel::Warning: c = "\033[33m"; break;
        case LogLevel::Error: c = "\033[31m"; break;
        case LogLevel::Critical: c = "\033[35m"; break;
        default: break;
    }
    return std::string(c) + text + "\033[0m";
}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::string line = formatter_->format(entry);
    std::lock_guard<std::mutex> lk(console_mutex_);
    out_ << colorize(entry.level, line) << '\n';
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lk(console_mutex_);
    out_.flush();
}

// FileLogSink
FileLogSink::FileLogSink(const std::filesystem::path& file_path, size_t max_file_size, size_t max_files)
    : file_path_(file_path), max_file_size_(max_file_size), max_files_(max_files) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path_, ec);
    if (!ec) current_file_size_ = static_cast<size_t>(size);
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::app);
}

FileLogSink::~FileLogSink() { close(); }

bool FileLogSink::is_open() const {
    std::lock_guard<std::mutex> lk(file_mutex_);
    return file_stream_ && file_stream_->is_open();
}

void FileLogSink::write(const LogEntry& entry) {
    std::string line = formatter_->format(entry);
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (!file_stream_ || !file_stream_->is_open()) return;
    (*file_stream_) << line << '\n';
    current_file_size_ += line.size() + 1;
    if (max_file_size_ && current_file_size_ > max_file_size_) rotate_file();
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_) file_stream_->flush();
}

void FileLogSink::close() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
        file_stream_->close();
    }
}

void FileLogSink::rotate_file() {
    file_stream_->close();
    std::error_code ec;
    if (max_files_ > 0) {
        // app.log.N-1 -> app.log.N, ..., app.log -> app.log.1
        for (size_t i = max_files_ - 1; i-- > 0;) {
            auto src = get_rotated_file_path(i);
            if (!std::filesystem::exists(src, ec)) continue;
            auto dst = get_rotated_file_path(i + 1);
            std::filesystem::remove(dst, ec);
            std::filesystem::rename(src, dst, ec);
        }
        std::filesystem::remove(get_rotated_file_path(0), ec);
        std::filesystem::rename(file_path_, get_rotated_file_path(0), ec);
    }
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::trunc);
    current_file_size_ = 0;
}

std::filesystem::path FileLogSink::get_rotated_file_path(size_t index) const {
    auto p = file_path_;
    p += "." + std::to_string(index + 1);
    return p;
}

// Logger
Logger::Logger(const std::string& name) : name_(name), min_level_(LogLevel::Info) {}

void Logger::add_sink(std::shared_ptr<LogSink> s) {
    if (!s) return;
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.push_back(std::move(s));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& s) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), s), sinks_.end());
}

size_t Logger::sink_count() const {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    return sinks_.size();
}

void Logger::set_level(LogLevel l) { min_level_.store(l, std::memory_order_relaxed); }
LogLevel Logger::get_level() const { return min_level_.load(std::memory_order_relaxed); }

void Logger::write_to_sinks(const LogEntry& e) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    for (auto& s : sinks_) {
        if (e.level >= s->get_min_level()) s->write(e);
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line) {
    log_with_metadata(level, message, {}, file, line);
}

void Logger::log_with_metadata(LogLevel level, const std::string& message,
                               const std::unordered_map<std::string, std::string>& metadata,
                               const std::string& file, int line) {
    if (level == LogLevel::Off || level < get_level()) return;
    LogEntry e{level, name_, message, std::chrono::system_clock::now(), file, line, metadata};
    write_to_sinks(e);
}

void Logger::trace(const std::string& m, const std::string& f, int l) { log(LogLevel::Trace, m, f, l); }
void Logger::debug(const std::string& m, const std::string& f, int l) { log(LogLevel::Debug, m, f, l); }
void Logger::info(const std::string& m, const std::string& f, int l) { log(LogLevel::Info, m, f, l); }
void Logger::warning(const std::string& m, const std::string& f, int l) { log(LogLevel::Warning, m, f, l); }
void Logger::error(const std::string& m, const std::string& f, int l) { log(LogLevel::Error, m, f, l); }
void Logger::critical(const std::string& m, const std::string& f, int l) { log(LogLevel::Critical, m, f, l); }

void Logger::flush() {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    for (auto& s : sinks_) s->flush();
}

// LogManager
LogManager& LogManager::instance() {
    static LogManager inst;
    return inst;
}

LogManager::~LogManager() { shutdown(); }

std::shared_ptr<Logger> LogManager::get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) return it->second;
    auto l = std::make_shared<Logger>(name);
    l->set_level(global_level_);
    for (auto& s : global_sinks_) l->add_sink(s);
    loggers_[name] = l;
    return l;
}

void LogManager::clear_loggers() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    loggers_.clear();
}

void LogManager::set_global_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    global_level_ = l;
    for (auto& [n, logger] : loggers_) logger->set_level(l);
}

void LogManager::add_global_sink(std::shared_ptr<LogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    global_sinks_.push_back(sink);
    for (auto& [n, logger] : loggers_) logger->add_sink(sink);
}

void LogManager::clear_global_sinks() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& s : global_sinks_) {
        for (auto& [n, logger] : loggers_) logger->remove_sink(s);
    }
    global_sinks_.clear();
}

void LogManager::flush_all() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, l] : loggers_) l->flush();
}

void LogManager::shutdown() { flush_all(); }

// log_utils
LogLevel log_utils::parse_log_level(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "trace") return LogLevel::Trace;
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warning;
    if (v == "error") return LogLevel::Error;
    if (v == "critical" || v == "fatal") return LogLevel::Critical;
    if (v == "off") return LogLevel::Off;
    return LogLevel::Info;
}

std::string log_utils::log_level_to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        default: return "off";
    }
}

void log_utils::setup_basic_logging(LogLevel level, bool log_to_console, const std::filesystem::path& log_file) {
    auto& mgr = LogManager::instance();
    mgr.clear_global_sinks();
    mgr.set_global_level(level);

    UnifiedLogFormatter::FormatConfig fc;
    fc.include_file_info = level <= LogLevel::Debug;
    auto formatter = std::make_shared<UnifiedLogFormatter>(fc);

    if (log_to_console) {
        auto sink = std::make_shared<ConsoleLogSink>(false);
        sink->set_formatter(formatter);
        mgr.add_global_sink(sink);
    }
    if (!log_file.empty()) {
        auto sink = std::make_shared<FileLogSink>(log_file);
        sink->set_formatter(formatter);
        mgr.add_global_sink(sink);
    }
}

void log_utils::setup_logging_from_config(const ConfigLoader& config) {
    setup_basic_logging(parse_log_level(config.get_string("log.level", "info")),
                        true,
                        config.get_string("log.file"));
}

} // namespace pktlib::utils
