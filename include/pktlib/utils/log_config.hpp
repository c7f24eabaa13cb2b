#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace pktlib::utils {

class ConfigLoader;

/**
 * @brief ログレベル
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief ログエントリ
 */
struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::string logger_name;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string file;
    int line = 0;
    std::unordered_map<std::string, std::string> metadata;
};

/**
 * @brief 統一ログフォーマッター
 */
class UnifiedLogFormatter {
public:
    struct FormatConfig {
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
        bool include_file_info = false;  // "file.cpp:42" を付ける
        bool include_metadata = true;
        std::string field_separator = " | ";
    };

    UnifiedLogFormatter();
    explicit UnifiedLogFormatter(const FormatConfig& config);

    /**
     * @brief ログエントリを1行にフォーマット
     * @param entry ログエントリ
     * @return フォーマットされた文字列（改行なし）
     */
    std::string format(const LogEntry& entry) const;

private:
    // 構築後は不変なので format() はロック不要
    const FormatConfig config_;

    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp) const;
    std::string format_metadata(const std::unordered_map<std::string, std::string>& metadata) const;
};

/**
 * @brief ログシンク（出力先）
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
    virtual void close() {}

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel get_min_level() const { return min_level_.load(std::memory_order_relaxed); }

    /**
     * @brief フォーマッターを差し替え（nullptr は無視）
     *
     * 書き込みと並行して呼ばないこと。setup_basic_logging() がシンク登録前に使う。
     */
    void set_formatter(std::shared_ptr<const UnifiedLogFormatter> formatter);

protected:
    std::atomic<LogLevel> min_level_{LogLevel::Trace};
    std::shared_ptr<const UnifiedLogFormatter> formatter_ = std::make_shared<UnifiedLogFormatter>();
};

/**
 * @brief ストリームログシンク
 *
 * 既定は std::cerr（ツールの stdout 出力と混ざらないように）。
 */
class ConsoleLogSink : public LogSink {
public:
    explicit ConsoleLogSink(bool use_colors = true);
    ConsoleLogSink(std::ostream& out, bool use_colors);

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::ostream& out_;
    bool use_colors_;
    std::mutex console_mutex_;
    std::string colorize(LogLevel level, const std::string& text) const;
};

/**
 * @brief ファイルログシンク
 */
class FileLogSink : public LogSink {
public:
    /**
     * @param file_path ファイルパス
     * @param max_file_size 最大ファイルサイズ（0で無制限）
     * @param max_files ローテーションで残す世代数
     */
    explicit FileLogSink(const std::filesystem::path& file_path,
                         size_t max_file_size = 10 * 1024 * 1024,
                         size_t max_files = 5);
    ~FileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;
    void close() override;

    bool is_open() const;

private:
    std::filesystem::path file_path_;
    size_t max_file_size_;
    size_t max_files_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex file_mutex_;
    size_t current_file_size_{0};

    void rotate_file();
    std::filesystem::path get_rotated_file_path(size_t index) const;
};

/**
 * @brief ロガークラス
 */
class Logger {
public:
    explicit Logger(const std::string& name);

    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);
    size_t sink_count() const;

    void set_level(LogLevel level);
    LogLevel get_level() const;

    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    void log_with_metadata(LogLevel level, const std::string& message,
                           const std::unordered_map<std::string, std::string>& metadata,
                           const std::string& file = "", int line = 0);

    void trace(const std::string& message, const std::string& file = "", int line = 0);
    void debug(const std::string& message, const std::string& file = "", int line = 0);
    void info(const std::string& message, const std::string& file = "", int line = 0);
    void warning(const std::string& message, const std::string& file = "", int line = 0);
    void error(const std::string& message, const std::string& file = "", int line = 0);
    void critical(const std::string& message, const std::string& file = "", int line = 0);

    void flush();

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
    // set_global_level() が他スレッドのログ出力中に書き換える
    std::atomic<LogLevel> min_level_;

    void write_to_sinks(const LogEntry& entry);
};

/**
 * @brief ログマネージャー
 */
class LogManager {
public:
    static LogManager& instance();

    /**
     * @brief ロガーを取得（存在しない場合はグローバルシンク付きで作成）
     */
    std::shared_ptr<Logger> get_logger(const std::string& name);
    void clear_loggers();

    /// 既存ロガーと今後作成されるロガーの両方に適用
    void set_global_level(LogLevel level);
    void add_global_sink(std::shared_ptr<LogSink> sink);
    void clear_global_sinks();

    void flush_all();
    void shutdown();

private:
    std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
    std::mutex loggers_mutex_;
    LogLevel global_level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> global_sinks_;

    LogManager() = default;
    ~LogManager();
};

#define PKTLIB_LOG_TRACE(logger, message) \
    (logger)->trace(message, __FILE__, __LINE__)

#define PKTLIB_LOG_DEBUG(logger, message) \
    (logger)->debug(message, __FILE__, __LINE__)

#define PKTLIB_LOG_INFO(logger, message) \
    (logger)->info(message, __FILE__, __LINE__)

#define PKTLIB_LOG_WARNING(logger, message) \
    (logger)->warning(message, __FILE__, __LINE__)

#define PKTLIB_LOG_ERROR(logger, message) \
    (logger)->error(message, __FILE__, __LINE__)

#define PKTLIB_LOG_CRITICAL(logger, message) \
    (logger)->critical(message, __FILE__, __LINE__)

namespace log_utils {
    /**
     * @brief ログレベルを文字列から解析（不明な値は Info）
     */
    LogLevel parse_log_level(const std::string& level_str);

    std::string log_level_to_string(LogLevel level);

    /**
     * @brief 基本ログ設定を初期化
     *
     * level が Debug 以下ならシンクのフォーマッターに呼び出し元 "file:line" を含める。
     * @param level 最小レベル
     * @param log_to_console stderr 出力を有効化
     * @param log_file ログファイルパス（空で無効）
     */
    void setup_basic_logging(LogLevel level = LogLevel::Info,
                             bool log_to_console = true,
                             const std::filesystem::path& log_file = {});

    /**
     * @brief 設定の "log.level" / "log.file" からログを初期化
     */
    void setup_logging_from_config(const ConfigLoader& config);
}

} // namespace pktlib::utils
