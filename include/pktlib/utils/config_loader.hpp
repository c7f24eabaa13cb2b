#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pktlib::utils {

/**
 * @brief 設定値の型
 */
using ConfigValue = std::variant<
    std::string,
    int64_t,
    double,
    bool
>;

/**
 * @brief 設定ファイル読み込み・管理クラス
 *
 * ネストした JSON オブジェクトはドット区切りのキーに平坦化される
 * （{"log": {"level": "debug"}} -> "log.level"）。
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /**
     * @brief JSON 設定ファイルを読み込み
     * @param file_path ファイルパス
     * @return 成功時は空の error_code、開けない場合 io_error、JSON が不正な場合 invalid_argument
     */
    std::error_code load_from_file(const std::filesystem::path& file_path);

    /**
     * @brief JSON 文字列から設定を読み込み（既存キーは上書き）
     * @param json_content JSON文字列（トップレベルはオブジェクト）
     */
    std::error_code load_from_json_string(const std::string& json_content);

    /**
     * @brief 環境変数で上書き
     * @param prefix 環境変数のプレフィックス（例："PKTLIB_"）
     * @param keys 対象キー。"log.level" は PKTLIB_LOG_LEVEL を参照する
     * @return 読み込まれた設定数
     */
    size_t load_from_environment(const std::string& prefix, const std::vector<std::string>& keys);

    /**
     * @brief デフォルト設定を読み込み（既存キーは上書きしない）
     */
    void load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults);

    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    /**
     * @brief 整数として設定値を取得
     *
     * 文字列値は10進/16進として解析する。変換できない場合は default_value。
     */
    int64_t get_int(const std::string& key, int64_t default_value = 0) const;

    double get_double(const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;

    void set(const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool remove(const std::string& key);

    std::vector<std::string> get_all_keys() const;
    std::vector<std::string> get_keys_with_prefix(const std::string& prefix) const;

private:
    mutable std::mutex config_mutex_;
    std::unordered_map<std::string, ConfigValue> config_data_;

    std::optional<ConfigValue> find_value(const std::string& key) const;
};

/**
 * @brief 設定ユーティリティ
 */
namespace config_utils {
    /**
     * @brief キーを環境変数名に変換（"log.level", "PKTLIB_" -> "PKTLIB_LOG_LEVEL"）
     */
    std::string normalize_env_var_name(const std::string& key, const std::string& prefix = "");

    std::optional<std::string> get_env_var(const std::string& env_var_name);

    /**
     * @brief 真偽値文字列を解析（true/yes/on/1）
     */
    std::optional<bool> parse_bool(const std::string& str);

    /**
     * @brief 文字列を整数に解析（"0x" プレフィックス対応、全体が数値でなければ nullopt）
     */
    std::optional<int64_t> parse_int(const std::string& str);
}

} // namespace pktlib::utils
