#include "pktlib/utils/config_loader.hpp"
#include "pktlib/error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

namespace pktlib::utils {

namespace {

void flatten(const nlohmann::json& j, const std::string& prefix,
             std::unordered_map<std::string, ConfigValue>& out) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            flatten(v, key, out);
        } else if (v.is_boolean()) {
            out[key] = v.get<bool>();
        } else if (v.is_number_integer()) {
            out[key] = v.get<int64_t>();
        } else if (v.is_number_float()) {
            out[key] = v.get<double>();
        } else if (v.is_string()) {
            out[key] = v.get<std::string>();
        } else if (!v.is_null()) {
            // 配列は JSON 文字列のまま保持
            out[key] = v.dump();
        }
    }
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::error_code ConfigLoader::load_from_file(const std::filesystem::path& file_path) {
    std::ifstream ifs(file_path);
    if (!ifs) {
        return make_error_code(PktErrc::io_error);
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return load_from_json_string(content);
}

std::error_code ConfigLoader::load_from_json_string(const std::string& json_content) {
    nlohmann::json j = nlohmann::json::parse(json_content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return make_error_code(PktErrc::invalid_argument);
    }
    std::unordered_map<std::string, ConfigValue> flat;
    flatten(j, "", flat);
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (auto& [k, v] : flat) config_data_[k] = std::move(v);
    return {};
}

size_t ConfigLoader::load_from_environment(const std::string& prefix, const std::vector<std::string>& keys) {
    size_t n = 0;
    for (const auto& key : keys) {
        auto value = config_utils::get_env_var(config_utils::normalize_env_var_name(key, prefix));
        if (!value) continue;
        set(key, *value);
        ++n;
    }
    return n;
}

void ConfigLoader::load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (const auto& [k, v] : defaults) config_data_.emplace(k, v);
}

std::optional<ConfigValue> ConfigLoader::find_value(const std::string& key) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    auto it = config_data_.find(key);
    if (it == config_data_.end()) return std::nullopt;
    return it->second;
}

std::string ConfigLoader::get_string(const std::string& key, const std::string& default_value) const {
    auto v = find_value(key);
    if (!v) return default_value;
    if (auto* s = std::get_if<std::string>(&*v)) return *s;
    if (auto* i = std::get_if<int64_t>(&*v)) return std::to_string(*i);
    if (auto* d = std::get_if<double>(&*v)) return std::to_string(*d);
    return std::get<bool>(*v) ? "true" : "false";
}

int64_t ConfigLoader::get_int(const std::string& key, int64_t default_value) const {
    auto v = find_value(key);
    if (!v) return default_value;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i;
    if (auto* s = std::get_if<std::string>(&*v)) return config_utils::parse_int(*s).value_or(default_value);
    return default_value;
}

double ConfigLoader::get_double(const std::string& key, double default_value) const {
    auto v = find_value(key);
    if (!v) return default_value;
    if (auto* d = std::get_if<double>(&*v)) return *d;
    if (auto* i = std::get_if<int64_t>(&*v)) return static_cast<double>(*i);
    if (auto* s = std::get_if<std::string>(&*v)) {
        char* end = nullptr;
        errno = 0;
        double r = std::strtod(s->c_str(), &end);
        if (errno == 0 && end != s->c_str() && *end == '\0') return r;
    }
    return default_value;
}

bool ConfigLoader::get_bool(const std::string& key, bool default_value) const {
    auto v = find_value(key);
    if (!v) return default_value;
    if (auto* b = std::get_if<bool>(&*v)) return *b;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i != 0;
    if (auto* s = std::get_if<std::string>(&*v)) return config_utils::parse_bool(*s).value_or(default_value);
    return default_value;
}

void ConfigLoader::set(const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    config_data_[key] = value;
}

bool ConfigLoader::has(const std::string& key) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return config_data_.find(key) != config_data_.end();
}

bool ConfigLoader::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return config_data_.erase(key) > 0;
}

std::vector<std::string> ConfigLoader::get_all_keys() const {
    return get_keys_with_prefix("");
}

std::vector<std::string> ConfigLoader::get_keys_with_prefix(const std::string& prefix) const {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lk(config_mutex_);
        for (const auto& [k, _] : config_data_) {
            if (k.rfind(prefix, 0) == 0) keys.push_back(k);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

namespace config_utils {

std::string normalize_env_var_name(const std::string& key, const std::string& prefix) {
    std::string r = prefix;
    for (char c : key) {
        r += (c == '.' || c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return r;
}

std::optional<std::string> get_env_var(const std::string& env_var_name) {
    const char* value = std::getenv(env_var_name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::optional<bool> parse_bool(const std::string& str) {
    auto v = lower(str);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

std::optional<int64_t> parse_int(const std::string& str) {
    if (str.empty()) return std::nullopt;
    // 先頭ゼロを8進として扱わないよう基数は明示する
    int base = (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) ? 16 : 10;
    char* end = nullptr;
    errno = 0;
    long long r = std::strtoll(str.c_str(), &end, base);
    if (errno != 0 || end == str.c_str() || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(r);
}

} // namespace config_utils

} // namespace pktlib::utils
