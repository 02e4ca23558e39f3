/*
 * tallybook - Configuration Implementation
 */
#include <tallybook/core/config.hpp>
#include <tallybook/core/logger.hpp>
#include <tallybook/core/utils.hpp>
#include <fstream>
#include <sstream>

namespace tallybook {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        last_error_ = "cannot open " + path;
        return false;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (!load_string(buf.str())) {
        LOG_ERROR("[Config] %s: %s", path.c_str(), last_error_.c_str());
        return false;
    }
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        last_error_ = "invalid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "top-level value must be an object";
        return false;
    }
    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::find_or_create(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number_integer()) return std::to_string(v->get<int64_t>());
    if (v->is_boolean()) return v->get<bool>() ? "true" : "false";
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_string()) {
        int64_t parsed = 0;
        if (parse_int64(trim(v->get<std::string>()), parsed)) return parsed;
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        std::string s = to_lower(trim(v->get<std::string>()));
        if (s == "true" || s == "yes" || s == "1") return true;
        if (s == "false" || s == "no" || s == "0") return false;
    }
    return default_val;
}

void Config::set_string(const std::string& key, const std::string& value) {
    find_or_create(key) = value;
}

} // namespace tallybook
