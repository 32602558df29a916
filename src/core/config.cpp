/*
 * pvfworker C++ - Configuration Implementation
 */
#include <pvfworker/core/config.hpp>
#include <pvfworker/core/logger.hpp>
#include <pvfworker/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace pvfworker {

Config::Config() : root_(Json::object()) {}

Config::Config(const Json& root) : root_(root.is_object() ? root : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        LOG_ERROR("[Config] Cannot open config file: %s", path.c_str());
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!load_string(buffer.str())) {
        LOG_ERROR("[Config] Ignoring malformed config file: %s", path.c_str());
        return false;
    }
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    root_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
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
    Json* node = &root_;
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
    const Json* node = find(key);
    return node != nullptr && !node->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* node = find(key);
    if (!node || !node->is_string()) return def;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* node = find(key);
    if (!node) return def;
    if (node->is_number_integer()) return node->get<int64_t>();
    if (node->is_number_float()) return static_cast<int64_t>(node->get<double>());
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json* node = find(key);
    if (!node || !node->is_number()) return def;
    return node->get<double>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* node = find(key);
    if (!node || !node->is_boolean()) return def;
    return node->get<bool>();
}

void Config::set_string(const std::string& key, const std::string& value) {
    find_or_create(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    find_or_create(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    find_or_create(key) = value;
}

} // namespace pvfworker
