/*
 * pvfworker C++ - Configuration
 *
 * JSON-backed configuration with dotted-key access ("prepare.wall_clock_lenience").
 * Missing keys and type mismatches fall back to the caller's default.
 */
#ifndef pvfworker_CORE_CONFIG_HPP
#define pvfworker_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace pvfworker {

typedef nlohmann::json Json;

class Config {
public:
    Config();
    explicit Config(const Json& root);

    // Load from a JSON file. On failure the current values are kept and
    // false is returned.
    bool load_file(const std::string& path);

    // Parse a JSON document held in memory.
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& def) const;
    int64_t get_int(const std::string& key, int64_t def) const;
    double get_double(const std::string& key, double def) const;
    bool get_bool(const std::string& key, bool def) const;
    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& raw() const { return root_; }

private:
    const Json* find(const std::string& key) const;
    Json& find_or_create(const std::string& key);

    Json root_;
};

} // namespace pvfworker

#endif // pvfworker_CORE_CONFIG_HPP
