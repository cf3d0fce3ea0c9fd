/*
 * sandcell - Configuration
 *
 * JSON configuration file with dotted-key access ("sandbox.timeout_seconds")
 * plus a fixed set of environment overrides applied after loading.
 */
#ifndef sandcell_CORE_CONFIG_HPP
#define sandcell_CORE_CONFIG_HPP

#include <sandcell/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace sandcell {

class Config {
public:
    Config();

    // Load from file. Returns false if the file is missing or not a JSON object.
    bool load_file(const std::string& path);

    // Load from a JSON string (used by tests and embedded configs)
    bool load_string(const std::string& text);

    // Apply SANDBOX_TIMEOUT, SANDBOX_MAX_MEMORY_MB, ALLOWED_PACKAGES,
    // SANDBOX_PYTHON, LOG_LEVEL and LOG_FILE when set in the environment.
    // Returns the number of overrides applied.
    int apply_env_overrides();

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::vector<std::string> get_string_list(const std::string& key,
                                             const std::vector<std::string>& def = {}) const;
    // Raw JSON value, null when absent
    Json get(const std::string& key) const;

    void set(const std::string& key, const Json& value);
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);

    const Json& data() const { return data_; }

private:
    const Json* find(const std::string& key) const;

    Json data_;
};

} // namespace sandcell

#endif // sandcell_CORE_CONFIG_HPP
