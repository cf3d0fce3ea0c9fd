/*
 * sandcell - Configuration Implementation
 */
#include <sandcell/core/config.hpp>
#include <sandcell/core/logger.hpp>
#include <sandcell/core/utils.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sandcell {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return load_string(ss.str());
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            LOG_ERROR("[Config] Top-level value must be an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("[Config] Parse error: %s", e.what());
        return false;
    }
}

int Config::apply_env_overrides() {
    int applied = 0;

    const char* v = getenv("SANDBOX_TIMEOUT");
    if (v && *v) {
        char* end = nullptr;
        double seconds = strtod(v, &end);
        if (end != v && seconds > 0) {
            set("sandbox.timeout_seconds", seconds);
            ++applied;
        } else {
            LOG_WARN("[Config] Ignoring invalid SANDBOX_TIMEOUT='%s'", v);
        }
    }

    v = getenv("SANDBOX_MAX_MEMORY_MB");
    if (v && *v) {
        char* end = nullptr;
        long long mb = strtoll(v, &end, 10);
        if (end != v && mb > 0) {
            set_int("sandbox.max_memory_mb", mb);
            ++applied;
        } else {
            LOG_WARN("[Config] Ignoring invalid SANDBOX_MAX_MEMORY_MB='%s'", v);
        }
    }

    v = getenv("ALLOWED_PACKAGES");
    if (v && *v) {
        Json list = Json::array();
        std::vector<std::string> parts = split(v, ',');
        for (size_t i = 0; i < parts.size(); ++i) {
            std::string p = trim(parts[i]);
            if (!p.empty()) list.push_back(p);
        }
        set("sandbox.allowed_packages", list);
        ++applied;
    }

    v = getenv("SANDBOX_PYTHON");
    if (v && *v) {
        set_string("sandbox.python_path", v);
        ++applied;
    }

    v = getenv("LOG_LEVEL");
    if (v && *v) {
        set_string("log_level", to_lower(v));
        ++applied;
    }

    v = getenv("LOG_FILE");
    if (v && *v) {
        set_string("log_file", v);
        ++applied;
    }

    return applied;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    const Json* v = find(key);
    return v != nullptr && !v->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return def;
    if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    return v->get<int64_t>();
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return def;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return def;
    return v->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key,
                                                 const std::vector<std::string>& def) const {
    const Json* v = find(key);
    if (!v || !v->is_array()) return def;
    std::vector<std::string> out;
    for (const auto& item : *v) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else {
            LOG_WARN("[Config] Ignoring non-string entry in '%s'", key.c_str());
        }
    }
    return out;
}

Json Config::get(const std::string& key) const {
    const Json* v = find(key);
    return v ? *v : Json();
}

void Config::set(const std::string& key, const Json& value) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    if (parts.empty()) return;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = Json::object();
        }
        node = &child;
    }
    (*node)[parts.back()] = value;
}

void Config::set_string(const std::string& key, const std::string& value) {
    set(key, Json(value));
}

void Config::set_int(const std::string& key, int64_t value) {
    set(key, Json(value));
}

} // namespace sandcell
