// ==============================================================================
// config.cpp - Загрузка конфигурации
// ==============================================================================

#include "warden/config.hpp"

#include "warden/errors.hpp"
#include "warden/platform.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace warden::config {

namespace {

/// Сбор нарушений по секциям; значения по умолчанию не трогаются при ошибке
class SectionReader {
public:
    SectionReader(const YAML::Node& node, std::string name, std::vector<std::string>& issues)
        : node_(node), name_(std::move(name)), issues_(issues) {}

    void read_bool(const std::string& key, bool& out) {
        YAML::Node v = node_[key];
        if (!v || v.IsNull()) {
            return;
        }
        try {
            out = v.as<bool>();
        } catch (const YAML::Exception&) {
            issue(key, "expected a boolean");
        }
    }

    void read_int(const std::string& key, int min, int& out) {
        YAML::Node v = node_[key];
        if (!v || v.IsNull()) {
            return;
        }
        try {
            int value = v.as<int>();
            if (value < min) {
                issue(key, "must be at least " + std::to_string(min));
                return;
            }
            out = value;
        } catch (const YAML::Exception&) {
            issue(key, "expected an integer");
        }
    }

    void read_size(const std::string& key, std::size_t min, std::size_t max, std::size_t& out) {
        YAML::Node v = node_[key];
        if (!v || v.IsNull()) {
            return;
        }
        try {
            long long value = v.as<long long>();
            if (value < static_cast<long long>(min) || value > static_cast<long long>(max)) {
                issue(key, "must be between " + std::to_string(min) + " and " +
                               std::to_string(max));
                return;
            }
            out = static_cast<std::size_t>(value);
        } catch (const YAML::Exception&) {
            issue(key, "expected an integer");
        }
    }

    /// Строковое значение через parse-функцию перечисления
    template <typename T, typename Parse>
    void read_enum(const std::string& key, Parse parse, T& out) {
        YAML::Node v = node_[key];
        if (!v || v.IsNull()) {
            return;
        }
        if (!v.IsScalar()) {
            issue(key, "expected a string");
            return;
        }
        try {
            out = parse(v.as<std::string>());
        } catch (const std::invalid_argument& e) {
            issue(key, e.what());
        }
    }

private:
    void issue(const std::string& key, const std::string& message) {
        issues_.push_back(name_ + "." + key + ": " + message);
    }

    YAML::Node node_;
    std::string name_;
    std::vector<std::string>& issues_;
};

/// Секция-отображение или пустой узел; иначе нарушение
bool section(const YAML::Node& root, const std::string& name, std::vector<std::string>& issues,
             YAML::Node& out) {
    YAML::Node node = root[name];
    if (!node || node.IsNull()) {
        return false;
    }
    if (!node.IsMap()) {
        issues.push_back(name + ": expected a mapping");
        return false;
    }
    out = node;
    return true;
}

}  // anonymous namespace

Config parse_config(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ValidationError("configuration must be a mapping");
    }

    std::vector<std::string> issues;
    YAML::Node node;

    if (section(root, "engine", issues, node)) {
        SectionReader r(node, "engine", issues);
        r.read_bool("stop_on_first_match", config.engine.stop_on_first_match);
        r.read_enum("default_effect", policy::parse_effect, config.engine.default_effect);
        r.read_bool("validate_on_load", config.engine.validate_on_load);
    }

    if (section(root, "audit", issues, node)) {
        SectionReader r(node, "audit", issues);
        r.read_enum("algorithm", audit::parse_hash_algorithm, config.audit.algorithm);
        r.read_int("max_append_retries", 1, config.audit.max_append_retries);
    }

    if (section(root, "evidence", issues, node)) {
        SectionReader r(node, "evidence", issues);
        r.read_size("max_per_source", 1, audit::MAX_QUERY_LIMIT,
                    config.evidence.default_max_per_source);
        r.read_bool("verify_chain", config.evidence.default_verify_chain);
    }

    if (!issues.empty()) {
        throw ValidationError("invalid configuration: " + issues.front(), std::move(issues));
    }
    return config;
}

Config parse_config_string(const std::string& text) {
    return parse_config(YAML::Load(text));
}

std::string Error::format() const {
    std::string out = "failed to load config '" + path + "' - " + message;
    for (const auto& i : issues) {
        out += "\n    " + i;
    }
    return out;
}

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;
    std::string path_str = platform::path_to_utf8(path);

    try {
        result.config = parse_config(YAML::LoadFile(path_str));
        result.ok = true;
    } catch (const ValidationError& e) {
        result.error = Error{"configuration failed validation", path_str, e.issues()};
        if (result.error.issues.empty()) {
            result.error.message = e.what();
        }
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path_str, {}};
    }

    return result;
}

}  // namespace warden::config
