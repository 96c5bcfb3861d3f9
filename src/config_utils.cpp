#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

std::string normalize_config_key(const std::string& key) {
    std::string k = key;
    std::replace(k.begin(), k.end(), '_', '-');
    if (k == "update-interval")
        k = "interval";
    return "--" + k;
}

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            std::string s;
            if (node.IsMap()) {
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    if (sub->first.IsScalar() && to_string_value(sub->second, s))
                        opts[normalize_config_key(sub->first.as<std::string>())] = s;
                }
            } else if (to_string_value(node, s)) {
                opts[normalize_config_key(key_name)] = s;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            std::string s;
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    if (to_string_value(sub.value(), s))
                        opts[normalize_config_key(sub.key())] = s;
                }
            } else if (to_string_value(val, s)) {
                opts[normalize_config_key(it.key())] = s;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}
