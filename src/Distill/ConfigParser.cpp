// =================================================================
// src/Distill/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration loader.

#include "Distill/ConfigParser.hpp"
#include "Distill/Errors.hpp"
#include "Distill/Logger.hpp"
#include <filesystem>

namespace Distill {

ConfigParser::ConfigParser(const std::string& config_path)
    : m_path(config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        // It's okay if the file doesn't exist, e.g., before `init` is run.
        return;
    }

    try {
        m_root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + config_path + ": " + e.what());
    }

    if (!m_root.IsNull() && !m_root.IsMap()) {
        throw ConfigError("Top level of " + config_path + " must be a mapping");
    }

    m_loaded = true;
    LOG_DEBUG("ConfigParser", "Loaded configuration from " + config_path);
}

ConfigParser ConfigParser::fromString(const std::string& yaml_text) {
    ConfigParser parser;
    parser.m_path = "<inline>";

    try {
        parser.m_root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Cannot parse configuration: ") + e.what());
    }

    if (!parser.m_root.IsNull() && !parser.m_root.IsMap()) {
        throw ConfigError("Top level of configuration must be a mapping");
    }

    parser.m_loaded = true;
    return parser;
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    YAML::Node node = lookup(key);
    if (!node.IsDefined() || !node.IsScalar()) {
        return "";
    }
    return node.Scalar();
}

std::vector<std::string> ConfigParser::getSequenceValue(const std::string& key) const {
    std::vector<std::string> values;
    YAML::Node node = lookup(key);

    if (!node.IsDefined() || node.IsNull()) {
        return values;
    }
    if (node.IsScalar()) {
        values.push_back(node.Scalar());
        return values;
    }
    if (!node.IsSequence()) {
        throw ConfigError("Configuration key '" + key + "' must be a list");
    }

    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigError("Configuration key '" + key + "' must contain only scalar values");
        }
        values.push_back(item.Scalar());
    }
    return values;
}

bool ConfigParser::hasKey(const std::string& key) const {
    YAML::Node node = lookup(key);
    return node.IsDefined() && !node.IsNull();
}

YAML::Node ConfigParser::lookup(const std::string& key) const {
    YAML::Node current;
    current.reset(m_root);

    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        std::string segment = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (!current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }

        // Index through a const view so that missing keys are never inserted
        const YAML::Node& view = current;
        YAML::Node child = view[segment];
        if (!child.IsDefined()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(child);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    return current;
}

} // namespace Distill
