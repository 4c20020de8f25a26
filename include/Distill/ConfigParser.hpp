// =================================================================
// include/Distill/ConfigParser.hpp
// =================================================================
// Defines the loader for the .distill.yml configuration file.

#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace Distill {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the YAML file. A missing file leaves the parser empty.
     * @throws ConfigError if the file exists but is not valid YAML.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Builds a parser from YAML text, used for inline configuration and tests.
     */
    static ConfigParser fromString(const std::string& yaml_text);

    /**
     * @brief Retrieves a scalar value for a dotted key such as "output.format".
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a list of scalars. A single scalar is returned as a one-element list.
     */
    std::vector<std::string> getSequenceValue(const std::string& key) const;

    bool hasKey(const std::string& key) const;
    bool isLoaded() const { return m_loaded; }
    const std::string& getPath() const { return m_path; }

private:
    ConfigParser() = default;

    YAML::Node lookup(const std::string& key) const;

    std::string m_path;
    YAML::Node m_root;
    bool m_loaded = false;
};

} // namespace Distill
