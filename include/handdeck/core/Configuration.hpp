#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <yaml-cpp/yaml.h>

namespace handdeck {
namespace core {

/**
 * Configuration management class
 *
 * YAML document with dotted-key typed lookup ("classifier.curvature_threshold_deg").
 * Missing keys and type mismatches fall back to the supplied default.
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    Configuration() = default;

    /**
     * Load configuration from file
     * @return false if the file is missing or not valid YAML
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from an in-memory YAML document
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Reload configuration from the last loaded file
     */
    bool reload();

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Get value at a dotted key path
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookup(key);
        if (!node || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const;

    /**
     * Copy of the subtree at a dotted key path (null node if absent)
     */
    YAML::Node section(const std::string& key) const;

    /**
     * Get loaded filename
     */
    std::string getFilename() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    YAML::Node lookup(const std::string& key) const;
    static std::vector<std::string> splitKey(const std::string& key);

    YAML::Node root_;
    std::string filename_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace handdeck
