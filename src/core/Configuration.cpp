#include "handdeck/core/Configuration.hpp"
#include "handdeck/core/Logger.hpp"

namespace handdeck {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(filename);
    } catch (const YAML::BadFile&) {
        LOG_ERROR("Cannot open configuration file " + filename);
        return false;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to parse configuration " + filename + ": " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(loaded);
    filename_ = filename;
    return true;
}

bool Configuration::loadFromString(const std::string& yaml) {
    YAML::Node loaded;
    try {
        loaded = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Failed to parse configuration text: ") + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(loaded);
    filename_.clear();
    return true;
}

bool Configuration::reload() {
    std::string filename = getFilename();
    if (filename.empty()) {
        LOG_WARNING("Configuration reload requested but no file was loaded");
        return false;
    }
    return load(filename);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_.reset(YAML::Node());
    filename_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = lookup(key);
    return node && !node.IsNull();
}

YAML::Node Configuration::section(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node = lookup(key);
    if (!node) {
        return YAML::Node();
    }
    return YAML::Clone(node);
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filename_;
}

YAML::Node Configuration::lookup(const std::string& key) const {
    // Assigning one Node to another writes through to the referenced node;
    // walk with reset() and const operator[] so the document is never touched.
    YAML::Node current;
    current.reset(root_);
    for (const auto& part : splitKey(key)) {
        if (!current || !current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(child);
    }
    return current;
}

std::vector<std::string> Configuration::splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (start <= key.size()) {
        std::string::size_type dot = key.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(key.substr(start));
            break;
        }
        parts.push_back(key.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

} // namespace core
} // namespace handdeck
