#include "csb/foundation/config_manager.hpp"

#include "csb/foundation/codec_logger.hpp"

namespace csb::foundation {

CodecResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        reset(root);
        CSB_LOG_INFO(LogCategory::Config, "loaded " + path.string());
        return CodecResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return CodecResult<void>::err(
            CodecError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return CodecResult<void>::err(
            CodecError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

CodecResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        auto root = YAML::Load(std::string(yaml));
        reset(root);
        return CodecResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return CodecResult<void>::err(
            CodecError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::reset(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null) — store with its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace csb::foundation
