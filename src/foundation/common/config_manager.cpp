#include "arena/foundation/config_manager.hpp"

#include <fstream>
#include <sstream>

namespace arena::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "cannot open " + path.string()));
    }
    std::ostringstream text;
    text << in.rdbuf();
    return parse(text.str(), path.string());
}

GameResult<void> ConfigManager::loadString(std::string_view yaml) {
    return parse(std::string(yaml), "<inline>");
}

GameResult<void> ConfigManager::parse(const std::string& text, std::string source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, source + ": " + e.what()));
    }

    leaves_.clear();
    source_ = std::move(source);
    if (root.IsMap()) {
        flatten("", root);
    }
    return GameResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (!node.IsMap()) {
        leaves_[prefix] = YAML::Clone(node);
        return;
    }
    for (const auto& child : node) {
        const auto name = child.first.as<std::string>();
        flatten(prefix.empty() ? name : prefix + "." + name, child.second);
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    return leaves_.find(key) != leaves_.end();
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view section) const {
    std::string prefix(section);
    prefix += '.';

    std::vector<std::string> keys;
    for (auto it = leaves_.lower_bound(prefix);
         it != leaves_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        keys.push_back(it->first);
    }
    return keys;
}

GameError ConfigManager::failure(ErrorCode code, std::string_view what,
                                 std::string_view key) const {
    std::string message = source_;
    message += ": ";
    message += what;
    message += ' ';
    message += key;
    return GameError(code, std::move(message));
}

}  // namespace arena::foundation
