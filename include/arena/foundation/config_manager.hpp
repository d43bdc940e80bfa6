#pragma once

/// @file config_manager.hpp
/// @brief Read-only view of a YAML match document addressed by dotted keys.

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "arena/foundation/game_result.hpp"

namespace arena::foundation {

/// Loads one YAML document and exposes its leaves as dotted keys.
///
/// `abilities: { dash: { cooldown: 10 } }` becomes the single key
/// `abilities.dash.cooldown`. Mappings are never keys themselves. A new
/// load() replaces everything read before. Error messages name the
/// document they came from (the file path, or "<inline>").
class ConfigManager {
public:
    ConfigManager() = default;

    /// @return ConfigLoadFailed when the file is missing or malformed.
    GameResult<void> load(const std::filesystem::path& path);

    /// @return ConfigLoadFailed when @p yaml does not parse.
    GameResult<void> loadString(std::string_view yaml);

    /// @return ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Like get(), but a missing key yields @p fallback. A present key
    /// that does not convert is still a ConfigTypeMismatch.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Every leaf key below @p section ("abilities" matches
    /// "abilities.dash.cooldown"), sorted.
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view section) const;

    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    GameResult<void> parse(const std::string& text, std::string source);
    void flatten(const std::string& prefix, const YAML::Node& node);
    [[nodiscard]] GameError failure(ErrorCode code, std::string_view what,
                                    std::string_view key) const;

    std::map<std::string, YAML::Node, std::less<>> leaves_;
    std::string source_ = "<inline>";
};

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto it = leaves_.find(key);
    if (it == leaves_.end()) {
        return GameResult<T>::err(failure(ErrorCode::ConfigKeyNotFound, "missing key", key));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(failure(ErrorCode::ConfigTypeMismatch, "wrong type for", key));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

} // namespace arena::foundation
