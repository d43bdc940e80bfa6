/// @file main.cpp
/// @brief Headless match runner.
///
/// Loads a YAML match configuration, spawns two mirrored teams and marches
/// them toward each other, then steps the simulation at a fixed rate until
/// the match ends and reports the result.
///
/// Usage: arena_headless [--config <path>]

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "arena/foundation/config_manager.hpp"
#include "arena/foundation/game_logger.hpp"
#include "arena/game/match_config.hpp"
#include "arena/game/simulation.hpp"
#include "arena/version.hpp"

namespace {

using arena::foundation::LogCategory;

/// Runner settings that are not part of the match rules.
struct RunnerConfig {
    unsigned int teamSize = 5;
    float timeStep = 1.0f / 60.0f;
    unsigned int maxTicks = 60 * 60 * 5;
    float unitHealth = 100.0f;
    float unitDamage = 10.0f;
    float unitRange = 150.0f;
    float unitAttackSpeed = 1.0f;
    float teamSpacing = 600.0f;
    float rowSpacing = 60.0f;
};

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

arena::foundation::GameResult<RunnerConfig>
buildRunnerConfig(const arena::foundation::ConfigManager& config) {
    RunnerConfig cfg;

    const std::pair<std::string_view, unsigned int*> counts[] = {
        {"headless.team_size", &cfg.teamSize},
        {"headless.max_ticks", &cfg.maxTicks},
    };
    const std::pair<std::string_view, float*> reals[] = {
        {"headless.time_step", &cfg.timeStep},
        {"headless.unit.health", &cfg.unitHealth},
        {"headless.unit.damage", &cfg.unitDamage},
        {"headless.unit.range", &cfg.unitRange},
        {"headless.unit.attack_speed", &cfg.unitAttackSpeed},
        {"headless.team_spacing", &cfg.teamSpacing},
    };

    for (const auto& [key, out] : counts) {
        auto value = config.getOr<unsigned int>(key, *out);
        if (!value) {
            return arena::foundation::GameResult<RunnerConfig>::err(value.error());
        }
        *out = value.value();
    }
    for (const auto& [key, out] : reals) {
        auto value = config.getOr<float>(key, *out);
        if (!value) {
            return arena::foundation::GameResult<RunnerConfig>::err(value.error());
        }
        *out = value.value();
    }
    return arena::foundation::GameResult<RunnerConfig>::ok(cfg);
}

bool spawnTeams(arena::game::Simulation& sim, const RunnerConfig& runner) {
    const auto center = sim.Config().arenaCenter;
    const float top = center.y - runner.rowSpacing * static_cast<float>(runner.teamSize - 1) / 2.0f;

    for (uint8_t team = 0; team < arena::game::kTeamCount; ++team) {
        const float x = center.x + (team == 0 ? -1.0f : 1.0f) * runner.teamSpacing / 2.0f;
        for (unsigned int i = 0; i < runner.teamSize; ++i) {
            arena::game::UnitSpec spec;
            spec.position = {x, top + runner.rowSpacing * static_cast<float>(i)};
            spec.team = team;
            spec.maxHealth = runner.unitHealth;
            spec.damage = arena::game::Damage{runner.unitDamage, runner.unitRange,
                                              runner.unitAttackSpeed, 0.0f};
            spec.withDash = true;
            spec.withShield = true;
            spec.withRanged = true;

            auto unit = sim.SpawnUnit(spec);
            if (!unit) {
                std::cerr << "Failed to spawn unit: " << unit.error().message() << "\n";
                return false;
            }

            // Advance until the two lines are just inside attack range.
            const float engageX = center.x + (team == 0 ? -1.0f : 1.0f) * runner.unitRange * 0.4f;
            if (auto ordered = sim.IssueMoveCommand(unit.value(), engageX, spec.position.y);
                !ordered) {
                std::cerr << "Failed to order unit: " << ordered.error().message() << "\n";
                return false;
            }
        }
    }
    return true;
}

/// Scripted input: fire ranged attacks and raise shields whenever ready.
void queueReadyAbilities(arena::game::Simulation& sim) {
    auto queue = [&sim](arena::ecs::Entity entity, arena::game::AbilityKind kind) {
        if (auto queued = sim.QueueAbility(entity, kind); !queued) {
            ARENA_LOG_DEBUG(LogCategory::Input, std::string(queued.error().message()));
        }
    };

    const auto snapshot = sim.Snapshot();
    for (const auto& unit : snapshot.units) {
        if (!unit.alive) {
            continue;
        }
        if (unit.ranged.present && unit.ranged.phase == arena::game::AbilityPhase::Idle) {
            queue(unit.entity, arena::game::AbilityKind::RangedAttack);
        }
        if (unit.shield.present && unit.shield.phase == arena::game::AbilityPhase::Idle &&
            unit.health < unit.maxHealth / 2.0f) {
            queue(unit.entity, arena::game::AbilityKind::Shield);
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto configPath = parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/arena.yaml";
    }

    arena::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto matchConfig = arena::game::LoadMatchConfig(config);
    if (!matchConfig) {
        std::cerr << "Invalid match config: " << matchConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto runnerConfig = buildRunnerConfig(config);
    if (!runnerConfig) {
        std::cerr << "Invalid runner config: " << runnerConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& runner = runnerConfig.value();
    if (runner.timeStep <= 0.0f) {
        std::cerr << "Invalid config: headless.time_step must be positive\n";
        return EXIT_FAILURE;
    }
    if (runner.teamSize == 0) {
        std::cerr << "Invalid config: headless.team_size must be at least 1\n";
        return EXIT_FAILURE;
    }

    auto created = arena::game::Simulation::Create(matchConfig.value());
    if (!created) {
        std::cerr << "Failed to create simulation: " << created.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto sim = std::move(created).value();

    if (!spawnTeams(*sim, runner)) {
        return EXIT_FAILURE;
    }

    std::cout << "arena_headless " << arena::Version::string << ": " << runner.teamSize
              << " vs " << runner.teamSize << ", seed " << matchConfig.value().seed << "\n";

    unsigned int ticks = 0;
    while (sim->Phase() != arena::game::MatchPhase::Ended && ticks < runner.maxTicks) {
        queueReadyAbilities(*sim);
        sim->Step(runner.timeStep);
        ++ticks;
    }

    const auto snapshot = sim->Snapshot();
    std::string outcome;
    if (!snapshot.winner) {
        outcome = "unfinished";
    } else if (*snapshot.winner == arena::game::kDrawTeam) {
        outcome = "draw";
    } else {
        outcome = "team " + std::to_string(*snapshot.winner) + " wins";
    }

    ARENA_LOG_INFO(LogCategory::Core, "headless match finished: " + outcome);

    std::cout << "Match " << outcome << " after " << snapshot.totalTime << " s (" << ticks
              << " ticks, phase " << arena::game::MatchPhaseName(snapshot.phase) << ")\n"
              << "Survivors: team 0 = " << snapshot.LivingCount(0)
              << ", team 1 = " << snapshot.LivingCount(1) << "\n";

    if (auto flushed = arena::foundation::GameLogger::instance().flush(); !flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
