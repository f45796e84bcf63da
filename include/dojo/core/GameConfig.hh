#pragma once

#include "dojo/core/DataLoader.hh"
#include "dojo/core/EnemyAI.hh"
#include "dojo/core/Encounter.hh"
#include "dojo/core/FallSequence.hh"
#include "dojo/core/Fighter.hh"
#include "dojo/core/Hazard.hh"
#include "dojo/core/ScrollCamera.hh"
#include "dojo/utils/ErrorHandling.hh"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dojo {

struct WorldConfig {
    float width = 3200.0f;
    float viewWidth = 1280.0f;
    float groundY = 600.0f;
    // Win line sits this far from the right edge.
    float endMargin = 200.0f;
    float maxStepMs = 32.0f;
};

struct EnemySpawn {
    std::string name;
    float x = 0.0f;
};

std::vector<EnemySpawn> defaultRoster();

// Everything a session needs, with the stock tuning as defaults.
struct GameConfig {
    // 0 picks a random seed at session start.
    uint64_t seed = 0;

    WorldConfig world;
    EncounterConfig encounter;
    FighterConfig fighter;
    AIConfig ai;
    HazardConfig hazard;
    FallConfig fall;
    CameraConfig camera;

    float playerStartX = 80.0f;
    std::vector<EnemySpawn> roster = defaultRoster();

    // Fighter/camera settings with the world dimensions folded in.
    FighterConfig fighterConfig() const;
    CameraConfig cameraConfig() const;
};

Result<void> validateGameConfig(const GameConfig& config);

// Keys absent from the document keep their defaults. A present [[enemy]]
// list replaces the default roster.
Result<GameConfig> gameConfigFromToml(const DataLoader& loader);
Result<GameConfig> parseGameConfig(std::string_view tomlContent, std::string_view sourceName = "string");
Result<GameConfig> loadGameConfig(const std::filesystem::path& path);

} // namespace dojo
