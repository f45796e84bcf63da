#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dojo {

// Guard stance and attack aim share the same three heights.
enum class Height : uint8_t {
    Low = 0,
    Mid = 1,
    High = 2
};

static constexpr std::size_t kHeightCount = 3;
static constexpr std::array<Height, kHeightCount> kAllHeights = {Height::Low, Height::Mid, Height::High};

enum class AttackKind : uint8_t {
    Punch,
    Kick
};

enum class Side : uint8_t {
    Player,
    Enemy
};

enum class FighterState : uint8_t {
    Idle,
    Walk,
    Attack,
    Hit,
    Block,
    Dead,
    Bow,
    Fall
};

enum class BowPhase : uint8_t {
    Down,
    Hold,
    Up
};

// Per-kind timeline and geometry. Times in milliseconds, lengths in world units.
struct AttackSpec {
    float windupMs;
    float activeMs;
    float recoverMs;
    float damage;
    float reach;
    float hitboxWidth;
    float hitboxHeight;
    // Effective reach = reach * (reachBase + reachGain * extension)
    float reachBase;
    float reachGain;
};

static constexpr std::size_t kAttackKindCount = 2;

static constexpr std::array<AttackSpec, kAttackKindCount> kAttackSpecTable = {{
    {110.0f, 90.0f, 210.0f, 10.0f, 56.0f, 18.0f, 22.0f, 0.85f, 0.35f},  // Punch
    {160.0f, 110.0f, 300.0f, 16.0f, 72.0f, 22.0f, 24.0f, 0.65f, 0.70f}, // Kick
}};

const AttackSpec& attackSpec(AttackKind kind);

// Clamps an arbitrary index into [0, 2]; never wraps.
Height heightFromIndex(int index);
int heightIndex(Height height);

std::string heightToString(Height height);
std::string attackKindToString(AttackKind kind);
std::string sideToString(Side side);
std::string fighterStateToString(FighterState state);
std::string bowPhaseToString(BowPhase phase);

} // namespace dojo
