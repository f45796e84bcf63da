#include "dojo/core/GameConfig.hh"

#include "dojo/core/Log.hh"

#include <sstream>

namespace dojo {

namespace {

// Reads optional keys into an existing struct, remembering the first error.
class ConfigReader {
  public:
    explicit ConfigReader(const DataLoader& loader) : loader_(loader) {}

    void read(std::string_view key, float& out) {
        if (failed())
            return;
        auto r = loader_.getFloatOr(key, out);
        if (r.isError()) {
            fail(r.code(), r.message());
            return;
        }
        out = static_cast<float>(r.value());
    }

    void read(std::string_view key, int& out) {
        if (failed())
            return;
        auto r = loader_.getIntOr(key, out);
        if (r.isError()) {
            fail(r.code(), r.message());
            return;
        }
        out = static_cast<int>(r.value());
    }

    void read(std::string_view key, uint64_t& out) {
        if (failed())
            return;
        auto r = loader_.getIntOr(key, static_cast<int64_t>(out));
        if (r.isError()) {
            fail(r.code(), r.message());
            return;
        }
        if (r.value() < 0) {
            fail(ErrorCode::OutOfRange, loader_.sourceName() + ": key '" + std::string(key) + "' must be >= 0");
            return;
        }
        out = static_cast<uint64_t>(r.value());
    }

    void fail(ErrorCode code, std::string message) {
        if (failed())
            return;
        code_ = code;
        message_ = std::move(message);
    }

    bool failed() const { return code_ != ErrorCode::Ok; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

  private:
    const DataLoader& loader_;
    ErrorCode code_ = ErrorCode::Ok;
    std::string message_;
};

void readRoster(const DataLoader& loader, ConfigReader& reader, std::vector<EnemySpawn>& roster) {
    if (!loader.hasKey("enemy"))
        return;

    const auto* arr = loader.getTableArray("enemy");
    if (!arr) {
        reader.fail(ErrorCode::InvalidState, loader.sourceName() + ": 'enemy' must be an array of tables");
        return;
    }

    std::vector<EnemySpawn> parsed;
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = arr->at(i).as_table();
        auto x = (*tbl)["x"].value<double>();
        if (!x) {
            reader.fail(ErrorCode::NotFound,
                        loader.sourceName() + ": enemy " + std::to_string(i) + " needs a numeric 'x'");
            return;
        }
        EnemySpawn spawn;
        spawn.name = (*tbl)["name"].value_or(std::string("Enemy ") + std::to_string(i + 1));
        spawn.x = static_cast<float>(*x);
        parsed.push_back(std::move(spawn));
    }
    roster = std::move(parsed);
}

Result<void> outOfRange(const std::string& what) {
    return Result<void>::error(ErrorCode::OutOfRange, "invalid config: " + what);
}

} // namespace

std::vector<EnemySpawn> defaultRoster() {
    return {
        {"Guard A", 520.0f},
        {"Guard B", 1120.0f},
        {"Guard C", 1680.0f},
        {"Captain", 2380.0f},
    };
}

FighterConfig GameConfig::fighterConfig() const {
    FighterConfig f = fighter;
    f.worldWidth = world.width;
    f.groundY = world.groundY;
    return f;
}

CameraConfig GameConfig::cameraConfig() const {
    CameraConfig c = camera;
    c.worldWidth = world.width;
    c.viewWidth = world.viewWidth;
    return c;
}

Result<void> validateGameConfig(const GameConfig& config) {
    const auto& w = config.world;
    if (w.width <= 0.0f || w.viewWidth <= 0.0f)
        return outOfRange("world dimensions must be positive");
    if (w.maxStepMs <= 0.0f)
        return outOfRange("world.max_step_ms must be positive");
    if (config.fighter.maxHealth <= 0.0f)
        return outOfRange("fighter.max_health must be positive");
    if (config.fighter.flurry.periodMs <= 0.0f)
        return outOfRange("flurry.period_ms must be positive");
    if (config.encounter.engageRadius <= 0.0f)
        return outOfRange("encounter.engage_radius must be positive");
    if (config.ai.initialTimerMinMs > config.ai.initialTimerMaxMs ||
        config.ai.retryTimerMinMs > config.ai.retryTimerMaxMs)
        return outOfRange("ai timer ranges must have min <= max");
    if (config.fall.durationMs <= 0.0f)
        return outOfRange("fall.duration_ms must be positive");
    if (config.camera.smoothing < 0.0f || config.camera.smoothing > 1.0f)
        return outOfRange("camera.smoothing must be within [0, 1]");
    for (const auto& e : config.roster) {
        if (e.x < 0.0f || e.x > w.width) {
            std::ostringstream oss;
            oss << "enemy '" << e.name << "' at x=" << e.x << " is outside the world";
            return outOfRange(oss.str());
        }
    }
    return Result<void>::ok();
}

Result<GameConfig> gameConfigFromToml(const DataLoader& loader) {
    GameConfig cfg;
    ConfigReader r(loader);

    r.read("seed", cfg.seed);

    r.read("world.width", cfg.world.width);
    r.read("world.view_width", cfg.world.viewWidth);
    r.read("world.ground_y", cfg.world.groundY);
    r.read("world.end_margin", cfg.world.endMargin);
    r.read("world.max_step_ms", cfg.world.maxStepMs);

    r.read("encounter.engage_radius", cfg.encounter.engageRadius);
    r.read("encounter.post_bow_hold_ms", cfg.encounter.postBowHoldMs);
    r.read("encounter.bow_exit_threshold", cfg.encounter.bowExitThreshold);

    auto& f = cfg.fighter;
    r.read("fighter.max_health", f.maxHealth);
    r.read("fighter.walk_speed", f.walkSpeed);
    r.read("fighter.enemy_speed_scale", f.enemySpeedScale);
    r.read("fighter.low_stance_speed_scale", f.lowStanceSpeedScale);
    r.read("fighter.high_stance_speed_scale", f.highStanceSpeedScale);
    r.read("fighter.width", f.width);
    r.read("fighter.height", f.height);
    r.read("fighter.edge_margin", f.edgeMargin);
    r.read("fighter.attack_cooldown_ms", f.attackCooldownMs);
    r.read("fighter.player_spacing", f.playerSpacing);
    r.read("fighter.player_start_x", cfg.playerStartX);
    r.read("fighter.chip_factor", f.hit.chipFactor);
    r.read("fighter.block_hit_lag_ms", f.hit.blockHitLagMs);
    r.read("fighter.hit_lag_ms", f.hit.hitLagMs);
    r.read("fighter.knockback_factor", f.hit.knockbackFactor);

    r.read("bow.down_ms", f.bow.downMs);
    r.read("bow.hold_ms", f.bow.holdMs);
    r.read("bow.up_ms", f.bow.upMs);
    r.read("bow.blend_tau_ms", f.bow.blendTauMs);

    r.read("flurry.period_ms", f.flurry.periodMs);
    r.read("flurry.damage", f.flurry.damage);
    r.read("flurry.knockback", f.flurry.knockback);
    r.read("flurry.min_active_ms", f.flurry.minActiveMs);
    r.read("flurry.max_recover_ms", f.flurry.maxRecoverMs);

    auto& ai = cfg.ai;
    r.read("ai.desired_distance", ai.desiredDistance);
    r.read("ai.margin", ai.margin);
    r.read("ai.guard_react_distance", ai.guardReactDistance);
    r.read("ai.stance_shuffle_chance", ai.stanceShuffleChance);
    r.read("ai.mirror_chance", ai.mirrorChance);
    r.read("ai.strike_range", ai.strikeRange);
    r.read("ai.kick_chance", ai.kickChance);
    r.read("ai.feint_chance", ai.feintChance);
    r.read("ai.initial_timer_min_ms", ai.initialTimerMinMs);
    r.read("ai.initial_timer_max_ms", ai.initialTimerMaxMs);
    r.read("ai.retry_timer_min_ms", ai.retryTimerMinMs);
    r.read("ai.retry_timer_max_ms", ai.retryTimerMaxMs);

    auto& hz = cfg.hazard;
    r.read("hazard.trigger_index", hz.triggerIndex);
    r.read("hazard.damage", hz.damage);
    r.read("hazard.hit_lag_ms", hz.hitLagMs);
    r.read("hazard.cooldown_ms", hz.cooldownMs);
    r.read("hazard.enter_ms", hz.enterMs);
    r.read("hazard.hover_ms", hz.hoverMs);
    r.read("hazard.dive_ms", hz.diveMs);
    r.read("hazard.rise_ms", hz.riseMs);
    r.read("hazard.dissolve_ms", hz.dissolveMs);
    r.read("hazard.hover_y", hz.hoverY);
    r.read("hazard.entry_offset_x", hz.entryOffsetX);

    r.read("fall.boundary_x", cfg.fall.boundaryX);
    r.read("fall.camera_epsilon", cfg.fall.cameraEpsilon);
    r.read("fall.duration_ms", cfg.fall.durationMs);
    r.read("fall.drop_x", cfg.fall.dropX);
    r.read("fall.drop_y", cfg.fall.dropY);

    r.read("camera.margin_left", cfg.camera.marginLeft);
    r.read("camera.smoothing", cfg.camera.smoothing);

    readRoster(loader, r, cfg.roster);

    if (r.failed()) {
        return Result<GameConfig>::error(r.code(), r.message());
    }

    auto valid = validateGameConfig(cfg);
    if (valid.isError()) {
        return Result<GameConfig>::error(valid.code(), loader.sourceName() + ": " + valid.message());
    }
    return Result<GameConfig>::ok(std::move(cfg));
}

Result<GameConfig> parseGameConfig(std::string_view tomlContent, std::string_view sourceName) {
    auto loader = DataLoader::parse(tomlContent, sourceName);
    if (loader.isError()) {
        return Result<GameConfig>::error(loader.code(), loader.message());
    }
    return gameConfigFromToml(loader.value());
}

Result<GameConfig> loadGameConfig(const std::filesystem::path& path) {
    auto loader = DataLoader::load(path);
    if (loader.isError()) {
        return Result<GameConfig>::error(loader.code(), loader.message());
    }
    auto cfg = gameConfigFromToml(loader.value());
    if (cfg.isOk()) {
        DOJO_LOG_INFO("Loaded config {} ({} enemies)", path.string(), cfg.value().roster.size());
    }
    return cfg;
}

} // namespace dojo
