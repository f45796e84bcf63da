#include "dojo/core/Constants.g.hh"
#include "dojo/core/Game.hh"
#include "dojo/core/GameConfig.hh"
#include "dojo/core/InputManager.hh"
#include "dojo/core/InputRecorder.hh"
#include "dojo/core/Log.hh"
#include "dojo/parser/ArgumentParser.hh"

#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr float kHeadlessStepMs = 1000.0f / 60.0f;
constexpr int kWindowHeight = 720;

struct Color {
    Uint8 r, g, b, a;
};

void fillRect(SDL_Renderer* renderer, const dojo::Rect& rect, float camX, Color c) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_FRect r{rect.x - camX, rect.y, rect.w, rect.h};
    SDL_RenderFillRect(renderer, &r);
}

void outlineRect(SDL_Renderer* renderer, const dojo::Rect& rect, float camX, Color c) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_FRect r{rect.x - camX, rect.y, rect.w, rect.h};
    SDL_RenderRect(renderer, &r);
}

Uint8 alpha(float opacity) {
    return static_cast<Uint8>(255.0f * opacity);
}

void drawFighter(SDL_Renderer* renderer, const dojo::Fighter& f, float camX, Color body) {
    if (!f.alive() && f.state() != dojo::FighterState::Fall) {
        body = Color{70, 70, 80, 160};
    }
    body.a = static_cast<Uint8>(body.a * f.opacity());
    fillRect(renderer, f.bounds(), camX, body);

    // Guard band highlighted
    if (f.alive()) {
        outlineRect(renderer, f.hurtbox(f.stance()), camX, Color{255, 255, 255, alpha(0.8f * f.opacity())});
    }

    if (auto hitbox = f.activeHitbox()) {
        fillRect(renderer, *hitbox, camX, Color{255, 59, 77, 220});
    }
}

void drawBar(SDL_Renderer* renderer, float x, float y, float fraction, Color c) {
    SDL_SetRenderDrawColor(renderer, 30, 30, 36, 255);
    SDL_FRect back{x, y, 300.0f, 14.0f};
    SDL_RenderFillRect(renderer, &back);
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_FRect front{x, y, 300.0f * fraction, 14.0f};
    SDL_RenderFillRect(renderer, &front);
}

const char* messageText(dojo::StatusMessage message) {
    switch (message) {
        case dojo::StatusMessage::Greeting:     return "Rei - bow to your opponent";
        case dojo::StatusMessage::Guard:        return "Kamae - guard up";
        case dojo::StatusMessage::Advance:      return "Advance ->";
        case dojo::StatusMessage::HazardPrompt: return "Strike the pest!";
        case dojo::StatusMessage::DebugTag:     return "[DEBUG: flurry]";
        case dojo::StatusMessage::Win:          return "Victory!  R to restart";
        case dojo::StatusMessage::LoseCombat:   return "Defeat...  R to retry";
        case dojo::StatusMessage::LoseFall:     return "Lost to the sea...  R to retry";
        case dojo::StatusMessage::None:         return "";
    }
    return "";
}

void renderFrame(SDL_Renderer* renderer, const dojo::Game& game) {
    const auto& hud = game.summary();
    const auto& world = game.config().world;
    float camX = hud.cameraOffset;

    SDL_SetRenderDrawColor(renderer, 15, 22, 32, 255);
    SDL_RenderClear(renderer);

    SDL_SetRenderDrawColor(renderer, 26, 37, 51, 255);
    SDL_FRect ground{0.0f, world.groundY, world.viewWidth, static_cast<float>(kWindowHeight) - world.groundY};
    SDL_RenderFillRect(renderer, &ground);

    for (const auto& e : game.enemies()) {
        drawFighter(renderer, e, camX, Color{255, 179, 189, 255});
    }
    drawFighter(renderer, game.player(), camX, Color{183, 235, 255, 255});

    if (const auto* hazard = game.hazard()) {
        fillRect(renderer, hazard->bounds(), camX, Color{120, 200, 90, alpha(hazard->opacity())});
    }

    drawBar(renderer, 20.0f, 20.0f, hud.playerHealth, Color{90, 200, 255, 255});
    drawBar(renderer, world.viewWidth - 320.0f, 20.0f, hud.opponentHealth, Color{255, 90, 110, 255});

    const char* text = messageText(hud.message);
    if (text[0] != '\0') {
        SDL_SetRenderDrawColor(renderer, 255, 255, 255, alpha(hud.messageOpacity));
        SDL_RenderDebugText(renderer, world.viewWidth * 0.5f - 100.0f, 120.0f, text);
    }

    SDL_RenderPresent(renderer);
}

void logOutcome(const dojo::Game& game) {
    const auto& hud = game.summary();
    DOJO_LOG_SESSION("Final: session={} reason={} player={:.2f} opponent={:.2f} ticks={}",
                     dojo::sessionStateToString(hud.session), dojo::loseReasonToString(hud.loseReason),
                     hud.playerHealth, hud.opponentHealth, game.tickCount());
}

// Fixed-step run without a window. Replays frames when given, else idles.
void runHeadless(dojo::Game& game, float seconds, dojo::InputRecorder& replay, dojo::InputRecorder& recorder) {
    float remainingMs = seconds * 1000.0f;
    bool replaying = replay.isPlaying();

    while (remainingMs > 0.0f || replaying) {
        dojo::InputState input;
        float dt = kHeadlessStepMs;
        if (replaying) {
            auto frame = replay.nextFrame();
            if (!frame)
                break;
            input = frame->input;
            dt = frame->deltaMs;
        }

        recorder.recordFrame(input, dt);
        game.advance(dt, input);
        remainingMs -= dt;
    }
}

int runWindowed(dojo::Game& game, dojo::InputRecorder& replay, dojo::InputRecorder& recorder) {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        DOJO_LOG_CRITICAL("SDL init failed: {}", SDL_GetError());
        return 1;
    }

    const auto& world = game.config().world;
    SDL_Window* window = SDL_CreateWindow(dojo::APP_NAME, static_cast<int>(world.viewWidth), kWindowHeight, 0);
    if (!window) {
        DOJO_LOG_CRITICAL("Window creation failed: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, nullptr);
    if (!renderer) {
        DOJO_LOG_CRITICAL("Renderer creation failed: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_SetRenderVSync(renderer, 1);
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    dojo::InputManager input;
    bool replaying = replay.isPlaying();
    Uint64 last = SDL_GetTicks();

    while (!input.quitRequested()) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            input.processEvent(event);
        }

        Uint64 now = SDL_GetTicks();
        float dt = static_cast<float>(now - last);
        last = now;

        dojo::InputState frameInput = input.state();
        if (replaying) {
            auto frame = replay.nextFrame();
            if (!frame)
                break;
            frameInput = frame->input;
            dt = frame->deltaMs;
        }

        recorder.recordFrame(frameInput, dt);
        game.advance(dt, frameInput);
        input.consumeEdges();

        renderFrame(renderer, game);
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    dojo::log::init();
    DOJO_LOG_INFO("Starting {} {}", dojo::APP_NAME, dojo::APP_VERSION);

    dojo::ArgumentParser argParser;
    argParser.addArgument("--help", "Display help information");
    argParser.addArgument("--version", "Display version information");
    argParser.addArgument("--config", "Load settings from a TOML file", true);
    argParser.addArgument("--seed", "Override the RNG seed", true);
    argParser.addArgument("--headless", "Run N seconds without a window", true);
    argParser.addArgument("--record", "Record input frames to a JSON file", true);
    argParser.addArgument("--replay", "Replay input frames from a JSON file", true);

    if (!argParser.parse(argc, argv)) {
        std::cerr << argParser.getErrorMsg() << std::endl;
        std::cerr << "Options:" << std::endl << argParser.helpText();
        dojo::log::shutdown();
        return 2;
    }

    if (argParser.hasArgument("--version")) {
        std::cout << dojo::APP_NAME << " version " << dojo::APP_VERSION << std::endl;
        dojo::log::shutdown();
        return 0;
    }

    if (argParser.hasArgument("--help")) {
        std::cout << "Usage: " << dojo::APP_EXECUTABLE_NAME << " [options]" << std::endl;
        std::cout << "Options:" << std::endl << argParser.helpText();
        dojo::log::shutdown();
        return 0;
    }

    try {
        dojo::GameConfig config;
        if (auto path = argParser.getValue("--config")) {
            auto loaded = dojo::loadGameConfig(*path);
            if (loaded.isError()) {
                DOJO_LOG_CRITICAL("Config error ({}): {}", dojo::errorCodeToString(loaded.code()), loaded.message());
                dojo::log::shutdown();
                return 1;
            }
            config = std::move(loaded.value());
        }
        if (auto seed = argParser.getValue("--seed")) {
            config.seed = std::stoull(*seed);
        }

        dojo::InputRecorder replay;
        if (auto path = argParser.getValue("--replay")) {
            auto loaded = replay.loadFromFile(*path);
            if (loaded.isError()) {
                DOJO_LOG_CRITICAL("Replay error ({}): {}", dojo::errorCodeToString(loaded.code()), loaded.message());
                dojo::log::shutdown();
                return 1;
            }
            config.seed = replay.recording().metadata.seed;
            if (!replay.startPlayback()) {
                DOJO_LOG_WARN("Replay {} has no frames", *path);
            }
        }

        dojo::Game game(config);

        dojo::InputRecorder recorder;
        auto recordPath = argParser.getValue("--record");
        if (recordPath) {
            recorder.beginRecording(game.seed(), "dojo session");
        }

        int rc = 0;
        if (auto seconds = argParser.getValue("--headless")) {
            runHeadless(game, std::stof(*seconds), replay, recorder);
        } else {
            rc = runWindowed(game, replay, recorder);
        }
        logOutcome(game);

        if (recordPath) {
            recorder.stopRecording();
            auto saved = recorder.saveToFile(*recordPath);
            if (saved.isError()) {
                DOJO_LOG_ERROR("Recording not saved: {}", saved.message());
                rc = 1;
            }
        }

        dojo::log::shutdown();
        return rc;

    } catch (const std::exception& e) {
        DOJO_LOG_ERROR("Fatal: {}", e.what());
        dojo::log::shutdown();
        return 1;
    }
}
