#pragma once

#include "dojo/core/InputState.hh"
#include "dojo/utils/ErrorHandling.hh"

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dojo {

/// Recorder state machine modes
enum class RecorderMode {
    Idle,
    Recording,
    Playing
};

/// One simulation tick of recorded input
struct InputFrame {
    uint64_t frameNumber = 0;
    float deltaMs = 0.0f; ///< Raw frame delta handed to Game::advance
    InputState input;

    bool operator==(const InputFrame& other) const = default;
};

/// Recording metadata
struct InputRecordingMetadata {
    std::string version = "1.0";
    std::string description;
    uint64_t seed = 0; ///< Session seed the frames were captured under
    uint64_t totalFrames = 0;
    float totalDuration = 0.0f; ///< Milliseconds

    bool operator==(const InputRecordingMetadata& other) const = default;
};

/// A complete input recording: sequence of frames with metadata
struct InputRecording {
    std::vector<InputFrame> frames;
    InputRecordingMetadata metadata;

    /// Append a frame to the recording
    void addFrame(const InputFrame& frame);

    /// Sum of all frame deltas
    float totalDuration() const;

    /// Number of recorded frames
    uint64_t frameCount() const;

    /// Reset to empty state
    void clear();

    bool operator==(const InputRecording& other) const = default;
};

/// State-machine controller for recording and replaying per-tick input.
/// Replaying under the recorded seed reproduces the session exactly.
class InputRecorder {
  public:
    InputRecorder() = default;

    // --- State queries ---
    RecorderMode mode() const;
    bool isRecording() const;
    bool isPlaying() const;

    // --- Recording ---

    /// Switch to Recording mode (clears any previous recording).
    /// Fails (returns false) if Playing.
    bool beginRecording(uint64_t seed, std::string description = "");

    /// Append one tick of input (only while Recording).
    void recordFrame(const InputState& input, float deltaMs);

    /// Switch from Recording to Idle. Finalizes metadata.
    /// No-op if not Recording.
    void stopRecording();

    // --- Playback ---

    /// Switch to Playing mode and reset the playback cursor.
    /// Fails (returns false) if Recording or if the recording is empty.
    bool startPlayback();

    /// Next frame to feed, or nullopt once playback is exhausted.
    std::optional<InputFrame> nextFrame();

    // --- Access to underlying recording ---

    const InputRecording& recording() const;

    /// Replace the current recording (must be Idle).
    bool setRecording(InputRecording rec);

    // --- Files ---

    Result<void> saveToFile(const std::filesystem::path& path) const;
    Result<void> loadFromFile(const std::filesystem::path& path);

  private:
    RecorderMode currentMode_ = RecorderMode::Idle;
    InputRecording recording_;
    uint64_t frameCounter_ = 0;
    size_t playbackCursor_ = 0;
};

// --- ADL JSON serialization (nlohmann convention) ---

void to_json(nlohmann::json& j, const InputState& s);
void from_json(const nlohmann::json& j, InputState& s);

void to_json(nlohmann::json& j, const InputFrame& f);
void from_json(const nlohmann::json& j, InputFrame& f);

void to_json(nlohmann::json& j, const InputRecordingMetadata& m);
void from_json(const nlohmann::json& j, InputRecordingMetadata& m);

void to_json(nlohmann::json& j, const InputRecording& r);
void from_json(const nlohmann::json& j, InputRecording& r);

} // namespace dojo
