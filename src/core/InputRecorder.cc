#include "dojo/core/InputRecorder.hh"

#include "dojo/core/Log.hh"

#include <fstream>

namespace dojo {

// --- InputRecording convenience methods ---

void InputRecording::addFrame(const InputFrame& frame) {
    frames.push_back(frame);
}

float InputRecording::totalDuration() const {
    float total = 0.0f;
    for (const auto& frame : frames) {
        total += frame.deltaMs;
    }
    return total;
}

uint64_t InputRecording::frameCount() const {
    return static_cast<uint64_t>(frames.size());
}

void InputRecording::clear() {
    frames.clear();
    metadata = InputRecordingMetadata{};
}

// --- InputRecorder state machine ---

RecorderMode InputRecorder::mode() const {
    return currentMode_;
}

bool InputRecorder::isRecording() const {
    return currentMode_ == RecorderMode::Recording;
}

bool InputRecorder::isPlaying() const {
    return currentMode_ == RecorderMode::Playing;
}

bool InputRecorder::beginRecording(uint64_t seed, std::string description) {
    if (currentMode_ == RecorderMode::Playing) {
        return false; // cannot record while playing
    }
    recording_.clear();
    recording_.metadata.seed = seed;
    recording_.metadata.description = std::move(description);
    frameCounter_ = 0;
    currentMode_ = RecorderMode::Recording;
    return true;
}

void InputRecorder::recordFrame(const InputState& input, float deltaMs) {
    if (currentMode_ != RecorderMode::Recording) {
        return;
    }
    recording_.addFrame(InputFrame{frameCounter_++, deltaMs, input});
}

void InputRecorder::stopRecording() {
    if (currentMode_ != RecorderMode::Recording) {
        return;
    }
    recording_.metadata.totalFrames = recording_.frameCount();
    recording_.metadata.totalDuration = recording_.totalDuration();
    currentMode_ = RecorderMode::Idle;
}

bool InputRecorder::startPlayback() {
    if (currentMode_ == RecorderMode::Recording) {
        return false; // cannot play while recording
    }
    if (recording_.frames.empty()) {
        return false; // nothing to play
    }
    playbackCursor_ = 0;
    currentMode_ = RecorderMode::Playing;
    return true;
}

std::optional<InputFrame> InputRecorder::nextFrame() {
    if (currentMode_ != RecorderMode::Playing) {
        return std::nullopt;
    }
    if (playbackCursor_ >= recording_.frames.size()) {
        currentMode_ = RecorderMode::Idle;
        return std::nullopt;
    }
    InputFrame frame = recording_.frames[playbackCursor_++];
    if (playbackCursor_ >= recording_.frames.size()) {
        currentMode_ = RecorderMode::Idle;
    }
    return frame;
}

const InputRecording& InputRecorder::recording() const {
    return recording_;
}

bool InputRecorder::setRecording(InputRecording rec) {
    if (currentMode_ != RecorderMode::Idle) {
        return false; // only set recording when idle
    }
    recording_ = std::move(rec);
    return true;
}

Result<void> InputRecorder::saveToFile(const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out) {
        return Result<void>::error(ErrorCode::IoError, "cannot open " + path.string() + " for writing");
    }
    out << nlohmann::json(recording_).dump(2) << '\n';
    if (!out) {
        return Result<void>::error(ErrorCode::IoError, "failed writing " + path.string());
    }
    DOJO_LOG_INFO("Saved {} input frames to {}", recording_.frameCount(), path.string());
    return Result<void>::ok();
}

Result<void> InputRecorder::loadFromFile(const std::filesystem::path& path) {
    if (currentMode_ != RecorderMode::Idle) {
        return Result<void>::error(ErrorCode::InvalidState, "recorder is busy");
    }

    std::ifstream in(path);
    if (!in) {
        return Result<void>::error(ErrorCode::NotFound, "cannot open recording " + path.string());
    }

    try {
        auto j = nlohmann::json::parse(in);
        recording_ = j.get<InputRecording>();
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::error(ErrorCode::ParseError, path.string() + ": " + e.what());
    }

    DOJO_LOG_INFO("Loaded {} input frames (seed {}) from {}", recording_.frameCount(), recording_.metadata.seed,
                  path.string());
    return Result<void>::ok();
}

// --- InputState JSON ---

void to_json(nlohmann::json& j, const InputState& s) {
    j = nlohmann::json{{"left", s.left},
                       {"right", s.right},
                       {"stanceUp", s.stanceUp},
                       {"stanceDown", s.stanceDown},
                       {"punch", s.punch},
                       {"kick", s.kick},
                       {"toggleFlurry", s.toggleFlurry},
                       {"reset", s.reset}};
}

void from_json(const nlohmann::json& j, InputState& s) {
    s.left = j.value("left", false);
    s.right = j.value("right", false);
    s.stanceUp = j.value("stanceUp", false);
    s.stanceDown = j.value("stanceDown", false);
    s.punch = j.value("punch", false);
    s.kick = j.value("kick", false);
    s.toggleFlurry = j.value("toggleFlurry", false);
    s.reset = j.value("reset", false);
}

// --- InputFrame JSON ---

void to_json(nlohmann::json& j, const InputFrame& f) {
    j = nlohmann::json{{"frameNumber", f.frameNumber}, {"deltaMs", f.deltaMs}, {"input", f.input}};
}

void from_json(const nlohmann::json& j, InputFrame& f) {
    f.frameNumber = j.value("frameNumber", static_cast<uint64_t>(0));
    f.deltaMs = j.value("deltaMs", 0.0f);
    f.input = j.value("input", InputState{});
}

// --- InputRecordingMetadata JSON ---

void to_json(nlohmann::json& j, const InputRecordingMetadata& m) {
    j = nlohmann::json{{"version", m.version},
                       {"description", m.description},
                       {"seed", m.seed},
                       {"totalFrames", m.totalFrames},
                       {"totalDuration", m.totalDuration}};
}

void from_json(const nlohmann::json& j, InputRecordingMetadata& m) {
    m.version = j.value("version", std::string{"1.0"});
    m.description = j.value("description", std::string{});
    m.seed = j.value("seed", static_cast<uint64_t>(0));
    m.totalFrames = j.value("totalFrames", static_cast<uint64_t>(0));
    m.totalDuration = j.value("totalDuration", 0.0f);
}

// --- InputRecording JSON ---

void to_json(nlohmann::json& j, const InputRecording& r) {
    j = nlohmann::json{{"metadata", r.metadata}, {"frames", r.frames}};
}

void from_json(const nlohmann::json& j, InputRecording& r) {
    if (j.contains("metadata")) {
        r.metadata = j["metadata"].get<InputRecordingMetadata>();
    } else {
        r.metadata = InputRecordingMetadata{};
    }
    r.frames = j.value("frames", std::vector<InputFrame>{});
}

} // namespace dojo
