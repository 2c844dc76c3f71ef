#include "audio.hpp"
#include "../audio_resource.hpp"
#include "../monitors.hpp"
#include <raylib.h>
#include <atomic>
#include <cmath>
#include <memory>

// The mixer callback has no user pointer; the monitor is published here.
static std::atomic<AudioLevelMonitor*> s_level_monitor{nullptr};

static constexpr unsigned int MIXER_CHANNELS = 2;   // raylib mixes f32 stereo
static constexpr float        TONE_HZ        = 440.0f;
static constexpr float        TONE_AMPLITUDE = 0.5f;

static void MeasureMixedOutput(void* buffer, unsigned int frames) {
    AudioLevelMonitor* monitor = s_level_monitor.load(std::memory_order_acquire);
    if (!monitor) return;
    monitor->submit(static_cast<const float*>(buffer),
                    static_cast<std::size_t>(frames) * MIXER_CHANNELS);
}

void AudioSystem::Register(ecs::World& world) {
    auto* monitors = world.try_resource<std::shared_ptr<MonitorResource>>();
    if (!monitors || !*monitors) {
        TraceLog(LOG_WARNING, "AUDIO: no MonitorResource; audio peak stays at floor");
        return;
    }
    s_level_monitor.store(&(*monitors)->audio, std::memory_order_release);
    AttachAudioMixedProcessor(MeasureMixedOutput);
}

void AudioSystem::Unregister() {
    DetachAudioMixedProcessor(MeasureMixedOutput);
    s_level_monitor.store(nullptr, std::memory_order_release);
}

void AudioSystem::GenerateTone(void* buffer, unsigned int frames) {
    static float phase = 0.0f;
    const float step = 2.0f * PI * TONE_HZ / static_cast<float>(AudioResource::SAMPLE_RATE);

    auto* out = static_cast<float*>(buffer);
    for (unsigned int i = 0; i < frames; ++i) {
        out[i] = TONE_AMPLITUDE * std::sin(phase);
        phase += step;
        if (phase > 2.0f * PI) phase -= 2.0f * PI;
    }
}

void AudioSystem::Update(ecs::World& world, float /*dt*/) {
    auto* audio = world.try_resource<AudioResource>();
    if (!audio) return;

    if (IsKeyPressed(KEY_T)) {
        if (audio->tone_playing) StopAudioStream(audio->tone);
        else                     PlayAudioStream(audio->tone);
        audio->tone_playing = !audio->tone_playing;
        TraceLog(LOG_INFO, "AUDIO: test tone %s", audio->tone_playing ? "on" : "off");
    }
}
