#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AudioSystem — Logic-phase system; toggles the test tone with T.
//
// Register() hooks the MonitorResource's AudioLevelMonitor into raylib's
// mixed-output processor so every mixed buffer is peak-measured on the audio
// thread. Unregister() must run before CloseAudioDevice().
// ---------------------------------------------------------------------------

class AudioSystem {
public:
    static void Register(ecs::World& world);
    static void Unregister();
    static void Update(ecs::World& world, float dt);

    // AudioStream callback producing a 440 Hz sine at -6 dBFS.
    static void GenerateTone(void* buffer, unsigned int frames);
};
