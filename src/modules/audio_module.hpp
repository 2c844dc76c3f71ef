#pragma once
#include "../audio_resource.hpp"
#include "../pipeline.hpp"
#include "../systems/audio.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioModule
//
// Initialises Raylib's audio device, loads the AudioResource (test tone),
// attaches the output peak meter and adds AudioSystem to the Logic phase.
//
// Requires MonitorModule (the peak meter writes into its AudioLevelMonitor).
//
// shutdown() detaches the meter, unloads the stream and closes the audio
// device. Must be called before CloseWindow().
// ---------------------------------------------------------------------------

struct AudioModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        InitAudioDevice();
        AudioResource audio;
        audio.load(AudioSystem::GenerateTone);
        world.set_resource(std::move(audio));
        AudioSystem::Register(world);
        pipeline.add_logic([](ecs::World& w, float dt) { AudioSystem::Update(w, dt); });
    }

    static void shutdown(ecs::World& world) {
        AudioSystem::Unregister();
        world.resource<AudioResource>().unload();
        CloseAudioDevice();
    }
};
