#pragma once
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioResource — owns the test-tone stream used to drive the audio monitor.
//
// Stored as a World resource. Loaded once at startup (after InitAudioDevice),
// unloaded at shutdown (before CloseAudioDevice). The stream is fed by a
// callback in systems/audio.cpp; it is silent until AudioSystem starts it.
// ---------------------------------------------------------------------------

struct AudioResource {
    static constexpr unsigned int SAMPLE_RATE = 44100;

    AudioStream tone{};
    bool        tone_playing = false;

    void load(AudioCallback generator) {
        tone = LoadAudioStream(SAMPLE_RATE, 32, 1);
        SetAudioStreamCallback(tone, generator);
    }

    void unload() {
        if (tone_playing) StopAudioStream(tone);
        UnloadAudioStream(tone);
        tone_playing = false;
    }
};
