#pragma once
#include <JuceHeader.h>
#include "VideoEffect.h"
#include "../rendering/AudioMixer.h"

/**
 * Lays a music bed under the clip's existing audio.
 *
 * Params:
 *   music_path            local audio file (required, decoded by JUCE)
 *   music_volume (0.15)   0..1
 *   voice_volume (1.0)    0..1, applied to the clip's own audio
 *   fade_in (2.0)         seconds, also read as fade_in_duration
 *   fade_out (2.0)        seconds, also read as fade_out_duration
 *
 * The music is looped or trimmed to the clip's length. Frames are untouched.
 */
class BackgroundMusicEffect : public VideoEffect
{
public:
    juce::String getName() const override { return "background_music"; }
    juce::Result checkParams(const juce::var& params) const override;
    EffectOutcome apply(const Clip& clip, const juce::var& params) const override;
    bool introducesMotion() const override { return false; }

    static AudioMixer::MusicSettings readSettings(const juce::var& params);
};
