#include "BackgroundMusicEffect.h"
#include "../utils/VarHelpers.h"

namespace
{
    juce::File readMusicFile(const juce::var& params)
    {
        const auto path = VarHelpers::getString(params, "music_path");
        return juce::File::isAbsolutePath(path) ? juce::File(path) : juce::File();
    }

    double readSeconds(const juce::var& params, const juce::Identifier& key,
                       const juce::Identifier& alias, double fallback)
    {
        return VarHelpers::getDouble(params, key, VarHelpers::getDouble(params, alias, fallback));
    }
}

AudioMixer::MusicSettings BackgroundMusicEffect::readSettings(const juce::var& params)
{
    AudioMixer::MusicSettings settings;
    settings.musicVolume = VarHelpers::getDouble(params, "music_volume", settings.musicVolume);
    settings.voiceVolume = VarHelpers::getDouble(params, "voice_volume", settings.voiceVolume);
    settings.fadeIn = juce::jmax(0.0, readSeconds(params, "fade_in", "fade_in_duration", settings.fadeIn));
    settings.fadeOut = juce::jmax(0.0, readSeconds(params, "fade_out", "fade_out_duration", settings.fadeOut));
    return settings;
}

juce::Result BackgroundMusicEffect::checkParams(const juce::var& params) const
{
    if (!readMusicFile(params).existsAsFile())
        return juce::Result::fail("Music file not found: " + VarHelpers::getString(params, "music_path"));

    const auto settings = readSettings(params);

    if (settings.musicVolume < 0.0 || settings.musicVolume > 1.0)
        return juce::Result::fail("music_volume must be between 0 and 1");

    if (settings.voiceVolume < 0.0 || settings.voiceVolume > 1.0)
        return juce::Result::fail("voice_volume must be between 0 and 1");

    return juce::Result::ok();
}

EffectOutcome BackgroundMusicEffect::apply(const Clip& clip, const juce::var& params) const
{
    if (!clip.isValid())
        return EffectOutcome::failure("background_music needs a non-empty clip");

    AudioMixer mixer;
    const auto music = mixer.loadTrack(readMusicFile(params));
    if (music == nullptr || music->buffer.getNumSamples() == 0)
        return EffectOutcome::failure("Could not decode music file: " + VarHelpers::getString(params, "music_path"));

    auto result = clip;
    result.audio = AudioMixer::mixWithMusic(clip.audio, *music, clip.duration, readSettings(params));
    return EffectOutcome::success(result);
}
