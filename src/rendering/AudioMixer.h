#pragma once
#include <JuceHeader.h>
#include <memory>
#include <vector>
#include "Clip.h"

/**
 * Loads, combines and writes the audio that accompanies a render:
 * narration, per-section narration files and background music.
 *
 * All tracks are brought to 44.1 kHz stereo on load so they can be summed
 * and concatenated sample for sample.
 */
class AudioMixer
{
public:
    static constexpr double sampleRate = 44100.0;
    static constexpr int numChannels = 2;

    /** How background music is laid under narration */
    struct MusicSettings
    {
        double musicVolume = 0.15;
        double voiceVolume = 1.0;
        double fadeIn = 2.0;
        double fadeOut = 2.0;
    };

    AudioMixer();
    ~AudioMixer();

    /**
     * Sets a callback for receiving log messages.
     * @param callback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Decodes an audio file into a 44.1 kHz stereo track.
     *
     * @param file  A file in a format JUCE can read (WAV, AIFF, FLAC, Ogg)
     * @return      The decoded track, or nullptr if the file cannot be read
     */
    std::shared_ptr<AudioTrack> loadTrack(const juce::File& file) const;

    /** Joins tracks end to end in the given order. Null entries are skipped. */
    static std::shared_ptr<AudioTrack> concatenate(const std::vector<std::shared_ptr<const AudioTrack>>& tracks);

    /**
     * Repeats a track until it covers the duration, then trims it to exactly
     * that length.
     */
    static std::shared_ptr<AudioTrack> loopToLength(const AudioTrack& track, double duration);

    /**
     * Lays music under a voice track.
     *
     * The music is looped and trimmed to the duration, faded in and out, and
     * both tracks are scaled by their volumes before being summed. A missing
     * voice track is treated as silence.
     */
    static std::shared_ptr<AudioTrack> mixWithMusic(const std::shared_ptr<const AudioTrack>& voice,
                                                    const AudioTrack& music,
                                                    double duration,
                                                    const MusicSettings& settings);

    /**
     * Applies a fade to part of a buffer using a smoothstep gain curve.
     * @param buffer       The audio buffer to apply the fade to
     * @param startSample  The sample index to start the fade at
     * @param numSamples   The number of samples to fade
     * @param fadeIn       true for fade in, false for fade out
     */
    static void applyFade(juce::AudioBuffer<float>& buffer, int startSample, int numSamples, bool fadeIn);

    /** Scales the buffer down if its peak exceeds -1 dBFS. Returns the gain applied. */
    static float applyLimiter(juce::AudioBuffer<float>& buffer);

    /** Writes a track as a 24-bit WAV file. */
    bool writeWav(const AudioTrack& track, const juce::File& outputFile) const;

private:
    std::unique_ptr<juce::AudioFormatManager> formatManager;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioMixer)
};
