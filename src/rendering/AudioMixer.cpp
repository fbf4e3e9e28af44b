#include "AudioMixer.h"

namespace
{
    constexpr float limiterThreshold = 0.891f; // -1dB

    // Resamples one channel with a Lagrange interpolator
    void resampleChannel(const float* input, int numInput, float* output, int numOutput, double ratio)
    {
        juce::LagrangeInterpolator interpolator;
        interpolator.reset();
        interpolator.process(ratio, input, output, numOutput, numInput, 0);
    }
}

AudioMixer::AudioMixer()
    : formatManager(std::make_unique<juce::AudioFormatManager>())
{
    formatManager->registerBasicFormats();
}

AudioMixer::~AudioMixer()
{
}

void AudioMixer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

//==============================================================================
std::shared_ptr<AudioTrack> AudioMixer::loadTrack(const juce::File& file) const
{
    if (!file.existsAsFile())
    {
        if (logCallback)
            logCallback("ERROR: Audio file does not exist: " + file.getFullPathName());
        return nullptr;
    }

    std::unique_ptr<juce::AudioFormatReader> reader (formatManager->createReaderFor(file));
    if (reader == nullptr)
    {
        if (logCallback)
            logCallback("ERROR: Unsupported audio file: " + file.getFileName());
        return nullptr;
    }

    const auto sourceLength = (int) reader->lengthInSamples;
    const auto sourceChannels = (int) reader->numChannels;

    juce::AudioBuffer<float> decoded (juce::jmax(1, sourceChannels), sourceLength);
    reader->read(&decoded, 0, sourceLength, 0, true, true);

    auto track = std::make_shared<AudioTrack>();
    track->sampleRate = sampleRate;

    const double ratio = reader->sampleRate / sampleRate;
    const int outputLength = ratio == 1.0 ? sourceLength
                                          : (int) std::floor((double) sourceLength / ratio);

    track->buffer.setSize(numChannels, outputLength);
    track->buffer.clear();

    for (int channel = 0; channel < numChannels; ++channel)
    {
        // Mono sources are duplicated into both channels
        const int sourceChannel = juce::jmin(channel, decoded.getNumChannels() - 1);

        if (ratio == 1.0)
            track->buffer.copyFrom(channel, 0, decoded, sourceChannel, 0, outputLength);
        else
            resampleChannel(decoded.getReadPointer(sourceChannel), sourceLength,
                            track->buffer.getWritePointer(channel), outputLength, ratio);
    }

    if (logCallback)
        logCallback("Loaded audio " + file.getFileName() + " (" + juce::String(track->getDuration(), 2) + "s, "
                    + juce::String(reader->sampleRate, 0) + " Hz, " + juce::String(sourceChannels) + " ch)");

    return track;
}

//==============================================================================
std::shared_ptr<AudioTrack> AudioMixer::concatenate(const std::vector<std::shared_ptr<const AudioTrack>>& tracks)
{
    int totalSamples = 0;
    for (const auto& track : tracks)
        if (track != nullptr)
            totalSamples += track->buffer.getNumSamples();

    auto joined = std::make_shared<AudioTrack>();
    joined->sampleRate = sampleRate;
    joined->buffer.setSize(numChannels, totalSamples);
    joined->buffer.clear();

    int position = 0;
    for (const auto& track : tracks)
    {
        if (track == nullptr)
            continue;

        const int length = track->buffer.getNumSamples();
        for (int channel = 0; channel < numChannels; ++channel)
        {
            const int sourceChannel = juce::jmin(channel, track->buffer.getNumChannels() - 1);
            if (sourceChannel >= 0 && length > 0)
                joined->buffer.copyFrom(channel, position, track->buffer, sourceChannel, 0, length);
        }

        position += length;
    }

    return joined;
}

std::shared_ptr<AudioTrack> AudioMixer::loopToLength(const AudioTrack& track, double duration)
{
    auto looped = std::make_shared<AudioTrack>();
    looped->sampleRate = track.sampleRate;

    const int targetSamples = (int) std::llround(duration * track.sampleRate);
    const int sourceSamples = track.buffer.getNumSamples();
    const int channels = track.buffer.getNumChannels();

    looped->buffer.setSize(juce::jmax(1, channels), juce::jmax(0, targetSamples));
    looped->buffer.clear();

    if (sourceSamples == 0 || targetSamples <= 0)
        return looped;

    for (int position = 0; position < targetSamples; position += sourceSamples)
    {
        const int count = juce::jmin(sourceSamples, targetSamples - position);
        for (int channel = 0; channel < channels; ++channel)
            looped->buffer.copyFrom(channel, position, track.buffer, channel, 0, count);
    }

    return looped;
}

std::shared_ptr<AudioTrack> AudioMixer::mixWithMusic(const std::shared_ptr<const AudioTrack>& voice,
                                                     const AudioTrack& music,
                                                     double duration,
                                                     const MusicSettings& settings)
{
    auto mixed = loopToLength(music, duration);
    auto& buffer = mixed->buffer;
    const int totalSamples = buffer.getNumSamples();

    const int fadeInSamples = juce::jmin(totalSamples, (int) std::llround(settings.fadeIn * mixed->sampleRate));
    const int fadeOutSamples = juce::jmin(totalSamples, (int) std::llround(settings.fadeOut * mixed->sampleRate));

    if (fadeInSamples > 0)
        applyFade(buffer, 0, fadeInSamples, true);
    if (fadeOutSamples > 0)
        applyFade(buffer, totalSamples - fadeOutSamples, fadeOutSamples, false);

    buffer.applyGain((float) settings.musicVolume);

    if (voice != nullptr)
    {
        const int voiceSamples = juce::jmin(totalSamples, voice->buffer.getNumSamples());
        for (int channel = 0; channel < buffer.getNumChannels(); ++channel)
        {
            const int sourceChannel = juce::jmin(channel, voice->buffer.getNumChannels() - 1);
            if (sourceChannel >= 0 && voiceSamples > 0)
                buffer.addFrom(channel, 0, voice->buffer, sourceChannel, 0, voiceSamples, (float) settings.voiceVolume);
        }
    }

    applyLimiter(buffer);
    return mixed;
}

//==============================================================================
void AudioMixer::applyFade(juce::AudioBuffer<float>& buffer, int startSample, int numSamples, bool fadeIn)
{
    if (numSamples <= 0 || startSample < 0 || startSample + numSamples > buffer.getNumSamples())
        return;

    for (int channel = 0; channel < buffer.getNumChannels(); ++channel)
    {
        float* data = buffer.getWritePointer(channel, startSample);

        for (int i = 0; i < numSamples; ++i)
        {
            float alpha = static_cast<float>(i) / static_cast<float>(numSamples);

            if (!fadeIn)
                alpha = 1.0f - alpha;

            data[i] *= alpha * alpha * (3.0f - 2.0f * alpha);
        }
    }
}

float AudioMixer::applyLimiter(juce::AudioBuffer<float>& buffer)
{
    float peakLevel = 0.0f;
    for (int channel = 0; channel < buffer.getNumChannels(); ++channel)
        peakLevel = juce::jmax(peakLevel, buffer.getMagnitude(channel, 0, buffer.getNumSamples()));

    if (peakLevel <= limiterThreshold)
        return 1.0f;

    const float limitFactor = limiterThreshold / peakLevel;
    buffer.applyGain(limitFactor);
    return limitFactor;
}

bool AudioMixer::writeWav(const AudioTrack& track, const juce::File& outputFile) const
{
    if (outputFile.existsAsFile())
        outputFile.deleteFile();

    auto stream = std::make_unique<juce::FileOutputStream>(outputFile);
    if (!stream->openedOk())
    {
        if (logCallback)
            logCallback("ERROR: Cannot open audio output: " + outputFile.getFullPathName());
        return false;
    }

    juce::WavAudioFormat wavFormat;
    std::unique_ptr<juce::AudioFormatWriter> writer (wavFormat.createWriterFor(stream.get(),
                                                                               track.sampleRate,
                                                                               (unsigned int) track.buffer.getNumChannels(),
                                                                               24,
                                                                               {},
                                                                               0));
    if (writer == nullptr)
    {
        if (logCallback)
            logCallback("ERROR: Failed to create audio file writer");
        return false;
    }

    // The writer owns the stream from here on
    stream.release();

    if (!writer->writeFromAudioSampleBuffer(track.buffer, 0, track.buffer.getNumSamples()))
    {
        if (logCallback)
            logCallback("ERROR: Failed to write audio samples");
        return false;
    }

    writer.reset();

    if (logCallback)
        logCallback("Audio written: " + outputFile.getFullPathName() + " ("
                    + juce::String(outputFile.getSize() / 1024) + " KB)");

    return outputFile.existsAsFile();
}
