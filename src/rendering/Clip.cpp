#include "Clip.h"

juce::Image Clip::renderFrame(double t) const
{
    if (!isValid())
        return ClipOps::createBlankFrame(juce::jmax(1, width), juce::jmax(1, height));

    return frameAt(juce::jlimit(0.0, duration, t));
}

//==============================================================================
namespace ClipOps
{
    juce::Image createBlankFrame(int width, int height)
    {
        return juce::Image(juce::Image::ARGB, juce::jmax(1, width), juce::jmax(1, height), true);
    }

    Clip createStill(const juce::Image& image, double duration)
    {
        Clip clip;
        clip.width = image.getWidth();
        clip.height = image.getHeight();
        clip.duration = duration;
        clip.animated = false;
        clip.frameAt = [image](double) { return image; };
        return clip;
    }

    Clip createSolid(juce::Colour colour, int width, int height, double duration)
    {
        auto frame = createBlankFrame(width, height);
        {
            juce::Graphics g(frame);
            g.fillAll(colour);
        }
        return createStill(frame, duration);
    }

    Clip fitToDuration(const Clip& clip, double duration)
    {
        if (!clip.isValid() || duration <= 0.0)
            return clip;

        auto fitted = clip;
        fitted.duration = duration;

        if (duration > clip.duration)
        {
            const auto source = clip.frameAt;
            const double sourceDuration = clip.duration;
            fitted.frameAt = [source, sourceDuration](double t)
            {
                return source(std::fmod(t, sourceDuration));
            };
        }

        if (clip.audio != nullptr && clip.audio->getDuration() > duration)
            fitted.audio = sliceAudio(clip.audio, 0.0, duration);

        return fitted;
    }

    Clip concatenate(const Clip& first, const Clip& second)
    {
        if (!first.isValid())
            return second;
        if (!second.isValid())
            return first;

        Clip joined;
        joined.width = first.width;
        joined.height = first.height;
        joined.duration = first.duration + second.duration;
        joined.animated = first.animated || second.animated;
        joined.containsVideo = first.containsVideo || second.containsVideo;
        joined.audio = appendAudio(first.audio, second.audio, first.duration);

        const auto a = first.frameAt;
        const auto b = second.frameAt;
        const double split = first.duration;
        const bool sameSize = first.width == second.width && first.height == second.height;
        const int w = first.width, h = first.height;

        joined.frameAt = [a, b, split, sameSize, w, h](double t)
        {
            if (t < split)
                return a(t);

            auto frame = b(t - split);
            if (sameSize)
                return frame;

            return frame.rescaled(w, h, juce::Graphics::mediumResamplingQuality);
        };

        return joined;
    }

    Clip placeOnCanvas(const Clip& clip, int canvasWidth, int canvasHeight,
                       juce::Rectangle<int> bounds, juce::Colour background)
    {
        auto placed = clip;
        placed.width = canvasWidth;
        placed.height = canvasHeight;

        const auto source = clip.frameAt;
        const auto target = bounds.toFloat();

        placed.frameAt = [source, canvasWidth, canvasHeight, target, background](double t)
        {
            auto canvas = createBlankFrame(canvasWidth, canvasHeight);
            {
                juce::Graphics g(canvas);

                if (!background.isTransparent())
                    g.fillAll(background);

                g.drawImage(source(t), target, juce::RectanglePlacement::stretchToFit);
            }
            return canvas;
        };

        // A still placed on a canvas is still a still: render it once
        if (!clip.animated)
        {
            const auto frame = placed.frameAt(0.0);
            placed.frameAt = [frame](double) { return frame; };
        }

        return placed;
    }

    juce::Image withOpacity(const juce::Image& image, float opacity)
    {
        auto copy = image.convertedToFormat(juce::Image::ARGB).createCopy();
        if (opacity < 1.0f)
            copy.multiplyAllAlphas(juce::jlimit(0.0f, 1.0f, opacity));
        return copy;
    }

    juce::Image coverToSize(const juce::Image& image, int width, int height)
    {
        auto result = createBlankFrame(width, height);
        if (!image.isValid())
            return result;

        {
            juce::Graphics g(result);
            g.setImageResamplingQuality(juce::Graphics::highResamplingQuality);
            g.drawImage(image, juce::Rectangle<float>(0.0f, 0.0f, (float) width, (float) height),
                        juce::RectanglePlacement::centred | juce::RectanglePlacement::fillDestination);
        }
        return result;
    }

    //==============================================================================
    std::shared_ptr<const AudioTrack> sliceAudio(const std::shared_ptr<const AudioTrack>& audio,
                                                 double start, double length)
    {
        if (audio == nullptr || length <= 0.0)
            return nullptr;

        auto track = std::make_shared<AudioTrack>();
        track->sampleRate = audio->sampleRate;

        const int numChannels = audio->buffer.getNumChannels();
        const int totalSamples = (int) std::llround(length * audio->sampleRate);
        const int startSample = (int) std::llround(juce::jmax(0.0, start) * audio->sampleRate);

        track->buffer.setSize(numChannels, totalSamples);
        track->buffer.clear();

        const int available = juce::jmax(0, audio->buffer.getNumSamples() - startSample);
        const int toCopy = juce::jmin(available, totalSamples);

        for (int channel = 0; channel < numChannels && toCopy > 0; ++channel)
            track->buffer.copyFrom(channel, 0, audio->buffer, channel, startSample, toCopy);

        return track;
    }

    std::shared_ptr<const AudioTrack> appendAudio(const std::shared_ptr<const AudioTrack>& first,
                                                  const std::shared_ptr<const AudioTrack>& second,
                                                  double firstDuration)
    {
        if (first == nullptr && second == nullptr)
            return nullptr;

        const double sampleRate = first != nullptr ? first->sampleRate : second->sampleRate;
        const int numChannels = juce::jmax(first != nullptr ? first->buffer.getNumChannels() : 0,
                                           second != nullptr ? second->buffer.getNumChannels() : 0);

        // The second track starts where the first clip's pictures end
        const int offset = (int) std::llround(firstDuration * sampleRate);
        const int secondSamples = second != nullptr ? second->buffer.getNumSamples() : 0;

        auto track = std::make_shared<AudioTrack>();
        track->sampleRate = sampleRate;
        track->buffer.setSize(numChannels, offset + secondSamples);
        track->buffer.clear();

        for (int channel = 0; channel < numChannels; ++channel)
        {
            if (first != nullptr)
            {
                const int sourceChannel = juce::jmin(channel, first->buffer.getNumChannels() - 1);
                const int count = juce::jmin(offset, first->buffer.getNumSamples());
                if (sourceChannel >= 0 && count > 0)
                    track->buffer.copyFrom(channel, 0, first->buffer, sourceChannel, 0, count);
            }

            if (second != nullptr && secondSamples > 0)
            {
                const int sourceChannel = juce::jmin(channel, second->buffer.getNumChannels() - 1);
                if (sourceChannel >= 0)
                    track->buffer.copyFrom(channel, offset, second->buffer, sourceChannel, 0, secondSamples);
            }
        }

        return track;
    }
}
