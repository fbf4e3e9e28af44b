#include "TransitionEffect.h"
#include "../utils/VarHelpers.h"

namespace
{
    juce::Image matchSize(const juce::Image& image, int width, int height)
    {
        if (image.getWidth() == width && image.getHeight() == height)
            return image;
        return image.rescaled(width, height, juce::Graphics::mediumResamplingQuality);
    }

    juce::String readRawType(const juce::var& params)
    {
        return VarHelpers::getString(params, "transition_type",
                                     VarHelpers::getString(params, "style", "crossfade")).trim().toLowerCase();
    }
}

//==============================================================================
const juce::StringArray& TransitionEffect::getSupportedTypes()
{
    static const juce::StringArray types { "crossfade", "fade_black",
                                           "slide_left", "slide_right", "slide_up", "slide_down",
                                           "wipe_horizontal", "wipe_vertical" };
    return types;
}

juce::String TransitionEffect::readType(const juce::var& params)
{
    const auto type = readRawType(params);
    return getSupportedTypes().contains(type) ? type : juce::String("crossfade");
}

double TransitionEffect::joinedDuration(const juce::String& type, double firstDuration,
                                        double secondDuration, double transitionDuration)
{
    if (type == "fade_black")
        return firstDuration + secondDuration + transitionDuration / 2.0;

    const double overlapLength = juce::jmin(transitionDuration, firstDuration, secondDuration);
    return firstDuration + secondDuration - overlapLength;
}

juce::Result TransitionEffect::checkParams(const juce::var& params) const
{
    if (VarHelpers::getDouble(params, "duration", 1.0) <= 0.0)
        return juce::Result::fail("Transition duration must be positive");

    return juce::Result::ok();
}

juce::StringArray TransitionEffect::getParamWarnings(const juce::var& params) const
{
    juce::StringArray warnings;

    const auto type = readRawType(params);
    if (!getSupportedTypes().contains(type))
        warnings.add("Unsupported transition type '" + type + "', using crossfade");

    return warnings;
}

EffectOutcome TransitionEffect::apply(const Clip&, const juce::var&) const
{
    return EffectOutcome::failure("transition combines two clips and cannot be applied to one");
}

EffectOutcome TransitionEffect::join(const Clip& first, const Clip& second, const juce::var& params) const
{
    if (!first.isValid() || !second.isValid())
        return EffectOutcome::failure("transition needs two non-empty clips");

    const auto type = readType(params);
    const double duration = VarHelpers::getDouble(params, "duration", 1.0);

    if (type == "fade_black")
        return EffectOutcome::success(fadeThroughBlack(first, second, duration));

    // The overlap cannot be longer than either clip
    const double overlapLength = juce::jmin(duration, first.duration, second.duration);

    if (type.startsWith("slide_"))
        return EffectOutcome::success(slide(first, second, overlapLength, type));

    if (type == "wipe_horizontal" || type == "wipe_vertical")
        return EffectOutcome::success(wipe(first, second, overlapLength, type == "wipe_horizontal"));

    return EffectOutcome::success(crossfade(first, second, overlapLength));
}

//==============================================================================
Clip TransitionEffect::overlap(const Clip& first, const Clip& second, double duration, OverlapPainter painter)
{
    Clip joined;
    joined.width = first.width;
    joined.height = first.height;
    joined.animated = true;
    joined.containsVideo = first.containsVideo || second.containsVideo;
    joined.duration = first.duration + second.duration - duration;

    const double transitionStart = first.duration - duration;
    joined.audio = ClipOps::appendAudio(ClipOps::sliceAudio(first.audio, 0.0, transitionStart),
                                        second.audio, transitionStart);

    const auto a = first.frameAt;
    const auto b = second.frameAt;
    const int width = first.width;
    const int height = first.height;

    joined.frameAt = [a, b, transitionStart, duration, width, height, painter](double t)
    {
        if (t < transitionStart)
            return a(t);

        const double local = t - transitionStart;
        if (local >= duration)
            return matchSize(b(local), width, height);

        const double progress = duration > 0.0 ? local / duration : 1.0;

        auto frame = ClipOps::createBlankFrame(width, height);
        {
            juce::Graphics g(frame);
            painter(g, a(t), matchSize(b(local), width, height), progress, width, height);
        }
        return frame;
    };

    return joined;
}

Clip TransitionEffect::crossfade(const Clip& first, const Clip& second, double duration)
{
    return overlap(first, second, duration,
                   [](juce::Graphics& g, const juce::Image& a, const juce::Image& b, double progress, int, int)
                   {
                       g.drawImageAt(a, 0, 0);
                       g.setOpacity((float) progress);
                       g.drawImageAt(b, 0, 0);
                   });
}

Clip TransitionEffect::slide(const Clip& first, const Clip& second, double duration, const juce::String& type)
{
    return overlap(first, second, duration,
                   [type](juce::Graphics& g, const juce::Image& a, const juce::Image& b, double progress, int w, int h)
                   {
                       const int dx = (int) std::round(w * progress);
                       const int dy = (int) std::round(h * progress);

                       if (type == "slide_left")
                       {
                           g.drawImageAt(a, -dx, 0);
                           g.drawImageAt(b, w - dx, 0);
                       }
                       else if (type == "slide_right")
                       {
                           g.drawImageAt(a, dx, 0);
                           g.drawImageAt(b, dx - w, 0);
                       }
                       else if (type == "slide_up")
                       {
                           g.drawImageAt(a, 0, -dy);
                           g.drawImageAt(b, 0, h - dy);
                       }
                       else
                       {
                           g.drawImageAt(a, 0, dy);
                           g.drawImageAt(b, 0, dy - h);
                       }
                   });
}

Clip TransitionEffect::wipe(const Clip& first, const Clip& second, double duration, bool horizontal)
{
    return overlap(first, second, duration,
                   [horizontal](juce::Graphics& g, const juce::Image& a, const juce::Image& b, double progress, int w, int h)
                   {
                       g.drawImageAt(a, 0, 0);

                       const auto revealed = horizontal
                           ? juce::Rectangle<int>(0, 0, (int) std::round(w * progress), h)
                           : juce::Rectangle<int>(0, 0, w, (int) std::round(h * progress));

                       if (revealed.isEmpty())
                           return;

                       juce::Graphics::ScopedSaveState state(g);
                       g.reduceClipRegion(revealed);
                       g.drawImageAt(b, 0, 0);
                   });
}

Clip TransitionEffect::fadeThroughBlack(const Clip& first, const Clip& second, double duration)
{
    const double half = duration / 2.0;
    const double fadeOut = juce::jmin(half, first.duration);
    const double fadeIn = juce::jmin(half, second.duration);
    const double secondStart = first.duration + half;

    Clip joined;
    joined.width = first.width;
    joined.height = first.height;
    joined.animated = true;
    joined.containsVideo = first.containsVideo || second.containsVideo;
    joined.duration = secondStart + second.duration;
    joined.audio = ClipOps::appendAudio(first.audio, second.audio, secondStart);

    const auto a = first.frameAt;
    const auto b = second.frameAt;
    const double firstDuration = first.duration;
    const int width = first.width;
    const int height = first.height;

    joined.frameAt = [=](double t)
    {
        auto frame = ClipOps::createBlankFrame(width, height);
        {
            juce::Graphics g(frame);
            g.fillAll(juce::Colours::black);

            if (t < firstDuration)
            {
                const double remaining = firstDuration - t;
                g.setOpacity(fadeOut > 0.0 && remaining < fadeOut ? (float) (remaining / fadeOut) : 1.0f);
                g.drawImageAt(a(t), 0, 0);
            }
            else if (t >= secondStart)
            {
                const double local = t - secondStart;
                g.setOpacity(fadeIn > 0.0 && local < fadeIn ? (float) (local / fadeIn) : 1.0f);
                g.drawImageAt(matchSize(b(local), width, height), 0, 0);
            }
        }
        return frame;
    };

    return joined;
}
