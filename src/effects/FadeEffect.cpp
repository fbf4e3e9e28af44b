#include "FadeEffect.h"
#include "../utils/VarHelpers.h"

namespace
{
    double readFadeIn(const juce::var& params)
    {
        return VarHelpers::getDouble(params, "fade_in_duration", VarHelpers::getDouble(params, "fade_in", 0.5));
    }

    double readFadeOut(const juce::var& params)
    {
        return VarHelpers::getDouble(params, "fade_out_duration", VarHelpers::getDouble(params, "fade_out", 0.5));
    }
}

FadeEffect::Ramps FadeEffect::computeRamps(double clipDuration, double fadeIn, double fadeOut, const juce::String& fadeType)
{
    Ramps ramps;
    ramps.fadeIn = (fadeType == "out") ? 0.0 : juce::jmax(0.0, fadeIn);
    ramps.fadeOut = (fadeType == "in") ? 0.0 : juce::jmax(0.0, fadeOut);

    const double total = ramps.fadeIn + ramps.fadeOut;
    if (total > clipDuration && total > 0.0)
    {
        const double scale = clipDuration / total;
        ramps.fadeIn *= scale;
        ramps.fadeOut *= scale;
    }

    return ramps;
}

double FadeEffect::opacityAt(double t, double clipDuration, const Ramps& ramps)
{
    double opacity = 1.0;

    if (ramps.fadeIn > 0.0 && t < ramps.fadeIn)
        opacity = juce::jmin(opacity, t / ramps.fadeIn);

    if (ramps.fadeOut > 0.0 && t > clipDuration - ramps.fadeOut)
        opacity = juce::jmin(opacity, (clipDuration - t) / ramps.fadeOut);

    return juce::jlimit(0.0, 1.0, opacity);
}

//==============================================================================
juce::Result FadeEffect::checkParams(const juce::var& params) const
{
    if (readFadeIn(params) < 0.0 || readFadeOut(params) < 0.0)
        return juce::Result::fail("Fade durations must not be negative");

    const auto fadeType = VarHelpers::getString(params, "fade_type", "both").toLowerCase();
    if (fadeType != "both" && fadeType != "in" && fadeType != "out")
        return juce::Result::fail("Unknown fade type '" + fadeType + "'");

    return juce::Result::ok();
}

EffectOutcome FadeEffect::apply(const Clip& clip, const juce::var& params) const
{
    if (!clip.isValid())
        return EffectOutcome::failure("fade needs a non-empty clip");

    const auto fadeType = VarHelpers::getString(params, "fade_type", "both").toLowerCase();
    const auto ramps = computeRamps(clip.duration, readFadeIn(params), readFadeOut(params), fadeType);

    if (ramps.fadeIn <= 0.0 && ramps.fadeOut <= 0.0)
        return EffectOutcome::success(clip);

    const auto source = clip.frameAt;
    const double duration = clip.duration;

    auto result = clip;
    result.animated = true;
    result.frameAt = [source, duration, ramps](double t)
    {
        const auto opacity = (float) opacityAt(t, duration, ramps);
        auto frame = source(t);

        if (opacity >= 1.0f)
            return frame;

        return ClipOps::withOpacity(frame, opacity);
    };

    return EffectOutcome::success(result);
}
