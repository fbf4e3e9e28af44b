#pragma once
#include <JuceHeader.h>
#include "VideoEffect.h"

/**
 * Joins two clips with an animated hand-over.
 *
 * Params: transition_type (crossfade, fade_black, slide_left, slide_right,
 * slide_up, slide_down, wipe_horizontal, wipe_vertical) and duration (1.0).
 *
 * Every type except fade_black overlaps the end of the first clip with the
 * start of the second, so the result is first + second - duration long.
 * fade_black fades the first clip out over duration / 2, holds black for
 * duration / 2 and fades the second clip in over duration / 2.
 *
 * Audio is never overlapped: the first clip's audio stops where the second
 * clip starts.
 */
class TransitionEffect : public VideoEffect
{
public:
    juce::String getName() const override { return "transition"; }
    juce::Result checkParams(const juce::var& params) const override;
    juce::StringArray getParamWarnings(const juce::var& params) const override;

    /** A single clip has nothing to transition to, so this always fails. */
    EffectOutcome apply(const Clip& clip, const juce::var& params) const override;

    bool isTransition() const override { return true; }
    EffectOutcome join(const Clip& first, const Clip& second, const juce::var& params) const override;

    static const juce::StringArray& getSupportedTypes();

    /** Reads the transition type, mapping unsupported names to crossfade. */
    static juce::String readType(const juce::var& params);

    /** Length of the joined clip for the given type and clip lengths. */
    static double joinedDuration(const juce::String& type, double firstDuration,
                                 double secondDuration, double transitionDuration);

private:
    static Clip crossfade(const Clip& first, const Clip& second, double duration);
    static Clip fadeThroughBlack(const Clip& first, const Clip& second, double duration);
    static Clip slide(const Clip& first, const Clip& second, double duration, const juce::String& type);
    static Clip wipe(const Clip& first, const Clip& second, double duration, bool horizontal);

    /** Shared shape of the overlapping transitions: frame drawing is left to the caller. */
    using OverlapPainter = std::function<void(juce::Graphics&, const juce::Image& a, const juce::Image& b,
                                              double progress, int width, int height)>;
    static Clip overlap(const Clip& first, const Clip& second, double duration, OverlapPainter painter);
};
