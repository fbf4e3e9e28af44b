#pragma once
#include <JuceHeader.h>
#include "../rendering/Clip.h"

//==============================================================================
/**
 * The result of applying an effect: either the transformed clip or the reason
 * the effect could not be applied.
 *
 * Callers that want the pipeline's "degrade, never abort" behaviour use
 * orElse(original), which yields the unmodified clip on failure.
 */
class EffectOutcome
{
public:
    static EffectOutcome success(const Clip& clip)          { return EffectOutcome(juce::Result::ok(), clip); }
    static EffectOutcome failure(const juce::String& error) { return EffectOutcome(juce::Result::fail(error), Clip()); }

    bool wasOk() const                          { return status.wasOk(); }
    bool failed() const                         { return status.failed(); }
    juce::String getErrorMessage() const        { return status.getErrorMessage(); }
    const juce::Result& getStatus() const       { return status; }

    /** The transformed clip. Only meaningful when wasOk() is true. */
    const Clip& getClip() const                 { return clip; }

    /** Returns the transformed clip, or the fallback if the effect failed. */
    Clip orElse(const Clip& fallback) const     { return status.wasOk() ? clip : fallback; }

private:
    EffectOutcome(juce::Result r, Clip c) : status(std::move(r)), clip(std::move(c)) {}

    juce::Result status;
    Clip clip;
};

//==============================================================================
/**
 * Base class for everything in the effect catalogue.
 *
 * An effect is stateless: all configuration arrives in the params object on
 * each call, so one instance can be applied to any number of clips.
 */
class VideoEffect
{
public:
    virtual ~VideoEffect() = default;

    /** The name the effect is registered under. */
    virtual juce::String getName() const = 0;

    /**
     * Checks the parameters without touching any clip.
     * @return A failed Result describing the first invalid parameter
     */
    virtual juce::Result checkParams(const juce::var& params) const = 0;

    /**
     * Describes parameters the effect will replace with a fallback rather
     * than reject. The pipeline logs each entry as a warning.
     */
    virtual juce::StringArray getParamWarnings(const juce::var& params) const
    {
        juce::ignoreUnused(params);
        return {};
    }

    /** Shorthand for checkParams(params).wasOk(). */
    bool validate(const juce::var& params) const { return checkParams(params).wasOk(); }

    /**
     * Applies the effect to a clip. The input clip is never modified.
     */
    virtual EffectOutcome apply(const Clip& clip, const juce::var& params) const = 0;

    /** True if the effect makes an otherwise still clip change over time. */
    virtual bool introducesMotion() const { return true; }

    /** True for effects that combine two clips rather than transform one. */
    virtual bool isTransition() const { return false; }

    /** Combines two clips. Only transitions implement this. */
    virtual EffectOutcome join(const Clip& first, const Clip& second, const juce::var& params) const
    {
        juce::ignoreUnused(first, second, params);
        return EffectOutcome::failure(getName() + " does not combine clips");
    }
};
