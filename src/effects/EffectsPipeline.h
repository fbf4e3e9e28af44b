#pragma once
#include <JuceHeader.h>
#include <vector>
#include "EffectRegistry.h"
#include "../template/TemplateTypes.h"

/**
 * Applies named effects from a registry to clips.
 *
 * apply() never fails: an unknown effect name, invalid parameters, or an
 * effect that throws all leave the clip unchanged and produce a warning in
 * the log. tryApply() exposes the underlying outcome for callers that need
 * to know what happened.
 */
class EffectsPipeline
{
public:
    explicit EffectsPipeline(const EffectRegistry& registry);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Validates and applies one effect, reporting failures in the outcome. */
    EffectOutcome tryApply(const Clip& clip, const juce::String& effectName, const juce::var& params) const;

    /** Applies one effect, returning the input clip unchanged on any failure. */
    Clip apply(const Clip& clip, const juce::String& effectName, const juce::var& params) const;

    /** Applies the effects in order, each to the result of the previous one. */
    Clip applyAll(const Clip& clip, const std::vector<RenderTypes::EffectSpec>& effects) const;

    /**
     * Joins two clips with a transition. If the transition cannot be applied
     * the clips are simply played one after the other.
     */
    Clip join(const Clip& first, const Clip& second, const juce::var& transitionParams) const;

    /** True if the named effect makes still frames change over time. Unknown names are treated as still. */
    bool introducesMotion(const juce::String& effectName) const;

    const EffectRegistry& getRegistry() const { return registry; }

private:
    void log(const juce::String& message) const;

    const EffectRegistry& registry;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(EffectsPipeline)
};
