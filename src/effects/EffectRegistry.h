#pragma once
#include <JuceHeader.h>
#include <map>
#include <memory>
#include "VideoEffect.h"

/**
 * Maps effect names to factories.
 *
 * A new effect type is made available by a single registerEffect() call;
 * nothing that looks effects up needs to change. Names are compared case
 * insensitively.
 */
class EffectRegistry
{
public:
    using Factory = std::function<std::unique_ptr<VideoEffect>()>;

    /** @param includeBuiltins  Registers the standard catalogue and its aliases */
    explicit EffectRegistry(bool includeBuiltins = true);

    void registerEffect(const juce::String& name, Factory factory);

    bool contains(const juce::String& name) const;

    /** Creates an instance of the named effect, or nullptr for unknown names. */
    std::unique_ptr<VideoEffect> create(const juce::String& name) const;

private:
    void registerBuiltins();

    std::map<juce::String, Factory> factories;
};
