#pragma once
#include <JuceHeader.h>
#include "TemplateTypes.h"

/**
 * Turns a resolved template document into a RenderTypes::Template.
 *
 * Parsing is strict about structure (layers must be objects with a known
 * type, the resolution must agree with the aspect ratio) and lenient about
 * optional fields, which fall back to the defaults in TemplateTypes.h.
 */
class TemplateParser
{
public:
    TemplateParser() = default;

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Parses a resolved template document.
     *
     * @param document  The JSON document after variable resolution
     * @param result    Receives the parsed template
     * @return          A failed Result describing the first structural error found
     */
    juce::Result parse(const juce::var& document, RenderTypes::Template& result) const;

    /** Parses a single layer object. Fails for unknown layer types. */
    juce::Result parseLayer(const juce::var& layerObject, int index, RenderTypes::Layer& layer) const;

    /**
     * Returns the default resolution for an aspect ratio string such as "16:9".
     * Unknown ratios are derived from a 1080 pixel short edge.
     */
    static bool resolutionForAspectRatio(const juce::String& aspectRatio, int& width, int& height);

    /** True if width/height agree with the aspect ratio within 1%. */
    static bool isConsistentWithAspectRatio(const juce::String& aspectRatio, int width, int height);

private:
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TemplateParser)
};
