#pragma once
#include <JuceHeader.h>
#include <vector>
#include "TemplateTypes.h"
#include "../timing/TimingIndex.h"

/**
 * Replaces each array-sourced layer with one scalar layer per asset.
 *
 * Expanded layers copy every field of the original and get the id
 * "<original>_<i>". Their start time and duration come from the timing index
 * when the asset was distributed, otherwise the timeline is split evenly
 * between the N assets. Image, video and mixed layers take an indexed
 * asset's media type from its entry. Mixed layers fall back to the URL
 * extension when the asset has no entry.
 *
 * Layers that are not expandable pass through, with an unset duration
 * replaced by the total timeline duration.
 */
class LayerExpander
{
public:
    LayerExpander() = default;

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * @param layers         The template's layers, after variable resolution
     * @param timingIndex    Placement of distributed assets
     * @param totalDuration  Length of the timeline in seconds
     * @return               Layers with scalar sources only, in the original order
     */
    std::vector<RenderTypes::Layer> expand(const std::vector<RenderTypes::Layer>& layers,
                                           const TimingIndex& timingIndex,
                                           double totalDuration) const;

private:
    void expandLayer(const RenderTypes::Layer& layer,
                     const TimingIndex& timingIndex,
                     double totalDuration,
                     std::vector<RenderTypes::Layer>& output) const;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LayerExpander)
};
