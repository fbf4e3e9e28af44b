#include "LayerExpander.h"
#include <map>

void LayerExpander::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

std::vector<RenderTypes::Layer> LayerExpander::expand(const std::vector<RenderTypes::Layer>& layers,
                                                      const TimingIndex& timingIndex,
                                                      double totalDuration) const
{
    std::vector<RenderTypes::Layer> output;
    output.reserve(layers.size());

    for (const auto& layer : layers)
    {
        if (layer.isExpandable())
        {
            expandLayer(layer, timingIndex, totalDuration, output);
            continue;
        }

        auto passThrough = layer;
        if (!passThrough.hasDuration())
            passThrough.duration = totalDuration;
        output.push_back(passThrough);
    }

    return output;
}

void LayerExpander::expandLayer(const RenderTypes::Layer& layer,
                                const TimingIndex& timingIndex,
                                double totalDuration,
                                std::vector<RenderTypes::Layer>& output) const
{
    const int count = layer.sources.size();
    if (count == 0)
    {
        if (logCallback)
            logCallback("WARNING: Layer '" + layer.id + "' has an empty source list and was dropped");
        return;
    }

    const double uniformDuration = totalDuration / (double) count;
    std::map<juce::String, int> occurrences;
    int timedCount = 0;

    for (int i = 0; i < count; ++i)
    {
        const auto& url = layer.sources[i];

        auto expanded = layer;
        expanded.id = layer.id + "_" + juce::String(i);
        expanded.expandedFrom = layer.id;
        expanded.source = url;
        expanded.sources.clear();
        expanded.hasArraySource = false;

        if (const auto* timing = timingIndex.find(url, occurrences[url]++))
        {
            expanded.startTime = timing->startTime;
            expanded.duration = timing->duration;

            // The distributed asset knows its own media type
            if (layer.isMedia())
                expanded.type = timing->type == RenderTypes::MediaType::Video ? RenderTypes::LayerType::Video
                                                                             : RenderTypes::LayerType::Image;
            ++timedCount;
        }
        else
        {
            expanded.startTime = uniformDuration * (double) i;
            expanded.duration = uniformDuration;

            if (layer.type == RenderTypes::LayerType::Mixed)
                expanded.type = RenderTypes::looksLikeVideoUrl(url) ? RenderTypes::LayerType::Video
                                                                    : RenderTypes::LayerType::Image;
        }

        output.push_back(expanded);
    }

    if (logCallback)
        logCallback("Expanded layer '" + layer.id + "' into " + juce::String(count) + " layers ("
                    + juce::String(timedCount) + " with distributed timing)");
}
