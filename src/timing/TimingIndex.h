#pragma once
#include <JuceHeader.h>
#include <map>
#include <vector>
#include "TimingTypes.h"

/**
 * Immutable lookup from asset URL to its placement on the timeline.
 *
 * Built once from the distributor's ordered output and then passed by const
 * reference to the layer expander. A URL that was distributed more than once
 * keeps one entry per occurrence, retrieved by occurrence number.
 */
class TimingIndex
{
public:
    TimingIndex() = default;
    explicit TimingIndex(std::vector<RenderTypes::TimedAsset> orderedAssets);

    /**
     * Finds the timing of a URL.
     *
     * @param url         The asset URL
     * @param occurrence  Zero-based index among entries with the same URL
     * @return            The entry, or nullptr if the URL has no such occurrence
     */
    const RenderTypes::TimedAsset* find(const juce::String& url, int occurrence = 0) const;

    bool contains(const juce::String& url) const { return find(url) != nullptr; }
    bool isEmpty() const { return assets.empty(); }
    size_t size() const { return assets.size(); }

    const std::vector<RenderTypes::TimedAsset>& getOrderedAssets() const { return assets; }

    /** End time of the last asset, or 0 for an empty index. */
    double getTotalDuration() const;

private:
    std::vector<RenderTypes::TimedAsset> assets;
    std::map<juce::String, std::vector<size_t>> positionsByUrl;
};
