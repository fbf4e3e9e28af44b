#include "TimingIndex.h"

TimingIndex::TimingIndex(std::vector<RenderTypes::TimedAsset> orderedAssets)
    : assets(std::move(orderedAssets))
{
    for (size_t i = 0; i < assets.size(); ++i)
        positionsByUrl[assets[i].url].push_back(i);
}

const RenderTypes::TimedAsset* TimingIndex::find(const juce::String& url, int occurrence) const
{
    const auto entry = positionsByUrl.find(url);
    if (entry == positionsByUrl.end() || occurrence < 0)
        return nullptr;

    const auto& positions = entry->second;
    if ((size_t) occurrence >= positions.size())
        return nullptr;

    return &assets[positions[(size_t) occurrence]];
}

double TimingIndex::getTotalDuration() const
{
    double end = 0.0;
    for (const auto& asset : assets)
        end = juce::jmax(end, asset.startTime + asset.duration);
    return end;
}
