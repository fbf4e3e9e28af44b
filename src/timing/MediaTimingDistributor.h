#pragma once
#include <JuceHeader.h>
#include <utility>
#include <vector>
#include "TimingTypes.h"
#include "TimingIndex.h"

/**
 * Assigns media assets to narration sections and gives each asset a share
 * of its section's spoken duration.
 *
 * In auto mode assets are dealt out max(1, N / M) per section in section
 * order, and any remainder goes round-robin from the first section. In manual
 * mode a caller-supplied mapping names the assets for each section; mapping
 * keys and section titles are compared after normalisation (lower case,
 * spaces and hyphens to underscores, '&' to "and").
 *
 * Within a section holding K assets and lasting D seconds every asset lasts
 * D / K and the assets follow each other in assignment order. Start times are
 * absolute: each section begins where the previous one ended, whether or not
 * it received any media.
 */
class MediaTimingDistributor
{
public:
    /** Ordered (mapping key, assets) pairs for manual mode */
    using SectionMapping = std::vector<std::pair<juce::String, std::vector<RenderTypes::MediaAsset>>>;

    struct SectionAssets
    {
        juce::String title;
        double startTime = 0.0;
        double duration = 0.0;
        std::vector<RenderTypes::TimedAsset> assets;
    };

    struct Distribution
    {
        std::vector<SectionAssets> perSection;
        std::vector<RenderTypes::TimedAsset> ordered;
        bool usedManualMapping = false;
        juce::StringArray unmatchedKeys;

        /** Builds the immutable lookup used by the layer expander. */
        TimingIndex createIndex() const { return TimingIndex(ordered); }

        /** Sum of all section durations. */
        double getTotalDuration() const;
    };

    MediaTimingDistributor() = default;

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Distributes assets across sections.
     *
     * @param assets    The media to place, in presentation order (auto mode)
     * @param sections  The narration sections, in timeline order
     * @param mode      Auto or manual assignment
     * @param mapping   Section key to asset list, used in manual mode
     */
    Distribution distribute(const std::vector<RenderTypes::MediaAsset>& assets,
                            const std::vector<RenderTypes::Section>& sections,
                            RenderTypes::DistributionMode mode = RenderTypes::DistributionMode::Auto,
                            const SectionMapping& mapping = {}) const;

    /** Normalises a section title or mapping key for comparison. */
    static juce::String normaliseKey(const juce::String& key);

    /**
     * Reads a manual mapping from JSON: {"section_key": [{"url": ..., "type": ...}, ...]}.
     * Plain URL strings are accepted and typed from their extension.
     */
    static SectionMapping mappingFromVar(const juce::var& mappingObject);

    /** Reads an asset list: strings or {"url", "type"} objects, typed from the extension when no type is given. */
    static std::vector<RenderTypes::MediaAsset> assetsFromVar(const juce::var& assetList);

    /**
     * Reads narration sections. Each entry has a title, optional content and
     * audio_url, and its spoken length in audio_config.duration or
     * audio_duration.
     */
    static std::vector<RenderTypes::Section> sectionsFromVar(const juce::var& sectionList);

private:
    std::vector<std::vector<RenderTypes::MediaAsset>> assignAuto(const std::vector<RenderTypes::MediaAsset>& assets,
                                                                 size_t numSections) const;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MediaTimingDistributor)
};
