#include "MediaTimingDistributor.h"
#include "../template/TemplateTypes.h"
#include "../utils/VarHelpers.h"

//==============================================================================
double MediaTimingDistributor::Distribution::getTotalDuration() const
{
    double total = 0.0;
    for (const auto& section : perSection)
        total += section.duration;
    return total;
}

//==============================================================================
void MediaTimingDistributor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

juce::String MediaTimingDistributor::normaliseKey(const juce::String& key)
{
    return key.trim()
              .toLowerCase()
              .replace(" ", "_")
              .replace("&", "and")
              .replace("-", "_");
}

MediaTimingDistributor::SectionMapping MediaTimingDistributor::mappingFromVar(const juce::var& mappingObject)
{
    SectionMapping mapping;

    auto* object = mappingObject.getDynamicObject();
    if (object == nullptr)
        return mapping;

    for (const auto& property : object->getProperties())
        mapping.emplace_back(property.name.toString(), assetsFromVar(property.value));

    return mapping;
}

std::vector<RenderTypes::MediaAsset> MediaTimingDistributor::assetsFromVar(const juce::var& assetList)
{
    std::vector<RenderTypes::MediaAsset> assets;

    auto* entries = assetList.getArray();
    if (entries == nullptr)
        return assets;

    for (const auto& entry : *entries)
    {
        RenderTypes::MediaAsset asset;
        asset.url = entry.isObject() ? VarHelpers::getString(entry, "url") : entry.toString();
        asset.url = asset.url.trim();

        if (entry.isObject() && VarHelpers::has(entry, "type"))
            asset.type = RenderTypes::mediaTypeFromString(VarHelpers::getString(entry, "type"));
        else
            asset.type = RenderTypes::looksLikeVideoUrl(asset.url) ? RenderTypes::MediaType::Video
                                                                   : RenderTypes::MediaType::Image;

        if (asset.url.isNotEmpty())
            assets.push_back(asset);
    }

    return assets;
}

std::vector<RenderTypes::Section> MediaTimingDistributor::sectionsFromVar(const juce::var& sectionList)
{
    std::vector<RenderTypes::Section> sections;

    // Accept either a bare array or an object wrapping it
    const auto list = sectionList.isArray() ? sectionList : VarHelpers::get(sectionList, "sections");
    auto* entries = list.getArray();
    if (entries == nullptr)
        return sections;

    for (const auto& entry : *entries)
    {
        RenderTypes::Section section;
        section.title = VarHelpers::getString(entry, "title");
        section.content = VarHelpers::getString(entry, "content");
        section.audioUrl = VarHelpers::getString(entry, "audio_url");

        const auto audioConfig = VarHelpers::get(entry, "audio_config");
        double duration = VarHelpers::getDouble(audioConfig, "duration", -1.0);
        if (duration < 0.0)
            duration = VarHelpers::getDouble(entry, "audio_duration", VarHelpers::getDouble(entry, "duration", -1.0));

        // An explicit zero is kept; only an absent duration stays unknown
        section.audioDuration = duration;
        sections.push_back(section);
    }

    return sections;
}

//==============================================================================
std::vector<std::vector<RenderTypes::MediaAsset>> MediaTimingDistributor::assignAuto(const std::vector<RenderTypes::MediaAsset>& assets,
                                                                                      size_t numSections) const
{
    std::vector<std::vector<RenderTypes::MediaAsset>> assigned (numSections);
    if (numSections == 0 || assets.empty())
        return assigned;

    const size_t perSection = juce::jmax((size_t) 1, assets.size() / numSections);
    size_t next = 0;

    for (size_t section = 0; section < numSections; ++section)
        for (size_t k = 0; k < perSection && next < assets.size(); ++k)
            assigned[section].push_back(assets[next++]);

    // Remainder goes round-robin from the first section
    for (size_t section = 0; next < assets.size(); ++section)
        assigned[section % numSections].push_back(assets[next++]);

    return assigned;
}

MediaTimingDistributor::Distribution MediaTimingDistributor::distribute(const std::vector<RenderTypes::MediaAsset>& assets,
                                                                        const std::vector<RenderTypes::Section>& sections,
                                                                        RenderTypes::DistributionMode mode,
                                                                        const SectionMapping& mapping) const
{
    Distribution result;
    if (sections.empty())
    {
        if (logCallback && !assets.empty())
            logCallback("WARNING: No sections supplied, " + juce::String((int) assets.size()) + " assets left undistributed");
        return result;
    }

    std::vector<std::vector<RenderTypes::MediaAsset>> assigned (sections.size());
    bool useAuto = (mode == RenderTypes::DistributionMode::Auto) || mapping.empty();

    if (!useAuto)
    {
        size_t totalAssigned = 0;

        for (const auto& entry : mapping)
        {
            const auto key = normaliseKey(entry.first);
            bool matched = false;

            for (size_t i = 0; i < sections.size(); ++i)
            {
                if (normaliseKey(sections[i].title) == key)
                {
                    assigned[i] = entry.second;
                    matched = true;
                }
            }

            if (matched)
            {
                totalAssigned += entry.second.size();
            }
            else
            {
                result.unmatchedKeys.add(entry.first);
                if (logCallback)
                    logCallback("WARNING: No section found for mapping key '" + entry.first
                                + "' (normalised: '" + key + "')");
            }
        }

        if (totalAssigned == 0)
        {
            if (logCallback)
                logCallback("WARNING: Manual mapping assigned no media; falling back to automatic distribution");
            useAuto = true;
        }
        else
        {
            result.usedManualMapping = true;
        }
    }

    if (useAuto)
        assigned = assignAuto(assets, sections.size());

    double sectionStart = 0.0;

    for (size_t i = 0; i < sections.size(); ++i)
    {
        const auto& section = sections[i];
        const double sectionDuration = juce::jmax(0.0, section.audioDuration);

        SectionAssets sectionAssets;
        sectionAssets.title = section.title;
        sectionAssets.startTime = sectionStart;
        sectionAssets.duration = sectionDuration;

        const auto& items = assigned[i];
        if (!items.empty())
        {
            const double each = sectionDuration / (double) items.size();

            for (size_t k = 0; k < items.size(); ++k)
            {
                RenderTypes::TimedAsset timed;
                timed.url = items[k].url;
                timed.type = items[k].type;
                timed.duration = each;
                timed.offsetInSection = each * (double) k;
                timed.startTime = sectionStart + timed.offsetInSection;
                timed.section = section.title;

                sectionAssets.assets.push_back(timed);
                result.ordered.push_back(timed);
            }
        }

        if (logCallback)
            logCallback("Section '" + section.title + "': " + juce::String((int) items.size())
                        + " assets over " + juce::String(sectionDuration, 2) + "s");

        result.perSection.push_back(std::move(sectionAssets));
        sectionStart += sectionDuration;
    }

    return result;
}
