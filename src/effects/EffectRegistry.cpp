#include "EffectRegistry.h"
#include "ZoomPanEffect.h"
#include "FadeEffect.h"
#include "TransitionEffect.h"
#include "LogoWatermarkEffect.h"
#include "BackgroundMusicEffect.h"
#include "TickerEffect.h"

namespace
{
    template <typename EffectType>
    EffectRegistry::Factory makeFactory()
    {
        return [] { return std::unique_ptr<VideoEffect>(std::make_unique<EffectType>()); };
    }
}

EffectRegistry::EffectRegistry(bool includeBuiltins)
{
    if (includeBuiltins)
        registerBuiltins();
}

void EffectRegistry::registerBuiltins()
{
    registerEffect("zoom_pan",         makeFactory<ZoomPanEffect>());
    registerEffect("ken_burns",        makeFactory<ZoomPanEffect>());
    registerEffect("fade",             makeFactory<FadeEffect>());
    registerEffect("fade_text",        makeFactory<FadeEffect>());
    registerEffect("transition",       makeFactory<TransitionEffect>());
    registerEffect("logo_watermark",   makeFactory<LogoWatermarkEffect>());
    registerEffect("logo",             makeFactory<LogoWatermarkEffect>());
    registerEffect("background_music", makeFactory<BackgroundMusicEffect>());
    registerEffect("ticker",           makeFactory<TickerEffect>());
    registerEffect("bottom_banner",    makeFactory<TickerEffect>());
    registerEffect("banner",           makeFactory<TickerEffect>());
}

void EffectRegistry::registerEffect(const juce::String& name, Factory factory)
{
    if (factory == nullptr)
        return;

    factories[name.trim().toLowerCase()] = std::move(factory);
}

bool EffectRegistry::contains(const juce::String& name) const
{
    return factories.find(name.trim().toLowerCase()) != factories.end();
}

std::unique_ptr<VideoEffect> EffectRegistry::create(const juce::String& name) const
{
    const auto entry = factories.find(name.trim().toLowerCase());
    if (entry == factories.end())
        return nullptr;

    return entry->second();
}
