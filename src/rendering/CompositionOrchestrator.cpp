#include "CompositionOrchestrator.h"
#include "../effects/TransitionEffect.h"
#include "../utils/VarHelpers.h"
#include <algorithm>

using namespace RenderTypes;

namespace
{
    constexpr double timeEpsilon = 1.0e-6;

    bool isTransitionEffect(const EffectRegistry& registry, const juce::String& name)
    {
        auto effect = registry.create(name);
        return effect != nullptr && effect->isTransition();
    }

    struct Overlay
    {
        Clip clip;
        juce::Rectangle<int> bounds;
        double start = 0.0;
        double end = 0.0;
    };
}

//==============================================================================
CompositionOrchestrator::CompositionOrchestrator(const EffectsPipeline& p, int w, int h)
    : pipeline(p),
      canvasWidth(w),
      canvasHeight(h)
{
}

void CompositionOrchestrator::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void CompositionOrchestrator::setDefaultTransition(const juce::var& params)
{
    defaultTransition = params;
}

void CompositionOrchestrator::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

bool CompositionOrchestrator::isBaseLayer(const Layer& layer)
{
    if (layer.type == LayerType::Video)
        return true;

    return layer.type == LayerType::Mixed && looksLikeVideoUrl(layer.source);
}

juce::var CompositionOrchestrator::findTransition(const std::vector<EffectSpec>& effects) const
{
    for (const auto& effect : effects)
    {
        if (!isTransitionEffect(pipeline.getRegistry(), effect.type))
            continue;

        auto params = effect.params.isObject() ? effect.params : VarHelpers::makeObject();
        return params;
    }

    return defaultTransition;
}

//==============================================================================
juce::Result CompositionOrchestrator::compose(const std::vector<LayerClip>& layerClips,
                                              const std::vector<EffectSpec>& effects,
                                              const Clip* background,
                                              std::shared_ptr<const AudioTrack> audio,
                                              Composition& result) const
{
    result = Composition();

    std::vector<const LayerClip*> baseClips;
    std::vector<const LayerClip*> overlayClips;

    for (const auto& layerClip : layerClips)
    {
        if (!layerClip.clip.isValid())
            continue;

        if (isBaseLayer(layerClip.layer))
            baseClips.push_back(&layerClip);
        else
            overlayClips.push_back(&layerClip);
    }

    std::stable_sort(baseClips.begin(), baseClips.end(),
                     [](const LayerClip* a, const LayerClip* b) { return a->layer.startTime < b->layer.startTime; });

    std::stable_sort(overlayClips.begin(), overlayClips.end(),
                     [](const LayerClip* a, const LayerClip* b) { return a->layer.zIndex < b->layer.zIndex; });

    //==========================================================================
    // Backbone
    Clip backbone;

    if (!baseClips.empty())
    {
        const auto transition = findTransition(effects);
        const bool useTransition = transition.isObject();
        const double transitionDuration = VarHelpers::getDouble(transition, "duration", 1.0);

        if (useTransition)
            log("Joining " + juce::String((int) baseClips.size()) + " base clips with "
                + TransitionEffect::readType(transition) + " transitions");

        for (const auto* base : baseClips)
        {
            const auto bounds = ClipSynthesizer::layerBounds(base->layer, canvasWidth, canvasHeight);
            const auto placed = ClipOps::placeOnCanvas(base->clip, canvasWidth, canvasHeight,
                                                       bounds, juce::Colours::black);

            if (!backbone.isValid())
            {
                backbone = placed;
                result.activities.push_back({ 0.0, placed.duration, !isStill(placed) });
                continue;
            }

            const double previousDuration = backbone.duration;
            backbone = useTransition ? pipeline.join(backbone, placed, transition)
                                     : ClipOps::concatenate(backbone, placed);

            // Where the new clip starts depends on how the join went
            const double start = backbone.duration - placed.duration;
            result.activities.push_back({ start, backbone.duration, !isStill(placed) });

            if (std::abs(start - previousDuration) > timeEpsilon)
                result.activities.push_back({ juce::jmax(0.0, juce::jmin(start, previousDuration) - transitionDuration),
                                              juce::jmax(start, previousDuration) + transitionDuration,
                                              true });
        }
    }
    else
    {
        if (background == nullptr || !background->isValid())
            return juce::Result::fail("The template has no video layers and no background clip is available");

        double duration = background->duration;
        for (const auto* overlay : overlayClips)
            duration = juce::jmax(duration, overlay->layer.startTime + overlay->clip.duration);

        backbone = ClipOps::fitToDuration(*background, duration);
        result.activities.push_back({ 0.0, backbone.duration, !isStill(backbone) });
    }

    //==========================================================================
    // Overlays
    std::vector<Overlay> overlays;
    overlays.reserve(overlayClips.size());

    for (const auto* layerClip : overlayClips)
    {
        Overlay overlay;
        overlay.clip = layerClip->clip;
        overlay.bounds = ClipSynthesizer::layerBounds(layerClip->layer, canvasWidth, canvasHeight);
        overlay.start = juce::jmax(0.0, layerClip->layer.startTime);
        overlay.end = overlay.start + layerClip->clip.duration;

        if (overlay.start >= backbone.duration)
        {
            log("WARNING: Layer '" + layerClip->layer.id + "' starts after the timeline ends, skipping");
            continue;
        }

        result.activities.push_back({ overlay.start, juce::jmin(overlay.end, backbone.duration), !isStill(overlay.clip) });
        overlays.push_back(overlay);
    }

    Clip timeline = backbone;

    if (!overlays.empty())
    {
        const auto base = backbone.frameAt;
        const int width = canvasWidth;
        const int height = canvasHeight;

        timeline.width = width;
        timeline.height = height;
        timeline.animated = true;
        timeline.containsVideo = backbone.containsVideo
            || std::any_of(overlays.begin(), overlays.end(), [](const Overlay& o) { return o.clip.containsVideo; });

        timeline.frameAt = [base, overlays, width, height](double t)
        {
            auto frame = base(t);

            bool drawn = false;
            for (const auto& overlay : overlays)
            {
                if (t < overlay.start || t >= overlay.end)
                    continue;

                if (!drawn)
                {
                    frame = frame.convertedToFormat(juce::Image::ARGB).createCopy();
                    drawn = true;
                }

                juce::Graphics g(frame);
                g.drawImage(overlay.clip.renderFrame(t - overlay.start), overlay.bounds.toFloat(),
                            juce::RectanglePlacement::stretchToFit);
            }

            if (frame.getWidth() != width || frame.getHeight() != height)
                return frame.rescaled(width, height, juce::Graphics::mediumResamplingQuality);

            return frame;
        };
    }

    //==========================================================================
    // Audio
    timeline.audio = audio;

    if (audio != nullptr && audio->getDuration() > timeline.duration + timeEpsilon)
    {
        const double visualDuration = timeline.duration;
        log("Narration (" + juce::String(audio->getDuration(), 2) + "s) is longer than the visuals ("
            + juce::String(visualDuration, 2) + "s), looping the visuals");

        timeline = ClipOps::fitToDuration(timeline, audio->getDuration());
        timeline.audio = audio;

        const bool anyAnimated = std::any_of(result.activities.begin(), result.activities.end(),
                                             [](const Activity& a) { return a.animated; });
        result.activities.push_back({ visualDuration, timeline.duration, anyAnimated || !overlays.empty() });
    }

    //==========================================================================
    // Global effects
    for (const auto& effect : effects)
    {
        if (!effect.isGlobal() || isTransitionEffect(pipeline.getRegistry(), effect.type))
            continue;

        const auto outcome = pipeline.tryApply(timeline, effect.type, effect.params);
        if (!outcome.wasOk())
        {
            log("WARNING: Effect skipped, " + effect.type + ": " + outcome.getErrorMessage());
            continue;
        }

        timeline = outcome.getClip();
        if (pipeline.introducesMotion(effect.type))
            result.globalMotion = true;

        log("Applied global effect " + effect.type);
    }

    result.timeline = timeline;
    return juce::Result::ok();
}

juce::Result CompositionOrchestrator::composeLayers(ClipSynthesizer& synthesizer,
                                                    const std::vector<Layer>& layers,
                                                    const std::vector<EffectSpec>& effects,
                                                    const Clip* background,
                                                    std::shared_ptr<const AudioTrack> audio,
                                                    Composition& result) const
{
    std::vector<LayerClip> layerClips;
    layerClips.reserve(layers.size());

    for (const auto& layer : layers)
    {
        auto clip = synthesizer.synthesize(layer, effects);
        if (clip.isValid())
            layerClips.push_back({ layer, clip });
    }

    log("Synthesised " + juce::String((int) layerClips.size()) + " of "
        + juce::String((int) layers.size()) + " layers");

    return compose(layerClips, effects, background, audio, result);
}

//==============================================================================
std::vector<Segment> CompositionOrchestrator::Composition::planSegments(double fps) const
{
    return CompositionOrchestrator::planSegments(activities, timeline.duration, globalMotion, fps);
}

std::vector<Segment> CompositionOrchestrator::planSegments(const std::vector<Activity>& activities,
                                                           double duration,
                                                           bool globalMotion,
                                                           double fps)
{
    std::vector<Segment> segments;
    if (duration <= 0.0)
        return segments;

    auto snap = [fps](double t) { return fps > 0.0 ? std::round(t * fps) / fps : t; };

    // A timeline always keeps at least one frame
    const double timelineEnd = fps > 0.0 ? juce::jmax(1.0 / fps, snap(duration)) : duration;

    std::vector<double> cuts { 0.0, timelineEnd };
    for (const auto& activity : activities)
    {
        const double start = snap(activity.start);
        const double finish = snap(activity.end);

        if (start > 0.0 && start < timelineEnd)
            cuts.push_back(start);
        if (finish > 0.0 && finish < timelineEnd)
            cuts.push_back(finish);
    }

    std::sort(cuts.begin(), cuts.end());
    cuts.erase(std::unique(cuts.begin(), cuts.end(),
                           [](double a, double b) { return std::abs(a - b) < timeEpsilon; }),
               cuts.end());

    for (size_t i = 0; i + 1 < cuts.size(); ++i)
    {
        const double start = cuts[i];
        const double end = cuts[i + 1];

        bool animated = globalMotion;
        for (const auto& activity : activities)
            if (activity.animated && activity.start < end - timeEpsilon && activity.end > start + timeEpsilon)
                animated = true;

        if (animated && !segments.empty() && !segments.back().isStatic)
        {
            segments.back().duration = end - segments.back().startTime;
            continue;
        }

        Segment segment;
        segment.startTime = start;
        segment.duration = end - start;
        segment.isStatic = !animated;
        segments.push_back(segment);
    }

    return segments;
}
