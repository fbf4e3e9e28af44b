#pragma once
#include <JuceHeader.h>
#include <vector>
#include "Clip.h"
#include "ClipSynthesizer.h"
#include "RenderTypes.h"
#include "../effects/EffectsPipeline.h"
#include "../template/TemplateTypes.h"

/**
 * Builds the single timeline clip a render encodes.
 *
 * Video layers form the backbone: sorted by start time, placed on the canvas
 * and played one after another, joined by the template's transition when it
 * declares one. Without video layers the externally supplied background clip
 * is the backbone. Every other layer is an overlay drawn over the backbone in
 * z_index order during [start_time, start_time + duration).
 *
 * The narration is attached as the timeline's audio. If it runs longer than
 * the pictures the pictures are looped, so narration is never cut short.
 * Global effects are applied last, in template order.
 *
 * Alongside the clip the orchestrator records when each element is on screen
 * and whether it moves, which is what segment planning works from.
 */
class CompositionOrchestrator
{
public:
    /** A layer together with the clip synthesised for it */
    struct LayerClip
    {
        RenderTypes::Layer layer;
        Clip clip;
    };

    /** A span of the timeline occupied by one element */
    struct Activity
    {
        double start = 0.0;
        double end = 0.0;
        bool animated = false;
    };

    struct Composition
    {
        Clip timeline;
        std::vector<Activity> activities;
        bool globalMotion = false;      // a global effect changes every frame

        /**
         * Splits the timeline into static and animated segments. With a
         * positive fps every cut lands on a frame boundary.
         */
        std::vector<RenderTypes::Segment> planSegments(double fps = 0.0) const;
    };

    CompositionOrchestrator(const EffectsPipeline& pipeline, int canvasWidth, int canvasHeight);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Transition used between base clips when the template declares none.
     * A void var disables it.
     */
    void setDefaultTransition(const juce::var& params);

    /**
     * Composes already synthesised layer clips.
     *
     * @param layerClips  Every layer with its clip, in template order
     * @param effects     The template's effects; transitions and global effects are used here
     * @param background  Base clip used when there are no video layers, may be null
     * @param audio       Narration, may be null
     * @param result      Receives the timeline on success
     * @return            Fails only when there is nothing to form the backbone
     */
    juce::Result compose(const std::vector<LayerClip>& layerClips,
                         const std::vector<RenderTypes::EffectSpec>& effects,
                         const Clip* background,
                         std::shared_ptr<const AudioTrack> audio,
                         Composition& result) const;

    /** Synthesises each layer with the synthesiser, then composes them. */
    juce::Result composeLayers(ClipSynthesizer& synthesizer,
                               const std::vector<RenderTypes::Layer>& layers,
                               const std::vector<RenderTypes::EffectSpec>& effects,
                               const Clip* background,
                               std::shared_ptr<const AudioTrack> audio,
                               Composition& result) const;

    /**
     * True if the clip looks the same in every frame. Anything holding video
     * counts as moving even when its frames happen to be identical.
     */
    static bool isStill(const Clip& clip) { return !clip.animated && !clip.containsVideo; }

    /** True for layers that belong to the backbone rather than the overlays. */
    static bool isBaseLayer(const RenderTypes::Layer& layer);

    /**
     * Cuts [0, duration) at every activity boundary. An interval is static
     * when no animated activity overlaps it and there is no global motion.
     * Adjacent animated intervals are merged; static ones stay separate since
     * each shows a different picture.
     *
     * When fps is positive the cuts and the end are rounded to the nearest
     * frame and intervals shorter than a frame disappear, so the segments'
     * frame counts add up to round(duration * fps).
     */
    static std::vector<RenderTypes::Segment> planSegments(const std::vector<Activity>& activities,
                                                          double duration,
                                                          bool globalMotion,
                                                          double fps = 0.0);

private:
    juce::var findTransition(const std::vector<RenderTypes::EffectSpec>& effects) const;
    void log(const juce::String& message) const;

    const EffectsPipeline& pipeline;
    int canvasWidth;
    int canvasHeight;
    juce::var defaultTransition;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CompositionOrchestrator)
};
