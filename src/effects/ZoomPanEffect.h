#pragma once
#include <JuceHeader.h>
#include "VideoEffect.h"

/**
 * Slow zoom and pan across a frame ("Ken Burns" motion).
 *
 * Params:
 *   zoom_start (1.0), zoom_end (1.2)  zoom factors at the clip's start and end
 *   pan_style                         left_to_right, right_to_left, top_to_bottom,
 *                                     bottom_to_top, diagonal_tl_br, diagonal_tr_bl,
 *                                     zoom_center, or random (the default)
 *   easing ("linear")                 linear, ease_in, ease_out, ease_in_out
 *                                     (quadratic_in / quadratic_out / quadratic_in_out)
 */
class ZoomPanEffect : public VideoEffect
{
public:
    enum class Easing
    {
        Linear,
        QuadraticIn,
        QuadraticOut,
        QuadraticInOut
    };

    /** Where the output window sits inside the zoomed frame at one instant */
    struct Window
    {
        double zoom = 1.0;
        int scaledWidth = 0;
        int scaledHeight = 0;
        juce::Rectangle<int> crop;   // in scaled-frame coordinates
    };

    juce::String getName() const override { return "zoom_pan"; }
    juce::Result checkParams(const juce::var& params) const override;
    juce::StringArray getParamWarnings(const juce::var& params) const override;
    EffectOutcome apply(const Clip& clip, const juce::var& params) const override;

    static const juce::StringArray& getPanStyles();
    static Easing easingFromString(const juce::String& name);
    static double ease(Easing easing, double t);

    /**
     * Computes the zoom factor and crop window at time t.
     *
     * The crop window always has the output size (or the scaled size when
     * zooming out) and is clamped to lie inside the scaled frame.
     */
    static Window computeWindow(double t, double duration,
                                double zoomStart, double zoomEnd,
                                const juce::String& panStyle, Easing easing,
                                int width, int height);
};
