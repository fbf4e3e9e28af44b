#pragma once
#include <JuceHeader.h>
#include "VideoEffect.h"

/**
 * Composites a logo image over every frame.
 *
 * Params:
 *   logo_path        local image file (required)
 *   position         top-left, top-center, top-right, center-left, center,
 *                    center-right, bottom-left, bottom-center, bottom-right
 *                    (default bottom-right)
 *   opacity (0.7)    0..1
 *   scale (0.15)     logo width as a fraction of the frame width, clamped to 0.01..0.5
 *   margin (20)      distance in pixels from the anchored edges
 *
 * The logo keeps its aspect ratio and is never taller than 30% of the frame.
 * Size and position are worked out from each frame's own dimensions.
 */
class LogoWatermarkEffect : public VideoEffect
{
public:
    juce::String getName() const override { return "logo_watermark"; }
    juce::Result checkParams(const juce::var& params) const override;
    EffectOutcome apply(const Clip& clip, const juce::var& params) const override;
    bool introducesMotion() const override { return false; }

    static const juce::StringArray& getPositions();

    /**
     * Where the logo goes on a frame.
     *
     * @param frameWidth, frameHeight  Size of the frame being drawn on
     * @param logoWidth, logoHeight    Natural size of the logo image
     */
    static juce::Rectangle<int> computePlacement(int frameWidth, int frameHeight,
                                                 int logoWidth, int logoHeight,
                                                 const juce::String& position,
                                                 double scale, int margin);
};
