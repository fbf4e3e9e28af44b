#pragma once
#include <JuceHeader.h>
#include "VideoEffect.h"

/**
 * A two-tier news style overlay along the bottom of the frame: a heading
 * banner with a scrolling ticker strip beneath it.
 *
 * Params:
 *   heading                   banner text
 *   summary / ticker_text     scrolling text
 *   banner_height (100)       pixels
 *   ticker_height (40)        pixels
 *   banner_color (#003399)
 *   ticker_color (#141414)
 *   text_color (white)
 *   font_size (42)            heading font size
 *   ticker_font_size (24)
 *   scroll_speed (120)        pixels per second
 *   banner_duration           seconds the heading stays up (default: whole clip)
 *
 * At least one of heading or summary must be present. Either tier is left out
 * when its text is empty.
 */
class TickerEffect : public VideoEffect
{
public:
    juce::String getName() const override { return "ticker"; }
    juce::Result checkParams(const juce::var& params) const override;
    EffectOutcome apply(const Clip& clip, const juce::var& params) const override;

    /** Text placed between repeats of the ticker text. */
    static const juce::String separator;

    /** Horizontal scroll position of the ticker at time t, in [0, textWidth). */
    static double scrollOffset(double t, double scrollSpeed, double textWidth);

    /** How many copies of the text are needed to cover the canvas at any offset. */
    static int repeatCount(int canvasWidth, double textWidth);

    /** Heading banner opacity, fading in and out over half a second. */
    static float bannerOpacity(double t, double bannerDuration);

    /** Breaks text into lines no wider than maxWidth, keeping over-long words whole. */
    static juce::StringArray wrapText(const juce::String& text, const juce::Font& font, float maxWidth);
};
