#include <JuceHeader.h>
#include "../src/effects/EffectsPipeline.h"
#include "../src/effects/FadeEffect.h"
#include "../src/effects/LogoWatermarkEffect.h"
#include "../src/effects/TickerEffect.h"
#include "../src/effects/TransitionEffect.h"
#include "../src/effects/ZoomPanEffect.h"
#include "../src/rendering/AudioMixer.h"

namespace
{
    juce::var makeParams(std::initializer_list<std::pair<const char*, juce::var>> values)
    {
        auto* object = new juce::DynamicObject();
        for (const auto& value : values)
            object->setProperty(value.first, value.second);
        return juce::var(object);
    }

    std::shared_ptr<AudioTrack> constantTrack(float level, double seconds)
    {
        auto track = std::make_shared<AudioTrack>();
        track->buffer.setSize(AudioMixer::numChannels, (int) std::llround(seconds * track->sampleRate));
        for (int channel = 0; channel < track->buffer.getNumChannels(); ++channel)
            juce::FloatVectorOperations::fill(track->buffer.getWritePointer(channel), level, track->buffer.getNumSamples());
        return track;
    }

    bool coloursMatch(juce::Colour actual, juce::Colour expected, int tolerance = 3)
    {
        return std::abs(actual.getRed() - expected.getRed()) <= tolerance
            && std::abs(actual.getGreen() - expected.getGreen()) <= tolerance
            && std::abs(actual.getBlue() - expected.getBlue()) <= tolerance;
    }

    juce::File createScratchDirectory()
    {
        auto dir = juce::File::getSpecialLocation(juce::File::tempDirectory)
                       .getNonexistentChildFile("storyreel_effect_tests", "", false);
        dir.createDirectory();
        return dir;
    }
}

//==============================================================================
class ZoomPanTests : public juce::UnitTest
{
public:
    ZoomPanTests() : juce::UnitTest("ZoomPanEffect", "Effects") {}

    void runTest() override
    {
        beginTest("The window starts at the start zoom and ends at the end zoom");
        {
            const auto first = ZoomPanEffect::computeWindow(0.0, 5.0, 1.0, 1.5, "zoom_center",
                                                            ZoomPanEffect::Easing::Linear, 1920, 1080);
            expectWithinAbsoluteError(first.zoom, 1.0, 1.0e-9);
            expect(first.crop == juce::Rectangle<int>(0, 0, 1920, 1080));

            const auto last = ZoomPanEffect::computeWindow(5.0, 5.0, 1.0, 1.5, "zoom_center",
                                                           ZoomPanEffect::Easing::Linear, 1920, 1080);
            expectWithinAbsoluteError(last.zoom, 1.5, 1.0e-9);
            expectEquals(last.scaledWidth, 2880);
            expectEquals(last.scaledHeight, 1620);
            expect(last.crop == juce::Rectangle<int>(480, 270, 1920, 1080));
        }

        beginTest("Pan styles move the crop across the slack");
        {
            const auto start = ZoomPanEffect::computeWindow(0.0, 4.0, 1.5, 1.5, "left_to_right",
                                                            ZoomPanEffect::Easing::Linear, 1000, 500);
            const auto end = ZoomPanEffect::computeWindow(4.0, 4.0, 1.5, 1.5, "left_to_right",
                                                          ZoomPanEffect::Easing::Linear, 1000, 500);
            expectEquals(start.crop.getX(), 0);
            expectEquals(end.crop.getX(), 500);
            expectEquals(start.crop.getY(), end.crop.getY());
        }

        beginTest("The crop stays inside the scaled frame for every style");
        {
            auto styles = ZoomPanEffect::getPanStyles();
            styles.add("unknown_style");

            for (const auto& style : styles)
            {
                for (int step = 0; step <= 10; ++step)
                {
                    const double t = 0.7 * step;
                    const auto window = ZoomPanEffect::computeWindow(t, 7.0, 1.1, 1.4, style,
                                                                     ZoomPanEffect::Easing::QuadraticInOut, 1280, 720);
                    const juce::Rectangle<int> scaled (0, 0, window.scaledWidth, window.scaledHeight);

                    expect(scaled.contains(window.crop), style + " at t=" + juce::String(t));
                    expectEquals(window.crop.getWidth(), 1280);
                    expectEquals(window.crop.getHeight(), 720);
                }
            }
        }

        beginTest("Easing curves hit both ends");
        {
            using Easing = ZoomPanEffect::Easing;
            for (auto easing : { Easing::Linear, Easing::QuadraticIn, Easing::QuadraticOut, Easing::QuadraticInOut })
            {
                expectWithinAbsoluteError(ZoomPanEffect::ease(easing, 0.0), 0.0, 1.0e-9);
                expectWithinAbsoluteError(ZoomPanEffect::ease(easing, 1.0), 1.0, 1.0e-9);
            }

            expectWithinAbsoluteError(ZoomPanEffect::ease(Easing::QuadraticIn, 0.5), 0.25, 1.0e-9);
            expect(ZoomPanEffect::easingFromString("ease_out") == Easing::QuadraticOut);
            expect(ZoomPanEffect::easingFromString("bouncy") == Easing::Linear);
        }

        beginTest("Applying zoom_pan animates a still");
        {
            ZoomPanEffect effect;
            const auto still = ClipOps::createSolid(juce::Colours::green, 64, 36, 3.0);
            const auto outcome = effect.apply(still, makeParams({ { "pan_style", "zoom_center" } }));

            expect(outcome.wasOk());
            expect(outcome.getClip().animated);
            expectWithinAbsoluteError(outcome.getClip().duration, 3.0, 1.0e-9);
            expectEquals(outcome.getClip().renderFrame(1.5).getWidth(), 64);
        }

        beginTest("An unknown pan style falls back instead of failing");
        {
            ZoomPanEffect effect;
            const auto params = makeParams({ { "pan_style", "sideways" } });

            expect(effect.checkParams(params).wasOk());
            expectEquals(effect.getParamWarnings(params).size(), 1);
            expect(effect.getParamWarnings(makeParams({ { "pan_style", "left_to_right" } })).isEmpty());

            EffectRegistry registry;
            EffectsPipeline pipeline (registry);
            juce::StringArray messages;
            pipeline.setLogCallback([&messages](const juce::String& message) { messages.add(message); });

            const auto still = ClipOps::createSolid(juce::Colours::green, 64, 36, 3.0);
            const auto result = pipeline.apply(still, "zoom_pan", params);

            expect(result.animated);
            expectWithinAbsoluteError(result.duration, 3.0, 1.0e-9);
            expectEquals(messages.size(), 1);
            expect(messages[0].startsWith("WARNING:"));
            expect(messages[0].contains("sideways"));
        }
    }
};

static ZoomPanTests zoomPanTests;

//==============================================================================
class FadeTests : public juce::UnitTest
{
public:
    FadeTests() : juce::UnitTest("FadeEffect", "Effects") {}

    void runTest() override
    {
        beginTest("Overlong fades are scaled to meet");
        {
            const auto ramps = FadeEffect::computeRamps(2.0, 1.5, 1.5, "both");
            expectWithinAbsoluteError(ramps.fadeIn, 1.0, 1.0e-9);
            expectWithinAbsoluteError(ramps.fadeOut, 1.0, 1.0e-9);
            expectWithinAbsoluteError(FadeEffect::opacityAt(0.5, 2.0, ramps), 0.5, 1.0e-9);
            expectWithinAbsoluteError(FadeEffect::opacityAt(1.0, 2.0, ramps), 1.0, 1.0e-9);
            expectWithinAbsoluteError(FadeEffect::opacityAt(1.5, 2.0, ramps), 0.5, 1.0e-9);
        }

        beginTest("Fade type selects the ramps");
        {
            const auto fadeIn = FadeEffect::computeRamps(10.0, 1.0, 2.0, "in");
            expectWithinAbsoluteError(fadeIn.fadeIn, 1.0, 1.0e-9);
            expectWithinAbsoluteError(fadeIn.fadeOut, 0.0, 1.0e-9);
            expectWithinAbsoluteError(FadeEffect::opacityAt(9.9, 10.0, fadeIn), 1.0, 1.0e-9);

            const auto fadeOut = FadeEffect::computeRamps(10.0, 1.0, 2.0, "out");
            expectWithinAbsoluteError(fadeOut.fadeIn, 0.0, 1.0e-9);
            expectWithinAbsoluteError(FadeEffect::opacityAt(9.0, 10.0, fadeOut), 0.5, 1.0e-9);
        }

        beginTest("Fading a clip makes its first frame transparent");
        {
            FadeEffect effect;
            const auto clip = ClipOps::createSolid(juce::Colours::white, 32, 32, 4.0);
            const auto outcome = effect.apply(clip, makeParams({ { "fade_in_duration", 1.0 }, { "fade_out_duration", 1.0 } }));

            expect(outcome.wasOk());
            expect(outcome.getClip().animated);
            expectEquals((int) outcome.getClip().renderFrame(0.0).getPixelAt(16, 16).getAlpha(), 0);
            expectEquals((int) outcome.getClip().renderFrame(2.0).getPixelAt(16, 16).getAlpha(), 255);
            expectEquals((int) outcome.getClip().renderFrame(4.0).getPixelAt(16, 16).getAlpha(), 0);
        }

        beginTest("Opacity is zero at both ends and full in between");
        {
            const auto ramps = FadeEffect::computeRamps(6.0, 1.0, 2.0, "both");
            expectWithinAbsoluteError(FadeEffect::opacityAt(0.0, 6.0, ramps), 0.0, 1.0e-9);
            expectWithinAbsoluteError(FadeEffect::opacityAt(6.0, 6.0, ramps), 0.0, 1.0e-9);

            for (double t = 1.0; t <= 4.0; t += 0.5)
                expectWithinAbsoluteError(FadeEffect::opacityAt(t, 6.0, ramps), 1.0, 1.0e-9);
        }

        beginTest("Unknown fade types are rejected");
        {
            FadeEffect effect;
            expect(effect.checkParams(makeParams({ { "fade_type", "sideways" } })).failed());
            expect(effect.checkParams(makeParams({ { "fade_in", -1.0 } })).failed());
        }
    }
};

static FadeTests fadeTests;

//==============================================================================
class TransitionTests : public juce::UnitTest
{
public:
    TransitionTests() : juce::UnitTest("TransitionEffect", "Effects") {}

    void runTest() override
    {
        const auto red = ClipOps::createSolid(juce::Colours::red, 64, 36, 5.0);
        const auto blue = ClipOps::createSolid(juce::Colours::blue, 64, 36, 5.0);
        TransitionEffect effect;

        beginTest("Overlapping transitions shorten the joined clip");
        {
            expectWithinAbsoluteError(TransitionEffect::joinedDuration("crossfade", 5.0, 5.0, 1.0), 9.0, 1.0e-9);
            expectWithinAbsoluteError(TransitionEffect::joinedDuration("slide_left", 5.0, 0.5, 1.0), 5.0, 1.0e-9);
            expectWithinAbsoluteError(TransitionEffect::joinedDuration("fade_black", 5.0, 5.0, 1.0), 10.5, 1.0e-9);
        }

        beginTest("Crossfade blends the two clips");
        {
            const auto outcome = effect.join(red, blue, makeParams({ { "transition_type", "crossfade" }, { "duration", 1.0 } }));
            expect(outcome.wasOk());

            const auto& joined = outcome.getClip();
            expectWithinAbsoluteError(joined.duration, 9.0, 1.0e-9);
            expect(joined.animated);

            expect(coloursMatch(joined.renderFrame(1.0).getPixelAt(10, 10), juce::Colours::red));
            expect(coloursMatch(joined.renderFrame(8.0).getPixelAt(10, 10), juce::Colours::blue));

            const auto middle = joined.renderFrame(4.5).getPixelAt(10, 10);
            expect(middle.getRed() > 60 && middle.getRed() < 200);
            expect(middle.getBlue() > 60 && middle.getBlue() < 200);
        }

        beginTest("fade_black passes through black");
        {
            const auto outcome = effect.join(red, blue, makeParams({ { "transition_type", "fade_black" }, { "duration", 1.0 } }));
            expect(outcome.wasOk());

            const auto& joined = outcome.getClip();
            expectWithinAbsoluteError(joined.duration, 10.5, 1.0e-9);
            expect(coloursMatch(joined.renderFrame(5.25).getPixelAt(10, 10), juce::Colours::black));
            expect(coloursMatch(joined.renderFrame(2.0).getPixelAt(10, 10), juce::Colours::red));
            expect(coloursMatch(joined.renderFrame(9.0).getPixelAt(10, 10), juce::Colours::blue));
        }

        beginTest("Slides push the first clip out as the second moves in");
        {
            const auto left = effect.join(red, blue, makeParams({ { "transition_type", "slide_left" }, { "duration", 1.0 } }));
            expect(left.wasOk());

            const auto& joined = left.getClip();
            expectWithinAbsoluteError(joined.duration, 9.0, 1.0e-9);

            // Half way through, the clips meet in the middle of the frame
            const auto half = joined.renderFrame(4.5);
            expect(coloursMatch(half.getPixelAt(10, 10), juce::Colours::red));
            expect(coloursMatch(half.getPixelAt(50, 10), juce::Colours::blue));

            const auto quarter = joined.renderFrame(4.25);
            expect(coloursMatch(quarter.getPixelAt(40, 10), juce::Colours::red));
            expect(coloursMatch(quarter.getPixelAt(56, 10), juce::Colours::blue));

            const auto down = effect.join(red, blue, makeParams({ { "transition_type", "slide_down" }, { "duration", 1.0 } }));
            expect(down.wasOk());

            const auto downHalf = down.getClip().renderFrame(4.5);
            expect(coloursMatch(downHalf.getPixelAt(10, 5), juce::Colours::blue));
            expect(coloursMatch(downHalf.getPixelAt(10, 30), juce::Colours::red));
        }

        beginTest("Wipes reveal the second clip up to progress times the frame size");
        {
            const auto horizontal = effect.join(red, blue, makeParams({ { "transition_type", "wipe_horizontal" }, { "duration", 1.0 } }));
            expect(horizontal.wasOk());

            const auto half = horizontal.getClip().renderFrame(4.5);
            expect(coloursMatch(half.getPixelAt(10, 10), juce::Colours::blue));
            expect(coloursMatch(half.getPixelAt(50, 10), juce::Colours::red));

            const auto later = horizontal.getClip().renderFrame(4.75);
            expect(coloursMatch(later.getPixelAt(40, 10), juce::Colours::blue));
            expect(coloursMatch(later.getPixelAt(60, 10), juce::Colours::red));

            const auto vertical = effect.join(red, blue, makeParams({ { "transition_type", "wipe_vertical" }, { "duration", 1.0 } }));
            expect(vertical.wasOk());

            const auto verticalHalf = vertical.getClip().renderFrame(4.5);
            expect(coloursMatch(verticalHalf.getPixelAt(10, 5), juce::Colours::blue));
            expect(coloursMatch(verticalHalf.getPixelAt(10, 30), juce::Colours::red));
        }

        beginTest("Unknown transition types become a crossfade");
        {
            const auto params = makeParams({ { "transition_type", "spin" }, { "duration", 1.0 } });
            expect(effect.checkParams(params).wasOk());
            expectEquals(effect.getParamWarnings(params).size(), 1);
            expectEquals(TransitionEffect::readType(params), juce::String("crossfade"));

            const auto outcome = effect.join(red, blue, params);
            expect(outcome.wasOk());
            expectWithinAbsoluteError(outcome.getClip().duration, 9.0, 1.0e-9);
        }

        beginTest("A transition cannot be applied to a single clip");
        {
            expect(effect.apply(red, makeParams({})).failed());
            expectEquals(TransitionEffect::readType(makeParams({ { "style", "wipe_vertical" } })), juce::String("wipe_vertical"));
        }
    }
};

static TransitionTests transitionTests;

//==============================================================================
class OverlayEffectTests : public juce::UnitTest
{
public:
    OverlayEffectTests() : juce::UnitTest("OverlayEffects", "Effects") {}

    void runTest() override
    {
        beginTest("Logo placement follows the anchor");
        {
            const auto bottomRight = LogoWatermarkEffect::computePlacement(1920, 1080, 200, 100, "bottom-right", 0.15, 20);
            expect(bottomRight == juce::Rectangle<int>(1612, 916, 288, 144));

            const auto topLeft = LogoWatermarkEffect::computePlacement(1920, 1080, 200, 100, "top-left", 0.15, 20);
            expect(topLeft == juce::Rectangle<int>(20, 20, 288, 144));

            const auto centre = LogoWatermarkEffect::computePlacement(1920, 1080, 200, 100, "center", 0.15, 20);
            expect(centre == juce::Rectangle<int>(816, 468, 288, 144));
        }

        beginTest("Tall logos are limited to 30% of the frame height");
        {
            const auto bounds = LogoWatermarkEffect::computePlacement(1920, 1080, 100, 400, "bottom-left", 0.15, 0);
            expectEquals(bounds.getHeight(), 324);
            expectEquals(bounds.getWidth(), 81);
            expectEquals(bounds.getX(), 0);
        }

        beginTest("The logo is drawn into the frame");
        {
            const auto dir = createScratchDirectory();
            const auto logoFile = dir.getChildFile("logo.png");

            juce::Image logo (juce::Image::ARGB, 100, 50, true);
            logo.clear(logo.getBounds(), juce::Colours::red);
            {
                juce::FileOutputStream stream (logoFile);
                juce::PNGImageFormat png;
                expect(stream.openedOk() && png.writeImageToStream(logo, stream));
            }

            LogoWatermarkEffect effect;
            const auto clip = ClipOps::createSolid(juce::Colours::black, 640, 360, 2.0);
            const auto outcome = effect.apply(clip, makeParams({ { "logo_path", logoFile.getFullPathName() },
                                                                 { "opacity", 1.0 },
                                                                 { "scale", 0.25 },
                                                                 { "margin", 10 } }));
            expect(outcome.wasOk(), outcome.getErrorMessage());

            const auto frame = outcome.getClip().renderFrame(1.0);
            expect(coloursMatch(frame.getPixelAt(550, 310), juce::Colours::red));
            expect(coloursMatch(frame.getPixelAt(100, 100), juce::Colours::black));
            expect(!outcome.getClip().animated);

            expect(effect.checkParams(makeParams({ { "logo_path", logoFile.getFullPathName() },
                                                   { "position", "middle" } })).failed());
            dir.deleteRecursively();
        }

        beginTest("Ticker scroll wraps at the text width");
        {
            expectWithinAbsoluteError(TickerEffect::scrollOffset(2.5, 100.0, 120.0), 10.0, 1.0e-9);
            expectWithinAbsoluteError(TickerEffect::scrollOffset(1.0, 50.0, 0.0), 0.0, 1.0e-9);
            expectEquals(TickerEffect::repeatCount(1920, 500.0), 5);
            expectEquals(TickerEffect::repeatCount(1920, 0.0), 1);
        }

        beginTest("The ticker banner fades in and out");
        {
            expectWithinAbsoluteError((double) TickerEffect::bannerOpacity(0.25, 10.0), 0.5, 1.0e-6);
            expectWithinAbsoluteError((double) TickerEffect::bannerOpacity(5.0, 10.0), 1.0, 1.0e-6);
            expectWithinAbsoluteError((double) TickerEffect::bannerOpacity(9.75, 10.0), 0.5, 1.0e-6);
            expectWithinAbsoluteError((double) TickerEffect::bannerOpacity(11.0, 10.0), 0.0, 1.0e-6);
        }

        beginTest("A ticker needs some text");
        {
            TickerEffect effect;
            expect(effect.checkParams(makeParams({})).failed());
            expect(effect.checkParams(makeParams({ { "heading", "Breaking" } })).wasOk());

            const auto outcome = effect.apply(ClipOps::createSolid(juce::Colours::grey, 320, 180, 2.0),
                                              makeParams({ { "heading", "Breaking" }, { "summary", "Markets rally" },
                                                           { "banner_height", 40 }, { "ticker_height", 20 } }));
            expect(outcome.wasOk());
            expect(outcome.getClip().animated);
        }
    }
};

static OverlayEffectTests overlayEffectTests;

//==============================================================================
class EffectsPipelineTests : public juce::UnitTest
{
public:
    EffectsPipelineTests() : juce::UnitTest("EffectsPipeline", "Effects") {}

    void runTest() override
    {
        EffectRegistry registry;
        EffectsPipeline pipeline (registry);
        const auto clip = ClipOps::createSolid(juce::Colours::orange, 48, 27, 3.0);

        beginTest("Unknown effects leave the clip unchanged");
        {
            expect(pipeline.tryApply(clip, "sparkle", makeParams({})).failed());

            const auto result = pipeline.apply(clip, "sparkle", makeParams({}));
            expectWithinAbsoluteError(result.duration, 3.0, 1.0e-9);
            expect(!result.animated);
            expect(coloursMatch(result.renderFrame(1.0).getPixelAt(5, 5), juce::Colours::orange));
        }

        beginTest("Invalid parameters skip the effect");
        {
            const auto outcome = pipeline.tryApply(clip, "zoom_pan", makeParams({ { "zoom_start", -1.0 } }));
            expect(outcome.failed());
            expect(outcome.getErrorMessage().startsWith("zoom_pan"));

            const auto result = pipeline.apply(clip, "zoom_pan", makeParams({ { "zoom_start", -1.0 } }));
            expect(!result.animated);
        }

        beginTest("Effects are applied in order");
        {
            RenderTypes::EffectSpec zoom;
            zoom.type = "ken_burns";
            zoom.params = makeParams({ { "pan_style", "zoom_center" } });

            RenderTypes::EffectSpec broken;
            broken.type = "does_not_exist";

            const auto result = pipeline.applyAll(clip, { broken, zoom });
            expect(result.animated);
            expectWithinAbsoluteError(result.duration, 3.0, 1.0e-9);
        }

        beginTest("Effects that only add overlays do not introduce motion");
        {
            expect(pipeline.introducesMotion("zoom_pan"));
            expect(pipeline.introducesMotion("ticker"));
            expect(!pipeline.introducesMotion("logo_watermark"));
            expect(!pipeline.introducesMotion("background_music"));
            expect(!pipeline.introducesMotion("unknown"));
        }

        beginTest("Joining falls back to a cut when the transition is invalid");
        {
            const auto second = ClipOps::createSolid(juce::Colours::purple, 48, 27, 2.0);

            const auto crossfaded = pipeline.join(clip, second, makeParams({ { "duration", 1.0 } }));
            expectWithinAbsoluteError(crossfaded.duration, 4.0, 1.0e-9);

            const auto cut = pipeline.join(clip, second, makeParams({ { "duration", -2.0 } }));
            expectWithinAbsoluteError(cut.duration, 5.0, 1.0e-9);

            juce::StringArray messages;
            pipeline.setLogCallback([&messages](const juce::String& message) { messages.add(message); });

            const auto spun = pipeline.join(clip, second, makeParams({ { "transition_type", "spin" }, { "duration", 1.0 } }));
            expectWithinAbsoluteError(spun.duration, 4.0, 1.0e-9);
            expect(spun.animated);
            expectEquals(messages.size(), 1);
            expect(messages[0].startsWith("WARNING:"));

            pipeline.setLogCallback(nullptr);
        }

        beginTest("Background music is mixed under the clip");
        {
            const auto dir = createScratchDirectory();
            const auto musicFile = dir.getChildFile("music.wav");

            AudioMixer mixer;
            expect(mixer.writeWav(*constantTrack(0.5f, 1.0), musicFile));

            const auto result = pipeline.apply(clip, "background_music",
                                               makeParams({ { "music_path", musicFile.getFullPathName() },
                                                            { "music_volume", 0.5 },
                                                            { "fade_in", 0.0 },
                                                            { "fade_out", 0.0 } }));

            expect(result.audio != nullptr);
            if (result.audio != nullptr)
            {
                expectWithinAbsoluteError(result.audio->getDuration(), 3.0, 1.0e-3);
                expectWithinAbsoluteError((double) result.audio->buffer.getSample(0, 66150), 0.25, 1.0e-3);
            }

            dir.deleteRecursively();
        }
    }
};

static EffectsPipelineTests effectsPipelineTests;

//==============================================================================
class AudioMixerTests : public juce::UnitTest
{
public:
    AudioMixerTests() : juce::UnitTest("AudioMixer", "Effects") {}

    void runTest() override
    {
        beginTest("Looping repeats the track and trims to length");
        {
            AudioTrack track;
            track.buffer.setSize(2, 44100);
            for (int i = 0; i < 44100; ++i)
            {
                track.buffer.setSample(0, i, (float) i / 44100.0f);
                track.buffer.setSample(1, i, 0.0f);
            }

            const auto looped = AudioMixer::loopToLength(track, 2.5);
            expectEquals(looped->buffer.getNumSamples(), 110250);
            expectWithinAbsoluteError(looped->buffer.getSample(0, 44105), track.buffer.getSample(0, 5), 1.0e-6f);
            expectWithinAbsoluteError(looped->buffer.getSample(0, 88200 + 1000), track.buffer.getSample(0, 1000), 1.0e-6f);
        }

        beginTest("Music is scaled by its volume");
        {
            AudioMixer::MusicSettings settings;
            settings.musicVolume = 0.5;
            settings.fadeIn = 0.0;
            settings.fadeOut = 0.0;

            const auto mixed = AudioMixer::mixWithMusic(nullptr, *constantTrack(0.5f, 1.0), 2.0, settings);
            expectEquals(mixed->buffer.getNumSamples(), 88200);
            expectWithinAbsoluteError(mixed->buffer.getSample(1, 60000), 0.25f, 1.0e-6f);
        }

        beginTest("Loud mixes are limited below full scale");
        {
            AudioMixer::MusicSettings settings;
            settings.musicVolume = 0.5;
            settings.voiceVolume = 1.0;
            settings.fadeIn = 0.0;
            settings.fadeOut = 0.0;

            const auto mixed = AudioMixer::mixWithMusic(constantTrack(1.0f, 1.0), *constantTrack(0.5f, 1.0), 1.0, settings);
            expect(mixed->buffer.getMagnitude(0, 0, mixed->buffer.getNumSamples()) <= 0.8911f);
        }

        beginTest("Fades start from silence");
        {
            AudioMixer::MusicSettings settings;
            settings.musicVolume = 1.0;
            settings.fadeIn = 1.0;
            settings.fadeOut = 1.0;

            const auto mixed = AudioMixer::mixWithMusic(nullptr, *constantTrack(0.5f, 4.0), 4.0, settings);
            expectWithinAbsoluteError(mixed->buffer.getSample(0, 0), 0.0f, 1.0e-6f);
            expectWithinAbsoluteError(mixed->buffer.getSample(0, 88200), 0.5f, 1.0e-6f);
        }

        beginTest("The limiter reports the gain it applied");
        {
            juce::AudioBuffer<float> quiet (1, 100);
            quiet.clear();
            quiet.setSample(0, 10, 0.5f);
            expectWithinAbsoluteError(AudioMixer::applyLimiter(quiet), 1.0f, 1.0e-6f);

            juce::AudioBuffer<float> loud (1, 100);
            loud.clear();
            loud.setSample(0, 10, 2.0f);
            const auto gain = AudioMixer::applyLimiter(loud);
            expectWithinAbsoluteError(gain, 0.891f / 2.0f, 1.0e-6f);
            expectWithinAbsoluteError(loud.getSample(0, 10), 0.891f, 1.0e-6f);
        }

        beginTest("Tracks are concatenated end to end");
        {
            std::vector<std::shared_ptr<const AudioTrack>> parts { constantTrack(0.1f, 0.5), nullptr, constantTrack(0.2f, 0.25) };
            const auto joined = AudioMixer::concatenate(parts);

            expectEquals(joined->buffer.getNumSamples(), 22050 + 11025);
            expectWithinAbsoluteError(joined->buffer.getSample(0, 22049), 0.1f, 1.0e-6f);
            expectWithinAbsoluteError(joined->buffer.getSample(1, 22050), 0.2f, 1.0e-6f);
        }
    }
};

static AudioMixerTests audioMixerTests;
