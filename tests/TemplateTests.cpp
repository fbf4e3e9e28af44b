#include <JuceHeader.h>
#include "../src/template/LayerExpander.h"
#include "../src/template/TemplateParser.h"
#include "../src/template/VariableResolver.h"
#include "../src/utils/VarHelpers.h"

using namespace RenderTypes;

namespace
{
    juce::var json(const juce::String& text)
    {
        return juce::JSON::parse(text);
    }

    Layer arrayLayer(const juce::String& id, const juce::StringArray& sources)
    {
        Layer layer;
        layer.id = id;
        layer.type = LayerType::Image;
        layer.sources = sources;
        layer.hasArraySource = true;
        return layer;
    }
}

//==============================================================================
class VariableResolverTests : public juce::UnitTest
{
public:
    VariableResolverTests() : juce::UnitTest("VariableResolver", "Template") {}

    void runTest() override
    {
        VariableResolver resolver;

        beginTest("Whole-token strings take the typed value");
        {
            const auto document = json(R"({"layers": [{"id": "gallery", "source": "{{images}}", "opacity": "{{alpha}}"}]})");
            const auto variables = json(R"({"images": ["a.jpg", "b.jpg"], "alpha": 0.5})");

            const auto resolved = resolver.resolve(document, variables);
            const auto layer = resolved["layers"][0];

            expect(layer["source"].isArray());
            expectEquals(layer["source"].size(), 2);
            expectEquals(layer["source"][1].toString(), juce::String("b.jpg"));
            expect(layer["opacity"].isDouble());
            expectWithinAbsoluteError((double) layer["opacity"], 0.5, 1.0e-9);
        }

        beginTest("Embedded tokens receive the value's text");
        {
            const auto document = json(R"({"title": "Only {{price}} for {{name}}!"})");
            const auto resolved = resolver.resolve(document, json(R"({"price": 25, "name": "Widget"})"));

            expectEquals(resolved["title"].toString(), juce::String("Only 25 for Widget!"));
        }

        beginTest("Defaults and type placeholders fill unsupplied variables");
        {
            const auto document = json(R"({
                "variables": {
                    "headline": {"type": "text", "default": "Big Sale"},
                    "accent":   {"type": "color"},
                    "count":    {"type": "number"}
                },
                "layers": [{"text": "{{headline}}", "color": "{{accent}}", "size": "{{count}}"}]
            })");

            const auto layer = resolver.resolve(document, {})["layers"][0];

            expectEquals(layer["text"].toString(), juce::String("Big Sale"));
            expectEquals(layer["color"].toString(), juce::String("#808080"));
            expectWithinAbsoluteError((double) layer["size"], 1.0, 1.0e-9);
        }

        beginTest("Undeclared tokens without a value are left verbatim");
        {
            const auto resolved = resolver.resolve(json(R"({"text": "Hello {{unknown}}"})"), {});
            expectEquals(resolved["text"].toString(), juce::String("Hello {{unknown}}"));
        }

        beginTest("Resolution is idempotent");
        {
            const auto document = json(R"({"layers": [{"source": "{{logo}}", "text": "By {{author}}"}]})");
            const auto variables = json(R"({"logo": "https://cdn.example.com/logo.png", "author": "Ada"})");

            const auto once = resolver.resolve(document, variables);
            const auto twice = resolver.resolve(once, variables);

            expectEquals(juce::JSON::toString(twice), juce::JSON::toString(once));
        }

        beginTest("The input document is not modified");
        {
            const auto document = json(R"({"text": "{{name}}"})");
            resolver.resolve(document, json(R"({"name": "Changed"})"));

            expectEquals(document["text"].toString(), juce::String("{{name}}"));
        }

        beginTest("Placeholders are listed once in order of appearance");
        {
            const auto document = json(R"({
                "variables": {"ignored": {"type": "text", "default": "{{not_counted}}"}},
                "layers": [{"text": "{{b}} and {{a}}"}, {"source": "{{b}}"}]
            })");

            const auto names = VariableResolver::extractPlaceholders(document);

            expectEquals(names.size(), 2);
            expectEquals(names[0], juce::String("b"));
            expectEquals(names[1], juce::String("a"));
        }

        beginTest("Required variables without value or default are reported");
        {
            const auto document = json(R"({
                "variables": {
                    "product": {"type": "text", "required": true},
                    "tagline": {"type": "text", "required": true, "default": "Now available"},
                    "note":    {"type": "text"}
                }
            })");

            const auto missing = VariableResolver::findMissingRequired(document, json(R"({"note": "x"})"));
            expectEquals(missing.size(), 1);
            expectEquals(missing[0], juce::String("product"));

            expect(VariableResolver::findMissingRequired(document, json(R"({"product": "Kettle"})")).isEmpty());
        }

        beginTest("Overrides merge into defaults key by key");
        {
            const auto defaults = json(R"({"style": {"color": "#000000", "size": 12}, "title": "Default"})");
            const auto overrides = json(R"({"style": {"color": "#FF0000"}, "extra": true})");

            const auto merged = VariableResolver::mergeOverrides(defaults, overrides);

            expectEquals(merged["style"]["color"].toString(), juce::String("#FF0000"));
            expectEquals((int) merged["style"]["size"], 12);
            expectEquals(merged["title"].toString(), juce::String("Default"));
            expect((bool) merged["extra"]);
            expectEquals(defaults["style"]["color"].toString(), juce::String("#000000"));
        }
    }
};

static VariableResolverTests variableResolverTests;

//==============================================================================
class TemplateParserTests : public juce::UnitTest
{
public:
    TemplateParserTests() : juce::UnitTest("TemplateParser", "Template") {}

    void runTest() override
    {
        TemplateParser parser;

        beginTest("Resolution is derived from the aspect ratio");
        {
            Template parsed;
            expect(parser.parse(json(R"({"aspect_ratio": "9:16", "layers": []})"), parsed).wasOk());
            expectEquals(parsed.width, 1080);
            expectEquals(parsed.height, 1920);

            expect(parser.parse(json(R"({"aspect_ratio": "4:5", "layers": []})"), parsed).wasOk());
            expectEquals(parsed.height, 1350);
        }

        beginTest("Resolutions that contradict the aspect ratio are rejected");
        {
            Template parsed;
            const auto result = parser.parse(json(R"({"aspect_ratio": "16:9", "resolution": {"width": 1080, "height": 1080}})"),
                                             parsed);
            expect(result.failed());
        }

        beginTest("Layers and effects are read into typed structs");
        {
            Template parsed;
            const auto result = parser.parse(json(R"({
                "aspect_ratio": "16:9",
                "layers": [
                    {"id": "bg", "type": "video", "source": ["a.mp4", "b.mp4"]},
                    {"id": "title", "type": "text", "text": "Hello", "start_time": 1.5, "duration": 3,
                     "z_index": 4, "position": {"x": 0.1, "y": 0.2}, "width": 0.5, "height": 0.25}
                ],
                "effects": [{"type": "Ken_Burns", "params": {"zoom_end": 1.3}}]
            })"), parsed);

            expect(result.wasOk(), result.getErrorMessage());
            expectEquals((int) parsed.layers.size(), 2);

            const auto& background = parsed.layers[0];
            expect(background.type == LayerType::Video);
            expect(background.isExpandable());
            expectEquals(background.sources.size(), 2);

            const auto& title = parsed.layers[1];
            expect(title.type == LayerType::Text);
            expectEquals(title.text, juce::String("Hello"));
            expectWithinAbsoluteError(title.startTime, 1.5, 1.0e-9);
            expectWithinAbsoluteError(title.duration, 3.0, 1.0e-9);
            expectEquals(title.zIndex, 4);
            expectWithinAbsoluteError(title.x, 0.1, 1.0e-9);
            expectWithinAbsoluteError(title.height, 0.25, 1.0e-9);

            expectEquals((int) parsed.effects.size(), 1);
            expectEquals(parsed.effects[0].type, juce::String("ken_burns"));
            expect(parsed.effects[0].isGlobal());
        }
    }
};

static TemplateParserTests templateParserTests;

//==============================================================================
class LayerExpanderTests : public juce::UnitTest
{
public:
    LayerExpanderTests() : juce::UnitTest("LayerExpander", "Template") {}

    void runTest() override
    {
        LayerExpander expander;

        beginTest("Without timing the timeline is split evenly");
        {
            auto layer = arrayLayer("slides", { "a.jpg", "b.jpg", "c.jpg" });
            layer.zIndex = 3;
            layer.opacity = 0.8;

            const auto expanded = expander.expand({ layer }, TimingIndex(), 9.0);

            expectEquals((int) expanded.size(), 3);
            for (int i = 0; i < 3; ++i)
            {
                const auto& child = expanded[(size_t) i];
                expectEquals(child.id, "slides_" + juce::String(i));
                expectEquals(child.expandedFrom, juce::String("slides"));
                expectWithinAbsoluteError(child.startTime, 3.0 * i, 1.0e-9);
                expectWithinAbsoluteError(child.duration, 3.0, 1.0e-9);
                expectEquals(child.zIndex, 3);
                expectWithinAbsoluteError(child.opacity, 0.8, 1.0e-9);
                expect(!child.isExpandable());
            }

            expectEquals(expanded[1].source, juce::String("b.jpg"));
        }

        beginTest("Distributed timing is used where the index knows the asset");
        {
            TimedAsset first;
            first.url = "a.jpg";
            first.startTime = 0.0;
            first.duration = 4.0;

            TimedAsset second;
            second.url = "b.jpg";
            second.startTime = 4.0;
            second.duration = 6.0;

            const auto expanded = expander.expand({ arrayLayer("slides", { "a.jpg", "b.jpg" }) },
                                                  TimingIndex({ first, second }), 10.0);

            expectEquals((int) expanded.size(), 2);
            expectWithinAbsoluteError(expanded[1].startTime, 4.0, 1.0e-9);
            expectWithinAbsoluteError(expanded[1].duration, 6.0, 1.0e-9);
        }

        beginTest("Mixed layers take their type from each asset");
        {
            auto layer = arrayLayer("media", { "clip.mp4", "photo.png" });
            layer.type = LayerType::Mixed;

            const auto expanded = expander.expand({ layer }, TimingIndex(), 4.0);

            expect(expanded[0].type == LayerType::Video);
            expect(expanded[1].type == LayerType::Image);
        }

        beginTest("Indexed assets keep their own media type");
        {
            TimedAsset clip;
            clip.url = "walkthrough";
            clip.type = MediaType::Video;
            clip.duration = 5.0;

            TimedAsset photo;
            photo.url = "cover.mp4";
            photo.type = MediaType::Image;
            photo.startTime = 5.0;
            photo.duration = 3.0;

            const auto expanded = expander.expand({ arrayLayer("media", { "walkthrough", "cover.mp4", "extra.jpg" }) },
                                                  TimingIndex({ clip, photo }), 8.0);

            expectEquals((int) expanded.size(), 3);
            expect(expanded[0].type == LayerType::Video);
            expect(expanded[1].type == LayerType::Image);
            expect(expanded[2].type == LayerType::Image);

            Layer caption;
            caption.id = "caption";
            caption.type = LayerType::Text;
            caption.sources.add("walkthrough");
            caption.hasArraySource = true;

            const auto captions = expander.expand({ caption }, TimingIndex({ clip }), 8.0);
            expect(captions[0].type == LayerType::Text);
            expectWithinAbsoluteError(captions[0].duration, 5.0, 1.0e-9);
        }

        beginTest("Scalar layers pass through with the timeline duration as default");
        {
            Layer title;
            title.id = "title";
            title.type = LayerType::Text;
            title.text = "Hello";

            Layer badge;
            badge.id = "badge";
            badge.duration = 2.0;

            const auto expanded = expander.expand({ title, badge }, TimingIndex(), 12.0);

            expectEquals((int) expanded.size(), 2);
            expectWithinAbsoluteError(expanded[0].duration, 12.0, 1.0e-9);
            expectWithinAbsoluteError(expanded[1].duration, 2.0, 1.0e-9);
            expectEquals(expanded[0].text, juce::String("Hello"));
        }

        beginTest("An empty source list produces no layers");
        {
            const auto expanded = expander.expand({ arrayLayer("empty", {}) }, TimingIndex(), 5.0);
            expect(expanded.empty());
        }
    }
};

static LayerExpanderTests layerExpanderTests;
