#include "TemplateParser.h"
#include "VariableResolver.h"
#include "../utils/VarHelpers.h"

namespace
{
    bool parseAspectRatio(const juce::String& aspectRatio, double& ratio)
    {
        const auto separator = aspectRatio.containsChar(':') ? ":" : "/";
        const double w = aspectRatio.upToFirstOccurrenceOf(separator, false, false).trim().getDoubleValue();
        const double h = aspectRatio.fromFirstOccurrenceOf(separator, false, false).trim().getDoubleValue();

        if (w <= 0.0 || h <= 0.0)
            return false;

        ratio = w / h;
        return true;
    }

    int roundDownToEven(int value)
    {
        return value - (value % 2);
    }

    // Template coordinates are canvas fractions; values above 1 are taken as pixels.
    double toFraction(double value, int canvasExtent)
    {
        if (value > 1.0 && canvasExtent > 0)
            value /= (double) canvasExtent;
        return juce::jlimit(0.0, 1.0, value);
    }

    double readFirst(const juce::var& object, std::initializer_list<const char*> keys, double fallback)
    {
        for (auto* key : keys)
            if (VarHelpers::has(object, key))
                return VarHelpers::getDouble(object, key, fallback);
        return fallback;
    }

    juce::String readFirstString(const juce::var& object, std::initializer_list<const char*> keys, const juce::String& fallback)
    {
        for (auto* key : keys)
            if (VarHelpers::has(object, key))
                return VarHelpers::getString(object, key, fallback);
        return fallback;
    }

    void parseFade(const juce::var& fadeObject, RenderTypes::FadeSpec& fade)
    {
        if (!fadeObject.isObject())
        {
            fade.enabled = VarHelpers::toDouble(fadeObject, 0.0) != 0.0;
            return;
        }

        fade.enabled = VarHelpers::getBool(fadeObject, "enabled", true);
        fade.fadeIn = juce::jmax(0.0, readFirst(fadeObject, { "in", "fade_in", "fade_in_duration" }, fade.fadeIn));
        fade.fadeOut = juce::jmax(0.0, readFirst(fadeObject, { "out", "fade_out", "fade_out_duration" }, fade.fadeOut));
        fade.type = readFirstString(fadeObject, { "type", "fade_type" }, fade.type).toLowerCase();
    }
}

//==============================================================================
void TemplateParser::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

bool TemplateParser::resolutionForAspectRatio(const juce::String& aspectRatio, int& width, int& height)
{
    double ratio = 0.0;
    if (!parseAspectRatio(aspectRatio, ratio))
        return false;

    if (ratio >= 1.0)
    {
        height = 1080;
        width = roundDownToEven(juce::roundToInt(1080.0 * ratio));
    }
    else
    {
        width = 1080;
        height = roundDownToEven(juce::roundToInt(1080.0 / ratio));
    }

    return true;
}

bool TemplateParser::isConsistentWithAspectRatio(const juce::String& aspectRatio, int width, int height)
{
    double ratio = 0.0;
    if (!parseAspectRatio(aspectRatio, ratio) || width <= 0 || height <= 0)
        return false;

    const double actual = (double) width / (double) height;
    return std::abs(actual - ratio) / ratio <= 0.01;
}

//==============================================================================
juce::Result TemplateParser::parse(const juce::var& document, RenderTypes::Template& result) const
{
    if (!document.isObject())
        return juce::Result::fail("Template document is not a JSON object");

    RenderTypes::Template parsed;
    parsed.templateId = readFirstString(document, { "template_id", "id" }, "template");
    parsed.name = VarHelpers::getString(document, "name", parsed.templateId);
    parsed.aspectRatio = VarHelpers::getString(document, "aspect_ratio", "16:9");

    const auto resolution = VarHelpers::get(document, "resolution");
    if (resolution.isObject())
    {
        parsed.width = VarHelpers::getInt(resolution, "width", 0);
        parsed.height = VarHelpers::getInt(resolution, "height", 0);

        if (parsed.width <= 0 || parsed.height <= 0)
            return juce::Result::fail("Template resolution must be positive");

        if (VarHelpers::has(document, "aspect_ratio")
             && !isConsistentWithAspectRatio(parsed.aspectRatio, parsed.width, parsed.height))
        {
            return juce::Result::fail("Resolution " + juce::String(parsed.width) + "x" + juce::String(parsed.height)
                                      + " does not match aspect ratio " + parsed.aspectRatio);
        }
    }
    else if (!resolutionForAspectRatio(parsed.aspectRatio, parsed.width, parsed.height))
    {
        return juce::Result::fail("Unrecognised aspect ratio: " + parsed.aspectRatio);
    }

    if (parsed.width % 2 != 0 || parsed.height % 2 != 0)
    {
        if (logCallback)
            logCallback("WARNING: Odd resolution " + juce::String(parsed.width) + "x" + juce::String(parsed.height)
                        + " rounded down to even dimensions");
        parsed.width = roundDownToEven(parsed.width);
        parsed.height = roundDownToEven(parsed.height);
    }

    // Layers
    const auto layers = VarHelpers::get(document, "layers");
    if (!layers.isVoid() && !layers.isArray())
        return juce::Result::fail("Template 'layers' must be an array");

    if (auto* layerArray = layers.getArray())
    {
        for (int i = 0; i < layerArray->size(); ++i)
        {
            RenderTypes::Layer layer;
            auto layerResult = parseLayer(layerArray->getReference(i), i, layer);
            if (layerResult.failed())
                return layerResult;

            // Pixel values are converted against the canvas here, once it is known
            layer.x = toFraction(layer.x, parsed.width);
            layer.y = toFraction(layer.y, parsed.height);
            layer.width = toFraction(layer.width, parsed.width);
            layer.height = toFraction(layer.height, parsed.height);

            parsed.layers.push_back(layer);
        }
    }

    // Effects
    if (auto* effectArray = VarHelpers::get(document, "effects").getArray())
    {
        for (const auto& effectObject : *effectArray)
        {
            RenderTypes::EffectSpec effect;
            effect.type = VarHelpers::getString(effectObject, "type").trim().toLowerCase();

            if (effect.type.isEmpty())
            {
                if (logCallback)
                    logCallback("WARNING: Skipping effect without a type");
                continue;
            }

            effect.targetLayerId = readFirstString(effectObject, { "target_layer_id", "target_layer", "target" }, {});
            const auto params = VarHelpers::get(effectObject, "params");
            effect.params = params.isObject() ? params : effectObject;
            parsed.effects.push_back(effect);
        }
    }

    parsed.variables = VariableResolver::parseVariableSpecs(document);
    parsed.backgroundMusic = VarHelpers::get(document, "background_music");
    parsed.logo = VarHelpers::get(document, "logo");

    result = parsed;
    return juce::Result::ok();
}

//==============================================================================
juce::Result TemplateParser::parseLayer(const juce::var& layerObject, int index, RenderTypes::Layer& layer) const
{
    if (!layerObject.isObject())
        return juce::Result::fail("Layer " + juce::String(index) + " is not an object");

    layer.id = VarHelpers::getString(layerObject, "id", "layer_" + juce::String(index));

    const auto typeName = VarHelpers::getString(layerObject, "type", "image");
    if (!RenderTypes::parseLayerType(typeName, layer.type))
        return juce::Result::fail("Layer '" + layer.id + "' has unknown type '" + typeName + "'");

    const auto source = VarHelpers::get(layerObject, "source");
    if (auto* sourceArray = source.getArray())
    {
        layer.hasArraySource = true;
        for (const auto& entry : *sourceArray)
        {
            // Entries may be plain URLs or {"url": ...} objects
            const auto url = entry.isObject() ? VarHelpers::getString(entry, "url") : entry.toString();
            if (url.isNotEmpty())
                layer.sources.add(url);
        }
    }
    else if (!source.isVoid() && !source.isObject())
    {
        layer.source = source.toString();
    }

    const auto position = VarHelpers::get(layerObject, "position");
    layer.x = readFirst(position.isObject() ? position : layerObject, { "x" }, 0.0);
    layer.y = readFirst(position.isObject() ? position : layerObject, { "y" }, 0.0);

    const auto size = VarHelpers::get(layerObject, "size");
    layer.width = readFirst(size.isObject() ? size : layerObject, { "width" }, 1.0);
    layer.height = readFirst(size.isObject() ? size : layerObject, { "height" }, 1.0);

    layer.startTime = juce::jmax(0.0, readFirst(layerObject, { "start_time", "start" }, 0.0));
    layer.duration = readFirst(layerObject, { "duration" }, -1.0);
    layer.zIndex = VarHelpers::getInt(layerObject, "z_index", index);
    layer.opacity = juce::jlimit(0.0, 1.0, VarHelpers::getDouble(layerObject, "opacity", 1.0));

    if (VarHelpers::has(layerObject, "fade"))
        parseFade(layerObject["fade"], layer.fade);

    layer.text = VarHelpers::getString(layerObject, "text");
    if (layer.type == RenderTypes::LayerType::Text && layer.text.isEmpty())
        layer.text = layer.source;

    layer.fontFamily = readFirstString(layerObject, { "font_family", "font" }, layer.fontFamily);
    layer.fontSize = (float) readFirst(layerObject, { "font_size" }, layer.fontSize);
    layer.textColour = readFirstString(layerObject, { "color", "text_color" }, layer.textColour);
    layer.backgroundColour = VarHelpers::getString(layerObject, "background_color");
    layer.textAlign = VarHelpers::getString(layerObject, "text_align", layer.textAlign).toLowerCase();
    layer.bold = VarHelpers::getBool(layerObject, "bold", false)
                  || VarHelpers::getString(layerObject, "font_weight").equalsIgnoreCase("bold");

    layer.shape = VarHelpers::getString(layerObject, "shape", layer.shape).toLowerCase();
    layer.fillColour = readFirstString(layerObject, { "fill_color", "fill" }, layer.type == RenderTypes::LayerType::Shape
                                                                              ? readFirstString(layerObject, { "color" }, layer.fillColour)
                                                                              : layer.fillColour);
    layer.cornerRadius = (float) readFirst(layerObject, { "corner_radius" }, 0.0);

    return juce::Result::ok();
}
