#include "VarHelpers.h"

namespace
{
    juce::uint8 clampByte(double value)
    {
        return (juce::uint8) juce::jlimit(0, 255, juce::roundToInt(value));
    }

    // Alpha values in rgba() may be written as 0..1 or 0..255
    juce::uint8 alphaByte(double value)
    {
        if (value <= 1.0)
            return clampByte(value * 255.0);
        return clampByte(value);
    }

    bool isHexString(const juce::String& text)
    {
        return text.isNotEmpty() && text.containsOnly("0123456789abcdefABCDEF");
    }

    bool parseHexColour(juce::String hex, juce::Colour& result)
    {
        if (!isHexString(hex))
            return false;

        if (hex.length() == 3 || hex.length() == 4)
        {
            juce::String expanded;
            for (int i = 0; i < hex.length(); ++i)
                expanded << hex[i] << hex[i];
            hex = expanded;
        }

        if (hex.length() == 6)
        {
            const auto rgb = (juce::uint32) hex.getHexValue32();
            result = juce::Colour((juce::uint8) ((rgb >> 16) & 0xff),
                                  (juce::uint8) ((rgb >> 8) & 0xff),
                                  (juce::uint8) (rgb & 0xff));
            return true;
        }

        if (hex.length() == 8)
        {
            const auto rgba = (juce::uint32) hex.getHexValue32();
            result = juce::Colour((juce::uint8) ((rgba >> 24) & 0xff),
                                  (juce::uint8) ((rgba >> 16) & 0xff),
                                  (juce::uint8) ((rgba >> 8) & 0xff),
                                  (juce::uint8) (rgba & 0xff));
            return true;
        }

        return false;
    }

    bool parseFunctionalColour(const juce::String& text, juce::Colour& result)
    {
        const auto lower = text.toLowerCase();
        if (!lower.startsWith("rgb"))
            return false;

        const auto inner = lower.fromFirstOccurrenceOf("(", false, false)
                                .upToLastOccurrenceOf(")", false, false);

        juce::StringArray parts;
        parts.addTokens(inner, ",", "");
        parts.trim();
        parts.removeEmptyStrings();

        if (parts.size() < 3)
            return false;

        const auto alpha = parts.size() >= 4 ? alphaByte(parts[3].getDoubleValue()) : (juce::uint8) 255;
        result = juce::Colour(clampByte(parts[0].getDoubleValue()),
                              clampByte(parts[1].getDoubleValue()),
                              clampByte(parts[2].getDoubleValue()),
                              alpha);
        return true;
    }
}

namespace VarHelpers
{
    bool has(const juce::var& object, const juce::Identifier& key)
    {
        return object.isObject() && object.hasProperty(key) && !object[key].isVoid();
    }

    juce::var get(const juce::var& object, const juce::Identifier& key)
    {
        if (!object.isObject())
            return {};
        return object.getProperty(key, juce::var());
    }

    juce::String getString(const juce::var& object, const juce::Identifier& key, const juce::String& fallback)
    {
        if (!has(object, key))
            return fallback;

        const auto& value = object[key];
        if (value.isArray() || value.isObject())
            return fallback;

        return value.toString();
    }

    double toDouble(const juce::var& value, double fallback)
    {
        if (value.isDouble() || value.isInt() || value.isInt64() || value.isBool())
            return static_cast<double>(value);

        if (value.isString())
        {
            const auto text = value.toString().trim();
            if (text.isEmpty() || !text.containsOnly("0123456789.-+eE"))
                return fallback;
            return text.getDoubleValue();
        }

        return fallback;
    }

    double getDouble(const juce::var& object, const juce::Identifier& key, double fallback)
    {
        if (!has(object, key))
            return fallback;
        return toDouble(object[key], fallback);
    }

    int getInt(const juce::var& object, const juce::Identifier& key, int fallback)
    {
        if (!has(object, key))
            return fallback;
        return juce::roundToInt(toDouble(object[key], (double) fallback));
    }

    bool getBool(const juce::var& object, const juce::Identifier& key, bool fallback)
    {
        if (!has(object, key))
            return fallback;

        const auto& value = object[key];
        if (value.isString())
        {
            const auto text = value.toString().trim().toLowerCase();
            if (text == "true" || text == "yes" || text == "1")
                return true;
            if (text == "false" || text == "no" || text == "0")
                return false;
            return fallback;
        }

        return static_cast<bool>(value);
    }

    juce::var makeObject()
    {
        return juce::var(new juce::DynamicObject());
    }

    void set(juce::var& object, const juce::Identifier& key, const juce::var& value)
    {
        if (auto* dynamicObject = object.getDynamicObject())
            dynamicObject->setProperty(key, value);
    }

    juce::Colour parseColour(const juce::var& value, juce::Colour fallback)
    {
        if (value.isArray())
        {
            const auto* values = value.getArray();
            if (values == nullptr || values->size() < 3)
                return fallback;

            const auto alpha = values->size() >= 4 ? alphaByte(toDouble(values->getReference(3), 255.0))
                                                   : (juce::uint8) 255;
            return juce::Colour(clampByte(toDouble(values->getReference(0), 0.0)),
                                clampByte(toDouble(values->getReference(1), 0.0)),
                                clampByte(toDouble(values->getReference(2), 0.0)),
                                alpha);
        }

        if (!value.isString())
            return fallback;

        const auto text = value.toString().trim();
        if (text.isEmpty())
            return fallback;

        juce::Colour result;

        if (text.startsWithChar('#') && parseHexColour(text.substring(1), result))
            return result;

        if (parseFunctionalColour(text, result))
            return result;

        if (text.equalsIgnoreCase("transparent"))
            return juce::Colours::transparentBlack;

        return juce::Colours::findColourForName(text, fallback);
    }

    juce::Colour getColour(const juce::var& object, const juce::Identifier& key, juce::Colour fallback)
    {
        if (!has(object, key))
            return fallback;
        return parseColour(object[key], fallback);
    }
}
