#pragma once
#include <JuceHeader.h>

/**
 * Small helpers for reading typed values out of parsed JSON (juce::var) trees
 * and for turning template colour strings into juce::Colour values.
 *
 * All getters return the supplied fallback when the property is missing,
 * void, or of a type that cannot be converted.
 */
namespace VarHelpers
{
    /** Returns true if the object has a non-void value for the key. */
    bool has(const juce::var& object, const juce::Identifier& key);

    juce::var get(const juce::var& object, const juce::Identifier& key);
    juce::String getString(const juce::var& object, const juce::Identifier& key, const juce::String& fallback = {});
    double getDouble(const juce::var& object, const juce::Identifier& key, double fallback);
    int getInt(const juce::var& object, const juce::Identifier& key, int fallback);
    bool getBool(const juce::var& object, const juce::Identifier& key, bool fallback);

    /** Converts a scalar var (number, string, bool) into a double, or the fallback. */
    double toDouble(const juce::var& value, double fallback);

    /** Creates an empty JSON object. */
    juce::var makeObject();

    /** Sets a property on an object var, creating nothing if the var is not an object. */
    void set(juce::var& object, const juce::Identifier& key, const juce::var& value);

    /**
     * Parses a colour given as "#RGB", "#RRGGBB", "#RRGGBBAA", "rgb(r,g,b)",
     * "rgba(r,g,b,a)", a CSS colour name, or an array [r, g, b(, a)].
     *
     * @param value     The colour value from the template
     * @param fallback  Returned when the value cannot be parsed
     */
    juce::Colour parseColour(const juce::var& value, juce::Colour fallback);

    /** Reads a colour property, falling back when absent or unparsable. */
    juce::Colour getColour(const juce::var& object, const juce::Identifier& key, juce::Colour fallback);
}
