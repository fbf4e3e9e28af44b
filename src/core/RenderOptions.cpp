#include "RenderOptions.h"
#include "../utils/VarHelpers.h"

namespace
{
    juce::String softwarePreset(RenderOptions::Quality quality)
    {
        switch (quality)
        {
            case RenderOptions::Quality::High:  return "-preset medium -crf 18";
            case RenderOptions::Quality::Low:   return "-preset faster -crf 28";
            case RenderOptions::Quality::Medium:
            default:                            return "-preset fast -crf 23";
        }
    }

    juce::String hardwarePreset(RenderOptions::Quality quality)
    {
        switch (quality)
        {
            case RenderOptions::Quality::High:  return "-preset p5 -cq 19";
            case RenderOptions::Quality::Low:   return "-preset p3 -cq 28";
            case RenderOptions::Quality::Medium:
            default:                            return "-preset p4 -cq 23";
        }
    }

    juce::File fileFromConfig(const juce::var& config, const juce::Identifier& key)
    {
        const auto path = VarHelpers::getString(config, key).trim();
        if (path.isEmpty())
            return {};

        if (path.startsWith("~"))
            return juce::File::getSpecialLocation(juce::File::userHomeDirectory).getChildFile(path.substring(2));

        return juce::File::isAbsolutePath(path) ? juce::File(path)
                                                : juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }
}

//==============================================================================
RenderOptions RenderOptions::fromVar(const juce::var& config)
{
    RenderOptions options;

    options.fps = juce::jlimit(1.0, 120.0, VarHelpers::getDouble(config, "fps", options.fps));
    options.defaultWidth = VarHelpers::getInt(config, "default_width", options.defaultWidth);
    options.defaultHeight = VarHelpers::getInt(config, "default_height", options.defaultHeight);

    options.videoCodec = VarHelpers::getString(config, "video_codec", options.videoCodec);
    options.audioCodec = VarHelpers::getString(config, "audio_codec", options.audioCodec);
    options.audioBitrate = VarHelpers::getString(config, "audio_bitrate", options.audioBitrate);

    options.quality = qualityFromString(VarHelpers::getString(config, "quality", "medium"));
    options.useHardwareEncoding = VarHelpers::getBool(config, "use_hardware_encoding", options.useHardwareEncoding);
    options.hardwareParams = VarHelpers::getString(config, "hardware_params");
    options.softwareParams = VarHelpers::getString(config, "software_params");

    options.downloadTimeoutSeconds = juce::jmax(1, VarHelpers::getInt(config, "download_timeout_seconds", options.downloadTimeoutSeconds));
    options.defaultDuration = VarHelpers::getDouble(config, "default_duration", options.defaultDuration);
    options.sectionFallbackDuration = VarHelpers::getDouble(config, "section_fallback_duration", options.sectionFallbackDuration);

    if (auto* clips = VarHelpers::get(config, "background_clips").getDynamicObject())
    {
        for (const auto& entry : clips->getProperties())
        {
            const auto path = entry.value.toString().trim();
            if (path.isNotEmpty())
                options.backgroundClips[entry.name.toString()] = juce::File::isAbsolutePath(path)
                    ? juce::File(path)
                    : juce::File::getCurrentWorkingDirectory().getChildFile(path);
        }
    }

    options.transitionType = VarHelpers::getString(config, "transition_type", options.transitionType);
    options.transitionDuration = VarHelpers::getDouble(config, "transition_duration", options.transitionDuration);
    options.autoTransitions = VarHelpers::getBool(config, "auto_transitions", options.autoTransitions);

    options.keepTempFiles = VarHelpers::getBool(config, "keep_temp_files", options.keepTempFiles);
    options.tempDirectory = fileFromConfig(config, "temp_directory");
    options.logDirectory = fileFromConfig(config, "log_directory");
    options.ffmpegPath = VarHelpers::getString(config, "ffmpeg_path");
    options.ffprobePath = VarHelpers::getString(config, "ffprobe_path");

    return options;
}

juce::Result RenderOptions::loadFromFile(const juce::File& file, RenderOptions& options)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Config file not found: " + file.getFullPathName());

    juce::var parsed;
    const auto parseResult = juce::JSON::parse(file.loadFileAsString(), parsed);
    if (parseResult.failed())
        return juce::Result::fail("Invalid config " + file.getFileName() + ": " + parseResult.getErrorMessage());

    if (!parsed.isObject())
        return juce::Result::fail("Config " + file.getFileName() + " must contain a JSON object");

    options = fromVar(parsed);
    return juce::Result::ok();
}

void RenderOptions::applyEnvironment()
{
    const auto ffmpeg = juce::SystemStats::getEnvironmentVariable("STORYREEL_FFMPEG", {});
    if (ffmpeg.isNotEmpty())
        ffmpegPath = ffmpeg;

    const auto ffprobe = juce::SystemStats::getEnvironmentVariable("STORYREEL_FFPROBE", {});
    if (ffprobe.isNotEmpty())
        ffprobePath = ffprobe;

    const auto temp = juce::SystemStats::getEnvironmentVariable("STORYREEL_TEMP_DIR", {});
    if (temp.isNotEmpty() && juce::File::isAbsolutePath(temp))
        tempDirectory = juce::File(temp);
}

RenderOptions::Quality RenderOptions::qualityFromString(const juce::String& name)
{
    const auto lower = name.trim().toLowerCase();
    if (lower == "high")
        return Quality::High;
    if (lower == "low")
        return Quality::Low;
    return Quality::Medium;
}

//==============================================================================
juce::StringArray RenderOptions::sanitiseEncoderParams(const juce::String& params, const juce::String& codec)
{
    juce::StringArray tokens;
    tokens.addTokens(params, " ", "\"'");
    tokens.trim();
    tokens.removeEmptyStrings();

    juce::StringArray result { "-c:v", codec };

    for (int i = 0; i < tokens.size(); ++i)
    {
        const auto& token = tokens[i];

        if (token == "-an" || token.startsWith("-c:v=") || token.startsWith("-vcodec="))
            continue;

        auto isOptionWithValue = [&token](const juce::String& option)
        {
            return token == option || token.startsWith(option + "=");
        };

        if (isOptionWithValue("-c:v") || isOptionWithValue("-vcodec")
            || isOptionWithValue("-pix_fmt") || isOptionWithValue("-movflags")
            || isOptionWithValue("-r") || isOptionWithValue("-framerate"))
        {
            if (!token.containsChar('=') && i + 1 < tokens.size())
                ++i; // the value token
            continue;
        }

        result.add(token);
    }

    return result;
}

juce::StringArray RenderOptions::getSoftwareEncoderArgs() const
{
    return sanitiseEncoderParams(softwareParams.trim().isNotEmpty() ? softwareParams : softwarePreset(quality),
                                 videoCodec.isNotEmpty() ? videoCodec : juce::String("libx264"));
}

juce::StringArray RenderOptions::getHardwareEncoderArgs() const
{
    return sanitiseEncoderParams(hardwareParams.trim().isNotEmpty() ? hardwareParams : hardwarePreset(quality),
                                 "h264_nvenc");
}

//==============================================================================
juce::File RenderOptions::getBackgroundClip(const juce::String& aspectRatio) const
{
    const auto entry = backgroundClips.find(aspectRatio.trim());
    return entry != backgroundClips.end() ? entry->second : juce::File();
}

juce::File RenderOptions::getTempRoot() const
{
    if (tempDirectory != juce::File())
        return tempDirectory;
    return juce::File::getSpecialLocation(juce::File::tempDirectory);
}

juce::File RenderOptions::getLogRoot() const
{
    if (logDirectory != juce::File())
        return logDirectory;
    return juce::File::getSpecialLocation(juce::File::userDocumentsDirectory).getChildFile("Storyreel Logs");
}

juce::var RenderOptions::getDefaultTransition() const
{
    auto params = VarHelpers::makeObject();
    VarHelpers::set(params, "transition_type", transitionType);
    VarHelpers::set(params, "duration", transitionDuration);
    return params;
}
