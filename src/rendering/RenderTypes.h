#pragma once
#include <JuceHeader.h>
#include <vector>
#include "../timing/TimingTypes.h"

/**
 * Types shared by the render engine, the job runner and the CLI.
 */
namespace RenderTypes
{
    /** Represents the current step of a render */
    enum class RenderState
    {
        Idle,
        Starting,
        ResolvingTemplate,
        PreparingAudio,
        DistributingMedia,
        ComposingTimeline,
        EncodingSegments,
        Finalizing,
        Completed,
        Failed
    };

    inline juce::String renderStateToString(RenderState state)
    {
        switch (state)
        {
            case RenderState::Idle:              return "idle";
            case RenderState::Starting:          return "starting";
            case RenderState::ResolvingTemplate: return "resolving_template";
            case RenderState::PreparingAudio:    return "preparing_audio";
            case RenderState::DistributingMedia: return "distributing_media";
            case RenderState::ComposingTimeline: return "composing_timeline";
            case RenderState::EncodingSegments:  return "encoding_segments";
            case RenderState::Finalizing:        return "finalizing";
            case RenderState::Completed:         return "completed";
            case RenderState::Failed:            return "failed";
        }

        return "unknown";
    }

    /** The two kinds of failure that abort a render */
    enum class FailureKind
    {
        None,
        InputError,     // missing or invalid template fields, missing required assets
        EncodeError     // the encoder exited with an error
    };

    /**
     * A span of the timeline encoded as one unit.
     *
     * Static segments show the same image throughout and are encoded from a
     * single frame; animated ones are rendered frame by frame.
     */
    struct Segment
    {
        double startTime = 0.0;
        double duration = 0.0;
        bool isStatic = false;

        double endTime() const { return startTime + duration; }
    };

    /** Everything a render consumes, apart from the engine options */
    struct RenderRequest
    {
        juce::var templateDocument;
        juce::var variables;
        juce::var overrides;                // deep-merged into the template before variables are resolved

        std::vector<Section> sections;
        std::vector<MediaAsset> assets;     // empty: collected from array layer sources
        DistributionMode mode = DistributionMode::Auto;
        juce::var mapping;                  // section key -> asset list, for manual mode

        juce::String narrationUrl;          // empty: per-section audio_url files are joined
        juce::File backgroundClip;          // overrides the configured clip for the aspect ratio
        juce::File outputFile;
    };

    /** What the caller gets back from a render */
    struct RenderResult
    {
        bool success = false;
        FailureKind failure = FailureKind::None;
        juce::String message;
        juce::File outputFile;
        double duration = 0.0;
        juce::int64 fileSize = 0;

        static RenderResult succeeded(const juce::File& file, double duration, juce::int64 size)
        {
            RenderResult result;
            result.success = true;
            result.message = "Render completed";
            result.outputFile = file;
            result.duration = duration;
            result.fileSize = size;
            return result;
        }

        static RenderResult failed(FailureKind kind, const juce::String& message)
        {
            RenderResult result;
            result.failure = kind;
            result.message = message;
            return result;
        }

        juce::var toVar() const
        {
            auto* object = new juce::DynamicObject();
            object->setProperty("status", success ? "success" : "error");
            object->setProperty("message", message);

            if (success)
            {
                object->setProperty("path", outputFile.getFullPathName());
                object->setProperty("duration", duration);
                object->setProperty("file_size", fileSize);
            }
            else
            {
                object->setProperty("path", juce::var());
                object->setProperty("error_type", failure == FailureKind::InputError ? "input_error" : "encode_error");
            }

            return juce::var(object);
        }
    };
}
