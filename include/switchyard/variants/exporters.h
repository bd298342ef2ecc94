#pragma once

#include "switchyard/core/registry.h"
#include <memory>
#include <string>
#include <vector>

namespace switchyard {
namespace variants {

/**
 * @brief Video codec used by an export job.
 *
 * prepare() and exportTo() return a description of the work done.
 */
class VideoExporter {
public:
    virtual ~VideoExporter() = default;
    virtual std::string name() const = 0;
    virtual std::string prepare(const std::string& videoData) = 0;
    virtual std::string exportTo(const std::string& folder) = 0;
};

/**
 * @brief Audio codec used by an export job.
 */
class AudioExporter {
public:
    virtual ~AudioExporter() = default;
    virtual std::string name() const = 0;
    virtual std::string prepare(const std::string& audioData) = 0;
    virtual std::string exportTo(const std::string& folder) = 0;
};

class LosslessVideoExporter : public VideoExporter {
public:
    std::string name() const override { return "lossless"; }
    std::string prepare(const std::string& videoData) override;
    std::string exportTo(const std::string& folder) override;
};

/// H.264, Baseline profile.
class H264BaselineVideoExporter : public VideoExporter {
public:
    std::string name() const override { return "h264-baseline"; }
    std::string prepare(const std::string& videoData) override;
    std::string exportTo(const std::string& folder) override;
};

/// H.264, Hi422P profile (10-bit, 4:2:2 chroma sampling).
class H264Hi422VideoExporter : public VideoExporter {
public:
    std::string name() const override { return "h264-hi422p"; }
    std::string prepare(const std::string& videoData) override;
    std::string exportTo(const std::string& folder) override;
};

class AacAudioExporter : public AudioExporter {
public:
    std::string name() const override { return "aac"; }
    std::string prepare(const std::string& audioData) override;
    std::string exportTo(const std::string& folder) override;
};

class WavAudioExporter : public AudioExporter {
public:
    std::string name() const override { return "wav"; }
    std::string prepare(const std::string& audioData) override;
    std::string exportTo(const std::string& folder) override;
};

/**
 * @brief Matching pair of video and audio codecs.
 *
 * A family does not keep the exporters it creates.
 */
class ExporterFamily {
public:
    virtual ~ExporterFamily() = default;
    virtual std::string name() const = 0;
    virtual std::unique_ptr<VideoExporter> createVideoExporter() const = 0;
    virtual std::unique_ptr<AudioExporter> createAudioExporter() const = 0;
};

/// Fast, lower quality: H.264 Baseline + AAC.
class FastExporter : public ExporterFamily {
public:
    std::string name() const override { return "low"; }
    std::unique_ptr<VideoExporter> createVideoExporter() const override;
    std::unique_ptr<AudioExporter> createAudioExporter() const override;
};

/// Slower, high quality: H.264 Hi422P + AAC.
class HighQualityExporter : public ExporterFamily {
public:
    std::string name() const override { return "high"; }
    std::unique_ptr<VideoExporter> createVideoExporter() const override;
    std::unique_ptr<AudioExporter> createAudioExporter() const override;
};

/// Master quality: lossless video + WAV.
class MasterQualityExporter : public ExporterFamily {
public:
    std::string name() const override { return "master"; }
    std::unique_ptr<VideoExporter> createVideoExporter() const override;
    std::unique_ptr<AudioExporter> createAudioExporter() const override;
};

/// Registers "low", "high" and "master".
void registerExporterFamilies(core::Registry<ExporterFamily>& registry);

/**
 * @brief Prepare and export one video and one audio stream with family's codecs.
 * @return The steps performed, in order
 */
std::vector<std::string> runExport(const ExporterFamily& family,
                                   const std::string& videoData,
                                   const std::string& audioData,
                                   const std::string& folder);

} // namespace variants
} // namespace switchyard
