#include "switchyard/variants/exporters.h"
#include "switchyard/utils/logging.hpp"

namespace switchyard {
namespace variants {

std::string LosslessVideoExporter::prepare(const std::string&) {
    return "Preparing video data for lossless export.";
}

std::string LosslessVideoExporter::exportTo(const std::string& folder) {
    return "Exporting video data in lossless format to " + folder + ".";
}

std::string H264BaselineVideoExporter::prepare(const std::string&) {
    return "Preparing video data for H.264 (Baseline) export.";
}

std::string H264BaselineVideoExporter::exportTo(const std::string& folder) {
    return "Exporting video data in H.264 (Baseline) format to " + folder + ".";
}

std::string H264Hi422VideoExporter::prepare(const std::string&) {
    return "Preparing video data for H.264 (Hi422P) export.";
}

std::string H264Hi422VideoExporter::exportTo(const std::string& folder) {
    return "Exporting video data in H.264 (Hi422P) format to " + folder + ".";
}

std::string AacAudioExporter::prepare(const std::string&) {
    return "Preparing audio data for AAC export.";
}

std::string AacAudioExporter::exportTo(const std::string& folder) {
    return "Exporting audio data in AAC format to " + folder + ".";
}

std::string WavAudioExporter::prepare(const std::string&) {
    return "Preparing audio data for WAV export.";
}

std::string WavAudioExporter::exportTo(const std::string& folder) {
    return "Exporting audio data in WAV format to " + folder + ".";
}

std::unique_ptr<VideoExporter> FastExporter::createVideoExporter() const {
    return std::make_unique<H264BaselineVideoExporter>();
}

std::unique_ptr<AudioExporter> FastExporter::createAudioExporter() const {
    return std::make_unique<AacAudioExporter>();
}

std::unique_ptr<VideoExporter> HighQualityExporter::createVideoExporter() const {
    return std::make_unique<H264Hi422VideoExporter>();
}

std::unique_ptr<AudioExporter> HighQualityExporter::createAudioExporter() const {
    return std::make_unique<AacAudioExporter>();
}

std::unique_ptr<VideoExporter> MasterQualityExporter::createVideoExporter() const {
    return std::make_unique<LosslessVideoExporter>();
}

std::unique_ptr<AudioExporter> MasterQualityExporter::createAudioExporter() const {
    return std::make_unique<WavAudioExporter>();
}

void registerExporterFamilies(core::Registry<ExporterFamily>& registry) {
    registry.registerType<FastExporter>("low", "High speed, lower quality");
    registry.registerType<HighQualityExporter>("high", "Slower speed, high quality");
    registry.registerType<MasterQualityExporter>("master", "Lossless video and audio");
}

std::vector<std::string> runExport(const ExporterFamily& family,
                                   const std::string& videoData,
                                   const std::string& audioData,
                                   const std::string& folder) {
    auto video = family.createVideoExporter();
    auto audio = family.createAudioExporter();

    std::vector<std::string> steps;
    steps.push_back(video->prepare(videoData));
    steps.push_back(audio->prepare(audioData));
    steps.push_back(video->exportTo(folder));
    steps.push_back(audio->exportTo(folder));

    for (const auto& step : steps) {
        SWLOG_INFO("[" << family.name() << "] " << step);
    }
    return steps;
}

} // namespace variants
} // namespace switchyard
