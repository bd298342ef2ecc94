#include "switchyard/core/registry.h"
#include "switchyard/utils/logging.hpp"
#include "switchyard/variants/exporters.h"
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace switchyard::core;
using namespace switchyard::variants;

namespace {

constexpr const char* kDefaultQuality = "low";

std::string describeChoices(const Registry<ExporterFamily>& families) {
    std::string out;
    for (const auto& key : families.listKeys()) {
        if (!out.empty()) out += ", ";
        out += key;
    }
    return out;
}

// Unknown qualities fall back to the default family.
std::unique_ptr<ExporterFamily> chooseFamily(const Registry<ExporterFamily>& families,
                                             const std::string& quality) {
    try {
        return families.create(quality);
    } catch (const UnknownKeyError& e) {
        SWLOG_WARN(e.what() << ", using '" << kDefaultQuality << "' (choices: "
                   << describeChoices(families) << ")");
        return families.create(kDefaultQuality);
    }
}

} // namespace

int main(int argc, char** argv) {
    switchyard::utils::setLogLevel(switchyard::utils::LogLevel::Warn);

    const std::string quality = argc > 1 ? argv[1] : kDefaultQuality;
    const std::string folder = argc > 2 ? argv[2] : "/usr/tmp/video";

    try {
        Registry<ExporterFamily> families;
        registerExporterFamilies(families);

        auto family = chooseFamily(families, quality);
        for (const auto& step : runExport(*family, "placeholder_for_video_data",
                                          "placeholder_for_audio_data", folder)) {
            std::cout << step << "\n";
        }
    } catch (const std::exception& e) {
        SWLOG_CRITICAL(e.what());
        return 1;
    }

    return 0;
}
