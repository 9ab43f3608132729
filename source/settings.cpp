#include "framework/settings.hpp"

namespace Settings {

std::string OutputImage::default_val = "firmware.bin";
std::string FirmwareVersion::default_val = "UNKNOWN";

}

namespace Config {

template<>
bool BooleanOption<Settings::StrictFieldWidths>::default_val = false;

template<>
bool BooleanOption<Settings::DebugLogging>::default_val = false;

} // namespace Config
