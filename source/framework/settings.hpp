#pragma once

#include "framework/config_framework.hpp"

#include <string>

namespace Settings {

// Container image to read
struct InputImage : Config::Option {
    static constexpr const char* name = "InputImage";
    using type = std::string;
    static type default_value() { return {}; }
};

// PEM file with the RSA public key used to check signature blocks.
// If empty, the OPENFW_PUBLIC_KEY environment variable is consulted
struct PublicKeyFile : Config::Option {
    static constexpr const char* name = "PublicKeyFile";
    using type = std::string;
    static type default_value() { return {}; }
};

// Path prefix for extracted segments. If empty, it's derived from the image
struct OutputPrefix : Config::Option {
    static constexpr const char* name = "OutputPrefix";
    using type = std::string;
    static type default_value() { return {}; }
};

// Layout descriptor (".txt") or path prefix of the segment files to pack
struct LayoutSource : Config::Option {
    static constexpr const char* name = "LayoutSource";
    using type = std::string;
    static type default_value() { return {}; }
};

struct OutputImage : Config::Option {
    static constexpr const char* name = "OutputImage";
    using type = std::string;
    static type default_value() { return default_val; }

    static std::string default_val;
};

struct FirmwareVersion : Config::Option {
    static constexpr const char* name = "FirmwareVersion";
    using type = std::string;
    static type default_value() { return default_val; }

    static std::string default_val;
};

// Reject over-long names and versions instead of truncating them
struct StrictFieldWidths : Config::BooleanOption<StrictFieldWidths> {
    static constexpr const char* name = "StrictFieldWidths";
};

// Print per-segment details
struct DebugLogging : Config::BooleanOption<DebugLogging> {
    static constexpr const char* name = "DebugLogging";
};

struct SplitSettings : Config::Options<InputImage,
                                       OutputPrefix,
                                       PublicKeyFile,
                                       DebugLogging> { };

struct BuildSettings : Config::Options<LayoutSource,
                                       OutputImage,
                                       FirmwareVersion,
                                       StrictFieldWidths,
                                       DebugLogging> { };

// Used by the list and verify commands
struct InspectSettings : Config::Options<InputImage,
                                         PublicKeyFile,
                                         DebugLogging> { };

} // namespace Settings
