#include "framework/config_framework.hpp"
#include "framework/settings.hpp"

#include <catch2/catch.hpp>

#include <string>

struct CountTag : Config::Option {
    static constexpr const char* name = "Count";
    using type = int;
    static type default_value() { return -1; }
};

struct EnabledTag : Config::BooleanOption<EnabledTag> {
    static constexpr const char* name = "Enabled";
};

template<>
bool Config::BooleanOption<EnabledTag>::default_val = true;

TEST_CASE("Options start out with tag defaults") {
    Config::Options<CountTag, EnabledTag> options;
    REQUIRE(options.get<CountTag>() == -1);
    REQUIRE(options.get<EnabledTag>() == true);

    options.set<CountTag>(5);
    options.set<EnabledTag>(false);
    REQUIRE(options.get<CountTag>() == 5);
    REQUIRE(options.get<EnabledTag>() == false);
}

TEST_CASE("Command settings defaults") {
    Settings::BuildSettings build;
    REQUIRE(build.get<Settings::LayoutSource>().empty());
    REQUIRE(build.get<Settings::OutputImage>() == "firmware.bin");
    REQUIRE(build.get<Settings::FirmwareVersion>() == "UNKNOWN");
    REQUIRE(build.get<Settings::StrictFieldWidths>() == false);
    REQUIRE(build.get<Settings::DebugLogging>() == false);

    Settings::SplitSettings split;
    REQUIRE(split.get<Settings::OutputPrefix>().empty());
    REQUIRE(split.get<Settings::PublicKeyFile>().empty());

    Settings::InspectSettings inspect;
    inspect.set<Settings::InputImage>("image.bin");
    REQUIRE(inspect.get<Settings::InputImage>() == "image.bin");
    REQUIRE(inspect.get<Settings::DebugLogging>() == false);
}
