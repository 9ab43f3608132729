#pragma once

#include <framework/settings.hpp>

#include <iosfwd>

class LogManager;

namespace Commands {

// Each command returns the process exit code. Errors are reported by throwing

int Split(const Settings::SplitSettings& settings, LogManager& log_manager);
int Build(const Settings::BuildSettings& settings, LogManager& log_manager);
int List(const Settings::InspectSettings& settings, LogManager& log_manager);

/// Returns 0 iff the image and all of its checksums and signatures are valid
int Verify(const Settings::InspectSettings& settings, LogManager& log_manager);

/// Prompts for the settings of a split or build operation and runs it
int Wizard(std::istream& input, std::ostream& output, LogManager& log_manager);

} // namespace Commands
