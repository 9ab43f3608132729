#pragma once

#include <firmware/encoder.hpp>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog {
class logger;
}

namespace Firmware {
struct Container;
}

namespace Layout {

/// A file referenced by a layout does not exist or can't be read
struct MissingSource : std::runtime_error {
    explicit MissingSource(std::filesystem::path path, std::string_view reason = "not found");

    std::filesystem::path path;
};

/**
 * One line of a layout descriptor:
 * name, index, base address, allocated size, load address, entry address, file name
 * separated by tabs, with all numbers in hexadecimal.
 */
struct DescriptorLine {
    std::string name;
    uint32_t index = 0;
    uint32_t base_address = 0;
    uint32_t allocated_size = 0;
    uint32_t load_address = 0;
    uint32_t entry_address = 0;
    std::string filename;
};

/// Segment to encode, along with the file its payload was read from
struct Entry {
    Firmware::SegmentSpec segment;
    std::filesystem::path source;
};

/**
 * Parses descriptor text. Blank lines and lines starting with '#' are
 * ignored, lines with too few columns are skipped with a warning.
 *
 * @throw OpenFw::Exceptions::InvalidUserInput on malformed numbers
 */
std::vector<DescriptorLine> ParseDescriptor(std::string_view text, spdlog::logger& logger);

std::string FormatDescriptorLine(const DescriptorLine& line);

/// Segments named like this are stored as executable segments
bool IsExecutableName(std::string_view name);

/**
 * Reads a descriptor file and the payload files it references. Relative
 * file names are resolved against the directory of the descriptor.
 *
 * @throw MissingSource if the descriptor or a payload file can't be read
 */
std::vector<Entry> LoadDescriptor(const std::filesystem::path& descriptor, spdlog::logger& logger);

/**
 * Builds a layout from the files matching the given prefix: all files in the
 * directory if prefix is a directory, otherwise all files next to it whose
 * names start with its file name. Descriptors (".txt") and images (".bin")
 * are skipped.
 *
 * @throw MissingSource if no files match
 */
std::vector<Entry> LoadFromPrefix(const std::filesystem::path& prefix, spdlog::logger& logger);

/// Dispatches to LoadDescriptor for ".txt" files and to LoadFromPrefix otherwise
std::vector<Entry> Resolve(const std::filesystem::path& descriptor_or_prefix, spdlog::logger& logger);

std::vector<Firmware::SegmentSpec> ToSegments(std::vector<Entry> entries);

struct SplitResult {
    std::filesystem::path descriptor;
    std::vector<std::filesystem::path> payloads;
};

/**
 * Writes the payload of each segment to "<prefix>.<name>" and a descriptor
 * listing them to "<prefix>.txt", such that LoadDescriptor on the latter
 * reproduces the segment list.
 *
 * Throws OpenFw::Exceptions::Invalid before writing anything if a segment
 * name starts with '#' or contains a tab or line break.
 */
SplitResult Split(const Firmware::Container& container, const std::filesystem::path& prefix, spdlog::logger& logger);

} // namespace Layout
