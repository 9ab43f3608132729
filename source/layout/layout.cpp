#include "layout.hpp"

#include <firmware/container.hpp>
#include <framework/exceptions.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/spirit/home/x3.hpp>

#include <range/v3/algorithm/sort.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <set>

namespace Layout {

MissingSource::MissingSource(std::filesystem::path path_, std::string_view reason)
    : std::runtime_error(fmt::format("Missing source file {}: {}", path_.string(), reason)), path(std::move(path_)) {
}

static uint32_t ParseHex(const std::string& column, std::string_view line) {
    namespace x3 = boost::spirit::x3;

    uint32_t value = 0;
    auto pattern = -(x3::lit("0x") | x3::lit("0X")) >> x3::uint_parser<uint32_t, 16>();
    auto begin = column.begin();
    if (!x3::parse(begin, column.end(), pattern, value) || begin != column.end()) {
        throw OpenFw::Exceptions::InvalidUserInput("Invalid hexadecimal number \"{}\" in descriptor line \"{}\"", column, line);
    }
    return value;
}

std::vector<DescriptorLine> ParseDescriptor(std::string_view text, spdlog::logger& logger) {
    std::vector<DescriptorLine> ret;

    std::vector<std::string> lines;
    boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\n"));
    for (auto& line : lines) {
        // Leading whitespace belongs to the name column
        boost::algorithm::trim_right(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::vector<std::string> columns;
        boost::algorithm::split(columns, line, boost::algorithm::is_any_of("\t"), boost::algorithm::token_compress_on);
        if (columns.size() < 7) {
            logger.warn("Ignoring descriptor line with {} instead of 7 columns: {}", columns.size(), line);
            continue;
        }

        DescriptorLine entry;
        entry.name = columns[0];
        entry.index = ParseHex(columns[1], line);
        entry.base_address = ParseHex(columns[2], line);
        entry.allocated_size = ParseHex(columns[3], line);
        entry.load_address = ParseHex(columns[4], line);
        entry.entry_address = ParseHex(columns[5], line);
        entry.filename = columns[6];
        ret.push_back(std::move(entry));
    }

    return ret;
}

std::string FormatDescriptorLine(const DescriptorLine& line) {
    return fmt::format("{}\t\t0x{:02x}\t0x{:08x}\t0x{:08x}\t0x{:08x}\t0x{:08x}\t{}",
                       line.name, line.index, line.base_address, line.allocated_size,
                       line.load_address, line.entry_address, line.filename);
}

bool IsExecutableName(std::string_view name) {
    return name == "script";
}

static std::vector<uint8_t> ReadPayload(const std::filesystem::path& filename) {
    std::error_code error;
    if (!std::filesystem::is_regular_file(filename, error)) {
        throw MissingSource(filename);
    }

    std::ifstream file(filename, std::ios_base::binary);
    if (!file) {
        throw MissingSource(filename, "could not open file");
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::vector<Entry> LoadDescriptor(const std::filesystem::path& descriptor, spdlog::logger& logger) {
    std::ifstream file(descriptor);
    if (!file) {
        throw MissingSource(descriptor, "could not open descriptor");
    }
    std::string text { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };

    const auto base_dir = std::filesystem::absolute(descriptor).parent_path();

    std::vector<Entry> ret;
    for (auto& line : ParseDescriptor(text, logger)) {
        Entry entry;
        entry.source = base_dir / line.filename; // no-op for absolute file names
        entry.segment.kind = IsExecutableName(line.name) ? Firmware::SegmentKind::Executable : Firmware::SegmentKind::Data;
        entry.segment.name = line.name;
        entry.segment.index = line.index;
        entry.segment.base_address = line.base_address;
        entry.segment.allocated_size = line.allocated_size;
        entry.segment.load_address = line.load_address;
        entry.segment.entry_address = line.entry_address;
        entry.segment.payload = ReadPayload(entry.source);
        logger.debug("Loaded segment \"{}\" from {} ({:#x} bytes)", entry.segment.name, entry.source.string(), entry.segment.payload.size());
        ret.push_back(std::move(entry));
    }

    return ret;
}

static uint32_t RoundUpToPage(size_t size) {
    const size_t page_size = 0x1000;
    return static_cast<uint32_t>((size + page_size - 1) & ~(page_size - 1));
}

std::vector<Entry> LoadFromPrefix(const std::filesystem::path& prefix, spdlog::logger& logger) {
    std::error_code error;
    const bool is_directory = std::filesystem::is_directory(prefix, error);
    const auto dir = is_directory ? prefix : std::filesystem::absolute(prefix).parent_path();
    const auto base = is_directory ? std::string {} : prefix.filename().string();

    if (!std::filesystem::is_directory(dir, error)) {
        throw MissingSource(dir, "directory not found");
    }

    std::vector<std::filesystem::path> files;
    for (auto& dir_entry : std::filesystem::directory_iterator(dir)) {
        if (!dir_entry.is_regular_file()) {
            continue;
        }

        const auto filename = dir_entry.path().filename().string();
        if (!boost::algorithm::starts_with(filename, base) ||
            boost::algorithm::ends_with(filename, ".txt") ||
            boost::algorithm::ends_with(filename, ".bin")) {
            continue;
        }
        files.push_back(dir_entry.path());
    }
    if (files.empty()) {
        throw MissingSource(prefix, "no segment files match this prefix");
    }
    ranges::sort(files);

    std::vector<Entry> ret;
    for (auto& file : files) {
        // Segment names are given by the file extension, e.g. "fw.kernel" for "kernel"
        auto filename = file.filename().string();
        auto dot = filename.find('.');
        auto name = (dot == std::string::npos) ? filename : filename.substr(dot + 1);

        Entry entry;
        entry.source = file;
        entry.segment.kind = Firmware::SegmentKind::Data;
        entry.segment.name = name;
        entry.segment.index = static_cast<uint32_t>(ret.size());
        entry.segment.payload = ReadPayload(file);
        entry.segment.allocated_size = RoundUpToPage(entry.segment.payload.size());
        logger.debug("Using {} as segment \"{}\" ({:#x} bytes)", file.string(), name, entry.segment.payload.size());
        ret.push_back(std::move(entry));
    }

    return ret;
}

std::vector<Entry> Resolve(const std::filesystem::path& descriptor_or_prefix, spdlog::logger& logger) {
    if (boost::algorithm::iequals(descriptor_or_prefix.extension().string(), ".txt")) {
        return LoadDescriptor(descriptor_or_prefix, logger);
    }
    return LoadFromPrefix(descriptor_or_prefix, logger);
}

std::vector<Firmware::SegmentSpec> ToSegments(std::vector<Entry> entries) {
    std::vector<Firmware::SegmentSpec> ret;
    ret.reserve(entries.size());
    for (auto& entry : entries) {
        ret.push_back(std::move(entry.segment));
    }
    return ret;
}

static std::string SanitizeFileComponent(std::string name) {
    for (auto& c : name) {
        if (c == '/' || c == '\\' || boost::algorithm::is_space()(c)) {
            c = '_';
        }
    }
    return name;
}

// Names a descriptor line cannot carry back to ParseDescriptor
static bool IsRepresentableName(std::string_view name) {
    if (!name.empty() && name[0] == '#') {
        return false;
    }
    return name.find_first_of("\t\r\n") == std::string_view::npos;
}

SplitResult Split(const Firmware::Container& container, const std::filesystem::path& prefix, spdlog::logger& logger) {
    for (auto& segment : container.segments) {
        if (!IsRepresentableName(segment.name)) {
            throw OpenFw::Exceptions::Invalid("Segment name \"{}\" cannot be stored in a layout descriptor", segment.name);
        }
    }

    const auto dir = prefix.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }
    const auto prefix_name = prefix.filename().string();

    SplitResult ret;
    std::set<std::string> used_filenames;
    std::vector<std::string> descriptor;
    for (auto& segment : container.segments) {
        auto filename = prefix_name + "." + SanitizeFileComponent(segment.name);
        if (!used_filenames.insert(filename).second) {
            logger.warn("Multiple segments named \"{}\", later ones overwrite {}", segment.name, filename);
        }

        auto path = dir / filename;
        std::ofstream file(path, std::ios_base::binary | std::ios_base::trunc);
        file.exceptions(std::ofstream::badbit | std::ofstream::failbit);
        file.write(reinterpret_cast<const char*>(segment.payload.data()), segment.payload.size());
        file.close();
        logger.debug("Wrote segment \"{}\" to {}", segment.name, path.string());

        descriptor.push_back(FormatDescriptorLine({ segment.name, segment.index, segment.base_address, segment.allocated_size,
                                                    segment.load_address, segment.entry_address, filename }));
        ret.payloads.push_back(std::move(path));
    }

    ret.descriptor = dir / (prefix_name + ".txt");
    std::ofstream file(ret.descriptor, std::ios_base::trunc);
    file.exceptions(std::ofstream::badbit | std::ofstream::failbit);
    for (auto& line : descriptor) {
        file << line << '\n';
    }
    file.close();

    return ret;
}

} // namespace Layout
