#include "commands.hpp"

#include <firmware/container.hpp>
#include <firmware/decoder.hpp>
#include <firmware/encoder.hpp>
#include <firmware/events.hpp>
#include <firmware/signature.hpp>
#include <framework/exceptions.hpp>
#include <framework/logging.hpp>
#include <layout/layout.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace Commands {

namespace {

/// Forwards codec progress to the log
class LoggingEvents : public Firmware::CodecEvents {
    spdlog::logger& logger;

public:
    LoggingEvents(spdlog::logger& logger) : logger(logger) {
    }

    void OnHeaderFound(size_t offset, std::string_view version) override {
        logger.debug("Found container header at offset {:#x}, version \"{}\"", offset, version);
    }

    void OnSegmentDecoded(size_t position, const Firmware::Segment& segment) override {
        logger.debug("Segment {} \"{}\" ({}) at {:#x}: {:#x} bytes, CRC {:#010x} ({})",
                     position, segment.name, Firmware::GetKindName(segment.kind), segment.offset,
                     segment.payload.size(), segment.crc_claim, segment.crc_valid ? "valid" : "invalid");
    }

    void OnSignatureDecoded(const Firmware::Signature& signature) override {
        logger.debug("Signature trailer at {:#x}: CRC {:#010x} ({}), signature block {}",
                     signature.offset, signature.crc_claim, signature.crc_valid ? "valid" : "invalid",
                     Firmware::GetStatusName(signature.block_status));
    }

    void OnSegmentEncoded(size_t position, std::string_view name, size_t offset, uint32_t crc) override {
        logger.debug("Wrote segment {} \"{}\" at {:#x} with CRC {:#010x}", position, name, offset, crc);
    }
};

std::vector<uint8_t> ReadFile(const std::filesystem::path& filename) {
    std::ifstream file(filename, std::ios_base::binary);
    if (!file) {
        throw OpenFw::Exceptions::InvalidUserInput("Could not open {}", filename.string());
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void WriteFile(const std::filesystem::path& filename, const std::vector<uint8_t>& data) {
    std::ofstream file(filename, std::ios_base::binary | std::ios_base::trunc);
    if (!file) {
        throw OpenFw::Exceptions::InvalidUserInput("Could not open {} for writing", filename.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!file) {
        throw std::runtime_error(fmt::format("Failed to write {}", filename.string()));
    }
}

std::unique_ptr<Firmware::RsaSha1Verifier> LoadVerifier(const std::string& key_file, spdlog::logger& logger) {
    std::string filename = key_file;
    if (filename.empty()) {
        if (auto env = std::getenv("OPENFW_PUBLIC_KEY")) {
            filename = env;
        }
    }
    if (filename.empty()) {
        return nullptr;
    }

    logger.debug("Using public key from {}", filename);
    return Firmware::LoadPublicKeyPem(filename);
}

/// Logs a warning for each invalid checksum or signature. Returns true if none were found
bool ReportValidity(const Firmware::Container& container, spdlog::logger& logger) {
    if (!container.header_crc_valid) {
        logger.warn("Header checksum mismatch");
    }
    for (auto& segment : container.segments) {
        if (!segment.crc_valid) {
            logger.warn("Checksum mismatch in segment \"{}\": stored {:#010x}, computed {:#010x}",
                        segment.name, segment.crc_claim, segment.crc_computed);
        }
    }

    auto& signature = container.signature;
    if (!signature.crc_valid) {
        logger.warn("Signature checksum {:#010x} doesn't match the image", signature.crc_claim);
    }
    if (signature.block_status == Firmware::SignatureBlockStatus::Invalid) {
        logger.warn("RSA signature does not match the given public key");
    } else if (signature.block_status == Firmware::SignatureBlockStatus::Unverified) {
        logger.info("Image carries an RSA signature; pass --key to verify it");
    }
    if (container.trailing_bytes) {
        logger.warn("Ignoring {:#x} bytes after the signature", container.trailing_bytes);
    }

    return container.IsValid();
}

std::string SanitizePrefix(std::string prefix) {
    for (auto& c : prefix) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
    }
    return prefix;
}

void ApplyLogLevel(bool debug, LogManager& log_manager) {
    log_manager.SetLevel(debug ? spdlog::level::debug : spdlog::level::info);
}

} // anonymous namespace

int Split(const Settings::SplitSettings& settings, LogManager& log_manager) {
    ApplyLogLevel(settings.get<Settings::DebugLogging>(), log_manager);
    auto& logger = *log_manager.GetLogger("CLI");

    const std::filesystem::path image = settings.get<Settings::InputImage>();
    auto buffer = ReadFile(image);
    auto verifier = LoadVerifier(settings.get<Settings::PublicKeyFile>(), logger);

    LoggingEvents events { logger };
    auto container = Firmware::Decode(buffer, { verifier.get(), &events });
    ReportValidity(container, logger);

    std::filesystem::path prefix = settings.get<Settings::OutputPrefix>();
    if (prefix.empty()) {
        prefix = container.version.empty() ? image.filename().string() : SanitizePrefix(container.version);
    }

    auto result = Layout::Split(container, prefix, *log_manager.GetLogger("LAYOUT"));
    logger.info("Extracted {} segments, layout written to {}", result.payloads.size(), result.descriptor.string());
    return 0;
}

int Build(const Settings::BuildSettings& settings, LogManager& log_manager) {
    ApplyLogLevel(settings.get<Settings::DebugLogging>(), log_manager);
    auto& logger = *log_manager.GetLogger("CLI");

    auto entries = Layout::Resolve(settings.get<Settings::LayoutSource>(), *log_manager.GetLogger("LAYOUT"));
    auto segments = Layout::ToSegments(std::move(entries));

    LoggingEvents events { logger };
    Firmware::EncodeOptions options;
    options.overflow = settings.get<Settings::StrictFieldWidths>() ? Firmware::FieldOverflow::Reject : Firmware::FieldOverflow::Truncate;
    options.events = &events;

    const auto& version = settings.get<Settings::FirmwareVersion>();
    if (version.size() > Firmware::max_version_length && options.overflow == Firmware::FieldOverflow::Truncate) {
        logger.warn("Version is longer than {} bytes and will be truncated", Firmware::max_version_length);
    }
    for (auto& segment : segments) {
        if (segment.name.size() > Firmware::max_name_length && options.overflow == Firmware::FieldOverflow::Truncate) {
            logger.warn("Segment name \"{}\" is longer than {} bytes and will be truncated", segment.name, Firmware::max_name_length);
        }
    }

    auto image = Firmware::Encode(version, segments, options);

    const std::filesystem::path output = settings.get<Settings::OutputImage>();
    WriteFile(output, image);
    logger.info("Firmware with {} segments written to {} ({:#x} bytes)", segments.size(), output.string(), image.size());
    return 0;
}

int List(const Settings::InspectSettings& settings, LogManager& log_manager) {
    ApplyLogLevel(settings.get<Settings::DebugLogging>(), log_manager);
    auto& logger = *log_manager.GetLogger("CLI");

    auto buffer = ReadFile(settings.get<Settings::InputImage>());
    auto verifier = LoadVerifier(settings.get<Settings::PublicKeyFile>(), logger);

    LoggingEvents events { logger };
    auto container = Firmware::Decode(buffer, { verifier.get(), &events });

    fmt::print("Version:       {}\n", container.version);
    fmt::print("Header offset: {:#x}\n", container.header_offset);
    fmt::print("Header CRC:    {:#010x} ({})\n", container.header_crc_claim, container.header_crc_valid ? "valid" : "invalid");
    fmt::print("\n{:<3} {:<16} {:<10} {:>5} {:>10} {:>10} {:>10} {:>10} {:>10} {}\n",
               "#", "Name", "Kind", "Index", "Base", "Size", "Allocated", "Load", "Entry", "CRC");
    for (size_t i = 0; i < container.segments.size(); ++i) {
        auto& segment = container.segments[i];
        fmt::print("{:<3} {:<16} {:<10} {:>5} {:#010x} {:#010x} {:#010x} {:#010x} {:#010x} {:#010x} ({})\n",
                   i, segment.name, Firmware::GetKindName(segment.kind), segment.index, segment.base_address,
                   segment.declared_size, segment.allocated_size, segment.load_address, segment.entry_address,
                   segment.crc_claim, segment.crc_valid ? "valid" : "invalid");
    }

    auto& signature = container.signature;
    fmt::print("\nSignature:     {} at {:#x}, CRC {:#010x} ({})\n",
               signature.variant == Firmware::SignatureVariant::Signed ? "ENDS" : "END.", signature.offset,
               signature.crc_claim, signature.crc_valid ? "valid" : "invalid");
    fmt::print("RSA block:     {}", Firmware::GetStatusName(signature.block_status));
    if (!signature.block.empty()) {
        fmt::print(" ({} bytes)", signature.block.size());
    }
    fmt::print("\n");
    if (container.trailing_bytes) {
        fmt::print("Trailing data: {:#x} bytes\n", container.trailing_bytes);
    }
    return 0;
}

int Verify(const Settings::InspectSettings& settings, LogManager& log_manager) {
    ApplyLogLevel(settings.get<Settings::DebugLogging>(), log_manager);
    auto& logger = *log_manager.GetLogger("CLI");

    auto buffer = ReadFile(settings.get<Settings::InputImage>());
    auto verifier = LoadVerifier(settings.get<Settings::PublicKeyFile>(), logger);

    LoggingEvents events { logger };
    auto container = Firmware::Decode(buffer, { verifier.get(), &events });
    if (!ReportValidity(container, logger)) {
        logger.error("Verification failed");
        return 1;
    }

    logger.info("Image \"{}\" with {} segments is valid", container.version, container.segments.size());
    return 0;
}

namespace {

std::string Prompt(std::istream& input, std::ostream& output, std::string_view message, std::string_view default_value = {}) {
    if (default_value.empty()) {
        fmt::print(output, "{}: ", message);
    } else {
        fmt::print(output, "{} [{}]: ", message, default_value);
    }
    output.flush();

    std::string line;
    if (!std::getline(input, line)) {
        throw OpenFw::Exceptions::InvalidUserInput("Input ended before all questions were answered");
    }
    boost::algorithm::trim(line);
    return line.empty() ? std::string { default_value } : line;
}

std::string PromptExistingPath(std::istream& input, std::ostream& output, std::string_view message) {
    while (true) {
        auto path = Prompt(input, output, message);
        std::error_code error;
        if (!path.empty() && std::filesystem::exists(path, error)) {
            return path;
        }
        fmt::print(output, "File does not exist\n");
    }
}

} // anonymous namespace

int Wizard(std::istream& input, std::ostream& output, LogManager& log_manager) {
    while (true) {
        auto action = Prompt(input, output, "Split an existing image or build a new one? (split/build)");
        if (boost::algorithm::iequals(action, "split")) {
            Settings::SplitSettings settings;
            settings.set<Settings::InputImage>(PromptExistingPath(input, output, "Path to firmware image"));
            settings.set<Settings::OutputPrefix>(Prompt(input, output, "Output prefix (empty for automatic)"));
            settings.set<Settings::DebugLogging>(true);
            return Split(settings, log_manager);
        } else if (boost::algorithm::iequals(action, "build")) {
            Settings::BuildSettings settings;
            settings.set<Settings::LayoutSource>(Prompt(input, output, "Layout descriptor (.txt) or segment file prefix"));
            settings.set<Settings::OutputImage>(Prompt(input, output, "Output file", Settings::OutputImage::default_value()));
            settings.set<Settings::FirmwareVersion>(Prompt(input, output, "Firmware version", Settings::FirmwareVersion::default_value()));
            settings.set<Settings::DebugLogging>(true);
            return Build(settings, log_manager);
        }
        fmt::print(output, "Please enter \"split\" or \"build\"\n");
    }
}

} // namespace Commands
