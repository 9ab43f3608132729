#include "exceptions.hpp"

#include <filesystem>

namespace OpenFw::Exceptions {

std::string ContractViolated::FormatMessage(std::string_view condition, std::string_view function, std::string_view file, int line) {
    return fmt::format("Failed assertion '{}' in {} ({}:{})\n",
                       condition, function, std::filesystem::path(file).filename().string(), line);
}

} // namespace OpenFw::Exceptions
