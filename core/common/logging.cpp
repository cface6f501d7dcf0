#include "common/logging.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace obix {
namespace logging {

Marker::Marker(const char* name, bool defaultEnabled) noexcept
    : name(name), isEnabled(defaultEnabled) {
    std::string env_var = "OBIX_LOG_MARKER_" + std::string(name) + "_ENABLED";
    const char* env_val = std::getenv(env_var.c_str());
    if (!env_val) return;

    std::string value(env_val);
    if (value == "true") {
        isEnabled = true;
    } else if (value == "false") {
        isEnabled = false;
    } else {
        std::cerr << "WARNING: " << env_var
                  << " was not 'true' or 'false', but '" << value << "'\n";
    }
}

const Marker WARN("WARN", true);
const Marker INFO("INFO", true);
const Marker DEBUG("DEBUG", false);
const Marker TRACE("TRACE", false);

NullStream null_out;

Logger::Logger(const char* name) noexcept : name_(name), os_(&std::cerr) {
    const char* path = std::getenv("OBIX_LOG_FILE");
    if (!path) return;

    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "WARNING: could not open OBIX_LOG_FILE '" << path
                  << "', logging to stderr\n";
        return;
    }
    os_ = file.get();
    owned_ = std::move(file);
}

const Logger OBIX("obix");

} // namespace logging
} // namespace obix
