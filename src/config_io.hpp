#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include "core/models.hpp"

#include <string>

// Reads the camera configuration. Every function throws ConfigurationError.
class ConfigIO {
public:
    static DaemonConfig loadFile(const std::string& filePath);
    static DaemonConfig parse(const std::string& text);
    static void validate(const DaemonConfig& config);
};

#endif // CONFIG_IO_HPP
