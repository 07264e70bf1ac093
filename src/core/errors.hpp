#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

// Bad or inconsistent configuration. Fatal before the polling loop starts.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A GPIO chip or line could not be acquired.
class HardwareAcquisitionError : public std::runtime_error {
public:
    HardwareAcquisitionError(int pin, const std::string& what)
        : std::runtime_error(what), m_pin(pin) {}

    int pin() const { return m_pin; }

private:
    int m_pin;
};

// The camera-control service could not be reached while validating cameras.
class RemoteUnavailableError : public std::runtime_error {
public:
    explicit RemoteUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

#endif
