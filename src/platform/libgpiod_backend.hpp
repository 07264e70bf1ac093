#ifndef PLATFORM_LIBGPIOD_BACKEND_HPP
#define PLATFORM_LIBGPIOD_BACKEND_HPP

#include "platform/gpio_backend.hpp"

#include <map>
#include <string>

struct gpiod_chip;
struct gpiod_line;

// libgpiod (v1 API) implementation. Owns the chip handle and every requested line.
class LibgpiodBackend : public GpioBackend {
public:
    LibgpiodBackend(std::string chip, std::string consumer);
    ~LibgpiodBackend() override;

    LibgpiodBackend(const LibgpiodBackend&) = delete;
    LibgpiodBackend& operator=(const LibgpiodBackend&) = delete;

    // Opens the chip. Throws HardwareAcquisitionError with pin -1 on failure.
    void open();

    void claim_input(int pin) override;
    void claim_output(int pin, bool initial_level) override;
    bool read(int pin, bool& level) override;
    bool write(int pin, bool level) override;
    void release(int pin) override;
    void release_all() override;

private:
    gpiod_line* line_for(int pin);

    std::string m_chip_name;
    std::string m_consumer;
    gpiod_chip* m_chip = nullptr;
    std::map<int, gpiod_line*> m_lines;
};

#endif
