#ifndef PLATFORM_GPIO_BACKEND_HPP
#define PLATFORM_GPIO_BACKEND_HPP

// Pin-level access used by the controller. Pins are BCM line offsets.
// claim_* throw HardwareAcquisitionError; read/write report failure through
// their return value so one bad line never stops the polling loop.
class GpioBackend {
public:
    virtual ~GpioBackend() = default;

    // Inputs are requested with the pull-up bias; a pressed button reads low.
    virtual void claim_input(int pin) = 0;
    virtual void claim_output(int pin, bool initial_level) = 0;

    virtual bool read(int pin, bool& level) = 0;
    virtual bool write(int pin, bool level) = 0;

    virtual void release(int pin) = 0;
    virtual void release_all() = 0;
};

#endif
