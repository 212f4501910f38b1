#pragma once

#include <stdint.h>

#include "GpioPin.h"

class RegisterIo;
class IrqLine;

// Owns the 32 DIOs and demultiplexes the shared GPIO edge interrupt
class GpioPort
{
public:
    static const int num_pins = 32;

    GpioPort(RegisterIo& io, IrqLine& irq);
    GpioPort(const GpioPort&) = delete;
    GpioPort& operator=(const GpioPort&) = delete;

    // returns nullptr if index is not a valid pin
    GpioPin *get_pin(int index);

    // called from the GPIO interrupt vector
    void handle_interrupt();

    IrqLine& get_irq() { return irq; }

private:
    RegisterIo& io;
    IrqLine& irq;
    GpioPin pins[num_pins];
};

// Creates the port over the real registers on first call, returns the same port thereafter
GpioPort *gpio_setup();
