#pragma once

#include <stdint.h>

#include "PinFunction.h"

class RegisterIo;
class GpioClient;
class GpioPort;

// One DIO of the port. Holds no electrical state of its own, the pin's IOCFG register is
// the only copy of its configuration.
class GpioPin
{
public:
    enum CONFIG_T {INPUT, OUTPUT, INPUT_OUTPUT, OTHER};
    enum PULL_T {PULL_UP, PULL_DOWN, PULL_NONE};
    enum EDGE_T {FALLING_EDGE, RISING_EDGE, EITHER_EDGE};

    uint8_t get_index() const { return index; }
    uint32_t get_mask() const { return mask; }

    // pin multiplexing
    void make_digital_output();
    void make_digital_input();
    void configure_for(const PinFunction& f);
    void set_floating_state(PULL_T mode);
    PULL_T floating_state() const;
    void deactivate_to_low_power();

    bool is_input() const;
    bool is_output() const;
    CONFIG_T query_configuration() const;

    // there is no tri-state on this chip, see GpioPin.cpp
    CONFIG_T disable_input();
    CONFIG_T disable_output();

    // digital I/O
    bool read() const;
    void set();
    void clear();
    bool toggle();

    // edge interrupts
    void enable_interrupt(EDGE_T edge);
    void disable_interrupt();
    void set_client(GpioClient *c) { client = c; }
    GpioClient *get_client() const { return client; }
    // Not supported by the hardware. Always returns false, meaning there is no answer,
    // not that nothing is pending. pending is left as it was.
    bool is_pending(bool& pending) const;

    // called by GpioPort when this pin's event flag was set
    void handle_interrupt();

    static uint32_t edge_to_field(EDGE_T edge);

private:
    friend class GpioPort;
    GpioPin() {};
    void init(RegisterIo *regs, uint8_t n);

    uint32_t iocfg_addr() const;

    RegisterIo *io{nullptr};
    GpioClient *client{nullptr};
    uint32_t mask{0};
    uint8_t index{0};
};
