#pragma once

#include <stdint.h>

#include "PinFunction.h"

// Pure composition of the IOCFG word for a pin function, no register access.
// Every field of IOCFG is specified so nothing is left over from a previous function.
namespace pinmux {

    struct MuxSetting {
        uint32_t iocfg;         // full value to write to the pin's IOCFG
        bool cross_connect;     // true if event_sel_addr must be written first
        uint32_t event_sel_addr;
        uint32_t event_sel_value;
    };

    MuxSetting compose(const PinFunction& f);

    // the GPIO selection used by make_digital_output/make_digital_input
    uint32_t gpio_iocfg(bool input);

    // timer channel to event fabric routing, returns false for an invalid timer
    bool lookup_timer(PWM_TIMER_T t, uint32_t& sel_addr, uint32_t& event_value, uint32_t& port_id);
}
