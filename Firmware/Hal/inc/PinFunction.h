#pragma once

#include <stdint.h>

// general purpose timer channels that can drive a pin through the event fabric
enum PWM_TIMER_T {
    GPT0A, GPT0B,
    GPT1A, GPT1B,
    GPT2A, GPT2B,
    GPT3A, GPT3B
};

// the role a pin is claimed for, timer is only meaningful for PWM_OUTPUT
// and a PWM_OUTPUT made without pwm() has no timer and is rejected by pinmux::compose
struct PinFunction
{
    enum KIND_T {
        DIGITAL_OUTPUT,
        DIGITAL_INPUT,
        UART0_TX,
        UART0_RX,
        UART1_TX,
        UART1_RX,
        I2C_SDA,
        I2C_SCL,
        PWM_OUTPUT,
        ANALOG_INPUT,
        ANALOG_OUTPUT,
        CLOCK_INPUT_32K
    };

    PinFunction(KIND_T k) : kind(k), timer(GPT0A), has_timer(false) {};

    static PinFunction pwm(PWM_TIMER_T t)
    {
        PinFunction f(PWM_OUTPUT);
        f.timer = t;
        f.has_timer = true;
        return f;
    }

    // true if the pin is configured with its input buffer enabled
    bool is_input() const;

    KIND_T kind;
    PWM_TIMER_T timer;
    bool has_timer;
};
