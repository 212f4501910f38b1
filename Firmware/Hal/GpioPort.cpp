#include "GpioPort.h"
#include "IrqLine.h"
#include "RegisterIo.h"
#include "ioc_regs.h"

#include <stdio.h>

GpioPort::GpioPort(RegisterIo& io, IrqLine& irq) : io(io), irq(irq)
{
    for (int i = 0; i < num_pins; ++i) {
        pins[i].init(&io, i);
    }
}

GpioPin *GpioPort::get_pin(int index)
{
    if(index < 0 || index >= num_pins) {
        printf("ERROR: GPIO pin index %d out of range\n", index);
        return nullptr;
    }

    return &pins[index];
}

// Runs in the GPIO interrupt context with the GPIO line disabled.
// EVFLAGS is read once and the same value written back to clear exactly those bits before
// any client runs. An edge on a pin whose flag is already set, arriving between the read and
// the write back, is cleared with it and is lost. Edges after the write back, including any
// caused by a client, set a fresh flag and are handled on the next interrupt.
void GpioPort::handle_interrupt()
{
    uint32_t evflags = io.read(GPIO_REG(GPIO_O_EVFLAGS31_0));
    io.write(GPIO_REG(GPIO_O_EVFLAGS31_0), evflags);

    for (int i = 0; evflags != 0 && i < num_pins; ++i) {
        if(evflags & 1) {
            pins[i].handle_interrupt();
        }
        evflags >>= 1;
    }

    // only re-arm once every client has returned
    irq.clear_pending();
    irq.enable();
}
