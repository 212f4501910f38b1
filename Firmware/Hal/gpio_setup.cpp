#include "GpioPort.h"
#include "IrqLine.h"
#include "RegisterIo.h"
#include "ioc_regs.h"

// the one port over the real hardware, used by the interrupt vector
static GpioPort *the_port = nullptr;

GpioPort *gpio_setup()
{
    if(the_port != nullptr) return the_port;

    static MmioRegisterIo mmio;
    static NvicIrqLine gpio_irq(mmio, GPIO_EDGE_IRQn);
    static GpioPort port(mmio, gpio_irq);

    gpio_irq.clear_pending();
    gpio_irq.enable();

    the_port = &port;
    return the_port;
}

// GPIO edge interrupt vector
extern "C" void GPIOIntHandler(void)
{
    if(the_port == nullptr) return;

    the_port->get_irq().disable();
    the_port->handle_interrupt();
}
