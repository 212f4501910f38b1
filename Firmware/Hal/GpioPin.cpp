#include "GpioPin.h"
#include "GpioClient.h"
#include "PinMux.h"
#include "RegisterIo.h"
#include "ioc_regs.h"
#include "fatal.h"

#include <stdio.h>

using namespace ioc;

void GpioPin::init(RegisterIo *regs, uint8_t n)
{
    io = regs;
    index = n;
    mask = 1UL << n;
    client = nullptr;
}

uint32_t GpioPin::iocfg_addr() const
{
    return IOC_IOCFG(index);
}

// The IOCFG write must be done before DOE is asserted, otherwise the pin would drive
// with whatever drive strength and pull were left there
void GpioPin::make_digital_output()
{
    io->write(iocfg_addr(), pinmux::gpio_iocfg(false));
    io->write(GPIO_REG(GPIO_O_DOE31_0), io->read(GPIO_REG(GPIO_O_DOE31_0)) | mask);
}

void GpioPin::make_digital_input()
{
    io->write(iocfg_addr(), pinmux::gpio_iocfg(true));
    // stop driving, if it was an output before
    io->write(GPIO_REG(GPIO_O_DOE31_0), io->read(GPIO_REG(GPIO_O_DOE31_0)) & ~mask);
}

void GpioPin::configure_for(const PinFunction& f)
{
    switch(f.kind) {
        case PinFunction::DIGITAL_OUTPUT: make_digital_output(); return;
        case PinFunction::DIGITAL_INPUT: make_digital_input(); return;
        default: break;
    }

    pinmux::MuxSetting s = pinmux::compose(f);
    if(s.cross_connect) {
        // route the timer output to the port event before the pin selects it
        io->write(s.event_sel_addr, s.event_sel_value);
    }
    io->write(iocfg_addr(), s.iocfg);
}

// pull is independent of the function so this is the one partial update of IOCFG
void GpioPin::set_floating_state(PULL_T mode)
{
    uint32_t v;
    switch(mode) {
        case PULL_UP: v = ioc::PULL_UP; break;
        case PULL_DOWN: v = ioc::PULL_DWN; break;
        case PULL_NONE:
        default: v = ioc::PULL_DIS; break;
    }
    io->modify(iocfg_addr(), PULL_CTL.mask(), PULL_CTL.val(v));
}

GpioPin::PULL_T GpioPin::floating_state() const
{
    switch(PULL_CTL.get(io->read(iocfg_addr()))) {
        case ioc::PULL_UP: return PULL_UP;
        case ioc::PULL_DWN: return PULL_DOWN;
        case ioc::PULL_DIS: return PULL_NONE;
    }

    fatal_error("GPIO: invalid pull encoding in IOCFG");
}

void GpioPin::deactivate_to_low_power()
{
    set_floating_state(PULL_NONE);
}

bool GpioPin::is_input() const
{
    return IE.get(io->read(iocfg_addr())) != 0;
}

// DOE only means something while GPIO is selected, a peripheral function
// drives the pin when its input buffer is off
bool GpioPin::is_output() const
{
    uint32_t cfg = io->read(iocfg_addr());
    if(PORT_ID.get(cfg) != PORT_GPIO) return IE.get(cfg) == 0;

    return (io->read(GPIO_REG(GPIO_O_DOE31_0)) & mask) != 0;
}

GpioPin::CONFIG_T GpioPin::query_configuration() const
{
    bool input = is_input();
    bool output = is_output();

    if(input && output) return INPUT_OUTPUT;
    if(input) return INPUT;
    if(output) return OUTPUT;
    return OTHER;
}

// Disabling the input would make the pin start driving, which is not something to do
// as a side effect, so this leaves the pin as it is
GpioPin::CONFIG_T GpioPin::disable_input()
{
    return query_configuration();
}

// the only way to stop driving is to become an input
GpioPin::CONFIG_T GpioPin::disable_output()
{
    make_digital_input();
    return query_configuration();
}

bool GpioPin::read() const
{
    return (io->read(GPIO_REG(GPIO_O_DIN31_0)) & mask) != 0;
}

// set/clear/toggle registers only act on the bits written as 1
void GpioPin::set()
{
    io->write(GPIO_REG(GPIO_O_DOUTSET31_0), mask);
}

void GpioPin::clear()
{
    io->write(GPIO_REG(GPIO_O_DOUTCLR31_0), mask);
}

bool GpioPin::toggle()
{
    io->write(GPIO_REG(GPIO_O_DOUTTGL31_0), mask);
    return read();
}

uint32_t GpioPin::edge_to_field(EDGE_T edge)
{
    switch(edge) {
        case FALLING_EDGE: return EDGE_NEG;
        case RISING_EDGE: return EDGE_POS;
        case EITHER_EDGE: return EDGE_BOTH;
    }
    return EDGE_NONE;
}

void GpioPin::enable_interrupt(EDGE_T edge)
{
    io->modify(iocfg_addr(), EDGE_DET.mask() | EDGE_IRQ_EN.mask(),
               EDGE_DET.val(edge_to_field(edge)) | EDGE_IRQ_EN.val(1));
}

// edge detection mode is left as is, re-enabling needs enable_interrupt() with the edge
void GpioPin::disable_interrupt()
{
    io->modify(iocfg_addr(), EDGE_IRQ_EN.mask(), 0);
}

bool GpioPin::is_pending(bool& pending) const
{
    printf("ERROR: GPIO%d is_pending is not supported by this chip\n", index);
    return false;
}

void GpioPin::handle_interrupt()
{
    if(client != nullptr) {
        client->fired();
    }
}
