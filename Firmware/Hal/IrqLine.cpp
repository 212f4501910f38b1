#include "IrqLine.h"
#include "RegisterIo.h"
#include "ioc_regs.h"

// The NVIC set/clear registers only act on bits written as 1, so no read-modify-write is needed

NvicIrqLine::NvicIrqLine(RegisterIo& io, uint32_t irqn) : io(io), irqn(irqn)
{
}

void NvicIrqLine::clear_pending()
{
    io.write(bank_reg(NVIC_ICPR0), bit());
}

void NvicIrqLine::enable()
{
    io.write(bank_reg(NVIC_ISER0), bit());
}

void NvicIrqLine::disable()
{
    io.write(bank_reg(NVIC_ICER0), bit());
}
