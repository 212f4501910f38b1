#pragma once

#include <stdint.h>

class RegisterIo;

// one line of the top level interrupt controller
class IrqLine
{
public:
    virtual ~IrqLine() {};

    virtual void clear_pending() = 0;
    virtual void enable() = 0;
    virtual void disable() = 0;
};

class NvicIrqLine : public IrqLine
{
public:
    NvicIrqLine(RegisterIo& io, uint32_t irqn);

    void clear_pending() override;
    void enable() override;
    void disable() override;

    uint32_t get_irqn() const { return irqn; }

private:
    uint32_t bank_reg(uint32_t base) const { return base + ((irqn >> 5) * 4); }
    uint32_t bit() const { return 1UL << (irqn & 0x1F); }

    RegisterIo& io;
    uint32_t irqn;
};
