#pragma once

#include <stdint.h>

// 32 bit register access by absolute address
class RegisterIo
{
public:
    virtual ~RegisterIo() {};

    virtual uint32_t read(uint32_t addr) = 0;
    virtual void write(uint32_t addr, uint32_t value) = 0;

    // read-modify-write of the bits in mask only
    void modify(uint32_t addr, uint32_t mask, uint32_t value)
    {
        write(addr, (read(addr) & ~mask) | (value & mask));
    }
};

// the real thing, volatile accesses to the memory mapped peripherals
class MmioRegisterIo : public RegisterIo
{
public:
    uint32_t read(uint32_t addr) override
    {
        return *(volatile uint32_t *)(uintptr_t)addr;
    }

    void write(uint32_t addr, uint32_t value) override
    {
        *(volatile uint32_t *)(uintptr_t)addr = value;
    }
};
