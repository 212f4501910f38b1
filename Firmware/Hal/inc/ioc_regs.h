#pragma once

#include <stdint.h>

// CC26x2 GPIO, IOC and EVENT register map, see the CC13x2/CC26x2 TRM chapters 13 and 4

#define GPIO_BASE   0x40022000UL
#define IOC_BASE    0x40081000UL
#define EVENT_BASE  0x40083000UL

// GPIO port registers, one bit per DIO
#define GPIO_O_DOUTSET31_0  0x090   // write only
#define GPIO_O_DOUTCLR31_0  0x0A0   // write only
#define GPIO_O_DOUTTGL31_0  0x0B0   // write only
#define GPIO_O_DIN31_0      0x0C0
#define GPIO_O_DOE31_0      0x0D0
#define GPIO_O_EVFLAGS31_0  0x0E0   // write 1 to clear

#define GPIO_NUM_PINS 32

#define GPIO_REG(off) (GPIO_BASE + (off))
#define IOC_IOCFG(pin) (IOC_BASE + ((uint32_t)(pin) * 4))

// EVENT fabric: timer capture input selectors
#define EVENT_O_GPT0ACAPTSEL 0x200
#define EVENT_O_GPT0BCAPTSEL 0x204
#define EVENT_O_GPT1ACAPTSEL 0x300
#define EVENT_O_GPT1BCAPTSEL 0x304
#define EVENT_O_GPT2ACAPTSEL 0x400
#define EVENT_O_GPT2BCAPTSEL 0x404
#define EVENT_O_GPT3ACAPTSEL 0x500
#define EVENT_O_GPT3BCAPTSEL 0x504

#define EVENT_REG(off) (EVENT_BASE + (off))

// NVIC, only the first bank is needed as the GPIO edge interrupt is IRQ 0
#define NVIC_ISER0 0xE000E100UL
#define NVIC_ICER0 0xE000E180UL
#define NVIC_ISPR0 0xE000E200UL
#define NVIC_ICPR0 0xE000E280UL

#define GPIO_EDGE_IRQn 0

namespace ioc {

    // a bit field within a 32 bit register
    struct Field {
        uint8_t shift;
        uint8_t width;

        uint32_t mask() const { return ((1UL << width) - 1) << shift; }
        uint32_t val(uint32_t v) const { return (v << shift) & mask(); }
        uint32_t get(uint32_t reg) const { return (reg & mask()) >> shift; }
    };

    // IOCFGn fields
    static const Field PORT_ID     {0, 6};
    static const Field IOSTR       {8, 2};
    static const Field IOCURR      {10, 2};
    static const Field SLEW_RED    {12, 1};
    static const Field PULL_CTL    {13, 2};
    static const Field EDGE_DET    {16, 2};
    static const Field EDGE_IRQ_EN {18, 1};
    static const Field IOMODE      {24, 3};
    static const Field WU_CFG      {27, 2};
    static const Field IE          {29, 1};
    static const Field HYST_EN     {30, 1};

    // value of IOCFGn out of reset
    static const uint32_t IOCFG_RESET = 0x00006000UL;

    enum PORT_ID_T {
        PORT_GPIO        = 0x00,
        PORT_AON_CLK32K  = 0x07,
        PORT_AUX_IO      = 0x08,
        PORT_I2C_MSSDA   = 0x0D,
        PORT_I2C_MSSCL   = 0x0E,
        PORT_UART0_RX    = 0x0F,
        PORT_UART0_TX    = 0x10,
        PORT_UART1_RX    = 0x13,
        PORT_UART1_TX    = 0x14,
        PORT_EVENT0      = 0x17,
        PORT_EVENT1      = 0x18,
        PORT_EVENT2      = 0x19,
        PORT_EVENT3      = 0x1A,
        PORT_EVENT4      = 0x1B,
        PORT_EVENT5      = 0x1C,
        PORT_EVENT6      = 0x1D,
        PORT_EVENT7      = 0x1E
    };

    enum IOSTR_T {
        IOSTR_AUTO = 0,
        IOSTR_MIN  = 1,
        IOSTR_MED  = 2,
        IOSTR_MAX  = 3
    };

    enum IOCURR_T {
        IOCURR_2MA   = 0,  // low current mode
        IOCURR_4MA   = 1,
        IOCURR_4_8MA = 2
    };

    // 0 is not a valid encoding
    enum PULL_T {
        PULL_DWN = 1,
        PULL_UP  = 2,
        PULL_DIS = 3
    };

    enum EDGE_DET_T {
        EDGE_NONE = 0,
        EDGE_NEG  = 1,
        EDGE_POS  = 2,
        EDGE_BOTH = 3
    };

    enum IOMODE_T {
        IOMODE_NORMAL     = 0,
        IOMODE_INV        = 1,
        IOMODE_OPENDR     = 4,
        IOMODE_OPENDR_INV = 5,
        IOMODE_OPENSRC    = 6,
        IOMODE_OPENSRC_INV= 7
    };

    enum WU_CFG_T {
        WU_NONE = 0
    };
}

namespace event {

    // EVENT subscriber values that route a timer output to the IOC port event inputs
    enum EV_T {
        PORT_EVENT0 = 0x55,
        PORT_EVENT1 = 0x56,
        PORT_EVENT2 = 0x57,
        PORT_EVENT3 = 0x58,
        PORT_EVENT4 = 0x59,
        PORT_EVENT5 = 0x5A,
        PORT_EVENT6 = 0x5B,
        PORT_EVENT7 = 0x5C
    };
}
