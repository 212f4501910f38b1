#include "PinMux.h"
#include "ioc_regs.h"
#include "fatal.h"

using namespace ioc;

/* IOCFG field combination for each function
   pull is always disabled, slew reduction, wakeup, edge detection and edge irq are always cleared
   PWM_OUTPUT gets its port id from the timer table below
*/
struct mux_entry_t {
    PinFunction::KIND_T kind;
    uint8_t port_id;
    uint8_t iostr;
    uint8_t iocurr;
    uint8_t iomode;
    bool input_enable;
    bool hysteresis;
};

static const mux_entry_t mux_table[] = {
    {PinFunction::DIGITAL_OUTPUT,  PORT_GPIO,       IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, false, false},
    {PinFunction::DIGITAL_INPUT,   PORT_GPIO,       IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, true,  false},
    {PinFunction::UART0_TX,        PORT_UART0_TX,   IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, false, false},
    {PinFunction::UART0_RX,        PORT_UART0_RX,   IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, true,  false},
    {PinFunction::UART1_TX,        PORT_UART1_TX,   IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, false, false},
    {PinFunction::UART1_RX,        PORT_UART1_RX,   IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, true,  false},
    {PinFunction::I2C_SDA,         PORT_I2C_MSSDA,  IOSTR_AUTO, IOCURR_2MA, IOMODE_OPENDR, true,  false},
    {PinFunction::I2C_SCL,         PORT_I2C_MSSCL,  IOSTR_AUTO, IOCURR_2MA, IOMODE_OPENDR, true,  false},
    {PinFunction::PWM_OUTPUT,      PORT_GPIO,       IOSTR_MAX,  IOCURR_2MA, IOMODE_NORMAL, false, false},
    {PinFunction::ANALOG_INPUT,    PORT_AUX_IO,     IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, true,  false},
    {PinFunction::ANALOG_OUTPUT,   PORT_AUX_IO,     IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, false, false},
    // a slow clock edge needs the schmitt trigger
    {PinFunction::CLOCK_INPUT_32K, PORT_AON_CLK32K, IOSTR_AUTO, IOCURR_2MA, IOMODE_NORMAL, true,  true},
};

/* timer channel to port event routing, fixed 1:1
   timer, capture select register, event fabric value, IOC port id
*/
struct timer_entry_t {
    PWM_TIMER_T timer;
    uint32_t sel_offset;
    uint8_t event_value;
    uint8_t port_id;
};

static const timer_entry_t timer_table[] = {
    {GPT0A, EVENT_O_GPT0ACAPTSEL, event::PORT_EVENT0, PORT_EVENT0},
    {GPT0B, EVENT_O_GPT0BCAPTSEL, event::PORT_EVENT1, PORT_EVENT1},
    {GPT1A, EVENT_O_GPT1ACAPTSEL, event::PORT_EVENT2, PORT_EVENT2},
    {GPT1B, EVENT_O_GPT1BCAPTSEL, event::PORT_EVENT3, PORT_EVENT3},
    {GPT2A, EVENT_O_GPT2ACAPTSEL, event::PORT_EVENT4, PORT_EVENT4},
    {GPT2B, EVENT_O_GPT2BCAPTSEL, event::PORT_EVENT5, PORT_EVENT5},
    {GPT3A, EVENT_O_GPT3ACAPTSEL, event::PORT_EVENT6, PORT_EVENT6},
    {GPT3B, EVENT_O_GPT3BCAPTSEL, event::PORT_EVENT7, PORT_EVENT7},
};

static const mux_entry_t *lookup_kind(PinFunction::KIND_T kind)
{
    for(auto& e : mux_table) {
        if(e.kind == kind) return &e;
    }
    return nullptr;
}

static uint32_t make_iocfg(const mux_entry_t& e, uint32_t port_id)
{
    return PORT_ID.val(port_id)
           | IOSTR.val(e.iostr)
           | IOCURR.val(e.iocurr)
           | SLEW_RED.val(0)
           | PULL_CTL.val(PULL_DIS)
           | EDGE_DET.val(EDGE_NONE)
           | EDGE_IRQ_EN.val(0)
           | IOMODE.val(e.iomode)
           | WU_CFG.val(WU_NONE)
           | IE.val(e.input_enable ? 1 : 0)
           | HYST_EN.val(e.hysteresis ? 1 : 0);
}

bool PinFunction::is_input() const
{
    const mux_entry_t *e = lookup_kind(kind);
    return e != nullptr && e->input_enable;
}

bool pinmux::lookup_timer(PWM_TIMER_T t, uint32_t& sel_addr, uint32_t& event_value, uint32_t& port_id)
{
    for(auto& e : timer_table) {
        if(e.timer == t) {
            sel_addr = EVENT_REG(e.sel_offset);
            event_value = e.event_value;
            port_id = e.port_id;
            return true;
        }
    }

    return false;
}

uint32_t pinmux::gpio_iocfg(bool input)
{
    return make_iocfg(*lookup_kind(input ? PinFunction::DIGITAL_INPUT : PinFunction::DIGITAL_OUTPUT), PORT_GPIO);
}

pinmux::MuxSetting pinmux::compose(const PinFunction& f)
{
    MuxSetting s{0, false, 0, 0};

    const mux_entry_t *e = lookup_kind(f.kind);
    if(e == nullptr) {
        fatal_error("pinmux: unknown pin function");
        return s;
    }

    uint32_t port_id = e->port_id;
    if(f.kind == PinFunction::PWM_OUTPUT) {
        if(!f.has_timer) {
            fatal_error("pinmux: PWM output without a timer");
            return s;
        }
        if(!lookup_timer(f.timer, s.event_sel_addr, s.event_sel_value, port_id)) {
            fatal_error("pinmux: unknown PWM timer");
            return s;
        }
        s.cross_connect = true;
    }

    s.iocfg = make_iocfg(*e, port_id);
    return s;
}
