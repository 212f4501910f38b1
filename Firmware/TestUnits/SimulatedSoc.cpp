#include "SimulatedSoc.h"
#include "ioc_regs.h"

using namespace ioc;

void SimulatedSoc::reset()
{
    for (int i = 0; i < 32; ++i) {
        iocfg[i] = IOCFG_RESET;
    }
    dout = 0;
    doe = 0;
    ext_level = 0;
    evflags = 0;
    nvic_enable = 0;
    nvic_pending_bits = 0;
    unknown_accesses = 0;
    event_sel.clear();
    log.clear();
    on_evflags_read = nullptr;
}

uint32_t SimulatedSoc::read(uint32_t addr)
{
    uint32_t v = 0;

    if(addr >= IOC_IOCFG(0) && addr <= IOC_IOCFG(31) && (addr & 3) == 0) {
        v = iocfg[(addr - IOC_BASE) / 4];

    } else if(addr == GPIO_REG(GPIO_O_DIN31_0)) {
        v = (dout & doe) | (ext_level & ~doe);

    } else if(addr == GPIO_REG(GPIO_O_DOE31_0)) {
        v = doe;

    } else if(addr == GPIO_REG(GPIO_O_EVFLAGS31_0)) {
        v = evflags;

    } else if(addr >= EVENT_BASE && addr < EVENT_BASE + 0x1000) {
        v = get_event_sel(addr);

    } else if(addr == NVIC_ISER0 || addr == NVIC_ICER0) {
        v = nvic_enable;

    } else if(addr == NVIC_ISPR0 || addr == NVIC_ICPR0) {
        v = nvic_pending_bits;

    } else {
        // includes the write only DOUT set/clear/toggle registers
        ++unknown_accesses;
    }

    log.push_back({false, addr, v});

    if(addr == GPIO_REG(GPIO_O_EVFLAGS31_0) && on_evflags_read) {
        on_evflags_read();
    }

    return v;
}

void SimulatedSoc::write(uint32_t addr, uint32_t value)
{
    log.push_back({true, addr, value});

    if(addr >= IOC_IOCFG(0) && addr <= IOC_IOCFG(31) && (addr & 3) == 0) {
        iocfg[(addr - IOC_BASE) / 4] = value;

    } else if(addr == GPIO_REG(GPIO_O_DOUTSET31_0)) {
        dout |= value;

    } else if(addr == GPIO_REG(GPIO_O_DOUTCLR31_0)) {
        dout &= ~value;

    } else if(addr == GPIO_REG(GPIO_O_DOUTTGL31_0)) {
        dout ^= value;

    } else if(addr == GPIO_REG(GPIO_O_DOE31_0)) {
        doe = value;

    } else if(addr == GPIO_REG(GPIO_O_EVFLAGS31_0)) {
        evflags &= ~value;

    } else if(addr >= EVENT_BASE && addr < EVENT_BASE + 0x1000) {
        event_sel[addr] = value;

    } else if(addr == NVIC_ISER0) {
        nvic_enable |= value;

    } else if(addr == NVIC_ICER0) {
        nvic_enable &= ~value;

    } else if(addr == NVIC_ISPR0) {
        nvic_pending_bits |= value;

    } else if(addr == NVIC_ICPR0) {
        nvic_pending_bits &= ~value;
        // the IOC edge line is a level while any enabled flag is latched
        if(edge_line_asserted()) nvic_pending_bits |= (1UL << GPIO_EDGE_IRQn);

    } else {
        ++unknown_accesses;
    }
}

uint32_t SimulatedSoc::get_event_sel(uint32_t addr) const
{
    auto i = event_sel.find(addr);
    if(i == event_sel.end()) return 0;
    return i->second;
}

int SimulatedSoc::find_write(uint32_t addr, int from) const
{
    for (size_t i = from; i < log.size(); ++i) {
        if(log[i].write && log[i].addr == addr) return i;
    }
    return -1;
}

bool SimulatedSoc::pin_level(int pin) const
{
    return ((ext_level >> pin) & 1) != 0;
}

void SimulatedSoc::drive_input(int pin, bool level)
{
    bool old_level = pin_level(pin);
    if(level) ext_level |= (1UL << pin);
    else ext_level &= ~(1UL << pin);

    edge_seen(pin, old_level, level);
}

void SimulatedSoc::edge_seen(int pin, bool old_level, bool new_level)
{
    if(old_level == new_level) return;

    uint32_t cfg = iocfg[pin];
    bool hit;
    switch(EDGE_DET.get(cfg)) {
        case EDGE_NEG: hit = old_level && !new_level; break;
        case EDGE_POS: hit = !old_level && new_level; break;
        case EDGE_BOTH: hit = true; break;
        default: hit = false; break;
    }

    if(!hit) return;

    evflags |= (1UL << pin);
    if(EDGE_IRQ_EN.get(cfg) != 0) {
        nvic_pending_bits |= (1UL << GPIO_EDGE_IRQn);
    }
}

bool SimulatedSoc::edge_line_asserted() const
{
    for (int i = 0; i < 32; ++i) {
        if((evflags & (1UL << i)) && EDGE_IRQ_EN.get(iocfg[i]) != 0) return true;
    }
    return false;
}

void SimulatedSoc::latch_event(uint32_t mask)
{
    evflags |= mask;
    if(mask != 0) {
        nvic_pending_bits |= (1UL << GPIO_EDGE_IRQn);
    }
}
