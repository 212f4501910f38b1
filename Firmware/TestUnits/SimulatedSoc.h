#pragma once

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <map>
#include <vector>

#include "RegisterIo.h"

// Register level model of the GPIO, IOC, EVENT and NVIC blocks the HAL touches,
// with a log of every access so tests can check ordering
class SimulatedSoc : public RegisterIo
{
public:
    struct access_t {
        bool write;
        uint32_t addr;
        uint32_t value;
    };

    SimulatedSoc() { reset(); }

    uint32_t read(uint32_t addr) override;
    void write(uint32_t addr, uint32_t value) override;

    void reset();

    // external level on a pin, latches EVFLAGS per the pin's EDGE_DET and pends the
    // NVIC line if the pin has EDGE_IRQ_EN set
    void drive_input(int pin, bool level);
    // sets event flags directly, as if the edges had been seen
    void latch_event(uint32_t mask);

    uint32_t get_iocfg(int pin) const { return iocfg[pin]; }
    void set_iocfg(int pin, uint32_t v) { iocfg[pin] = v; }
    uint32_t get_dout() const { return dout; }
    uint32_t get_doe() const { return doe; }
    uint32_t get_evflags() const { return evflags; }
    uint32_t get_event_sel(uint32_t addr) const;
    bool nvic_enabled() const { return (nvic_enable & 1) != 0; }
    bool nvic_pending() const { return (nvic_pending_bits & 1) != 0; }
    int get_unknown_accesses() const { return unknown_accesses; }

    const std::vector<access_t>& get_log() const { return log; }
    void clear_log() { log.clear(); }
    // index of the first logged write to addr at or after from, -1 if there is none
    int find_write(uint32_t addr, int from = 0) const;

    // called on every EVFLAGS read after the value returned has been sampled
    std::function<void(void)> on_evflags_read;

private:
    bool pin_level(int pin) const;
    bool edge_line_asserted() const;
    void edge_seen(int pin, bool old_level, bool new_level);

    std::vector<access_t> log;
    std::map<uint32_t, uint32_t> event_sel;
    uint32_t iocfg[32];
    uint32_t dout;
    uint32_t doe;
    uint32_t ext_level;
    uint32_t evflags;
    uint32_t nvic_enable;
    uint32_t nvic_pending_bits;
    int unknown_accesses;
};
