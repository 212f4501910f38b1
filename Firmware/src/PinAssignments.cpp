#include "PinAssignments.h"
#include "ConfigReader.h"
#include "StringUtils.h"
#include "GpioPort.h"

#include <stdio.h>

#define gpio_section        "gpio"
#define enable_key          "enable"
#define pin_key             "pin"
#define function_key        "function"
#define timer_key           "timer"
#define edge_key            "edge"

static const struct {
    const char *name;
    PinFunction::KIND_T kind;
} function_names[] = {
    {"output",     PinFunction::DIGITAL_OUTPUT},
    {"input",      PinFunction::DIGITAL_INPUT},
    {"uart0_tx",   PinFunction::UART0_TX},
    {"uart0_rx",   PinFunction::UART0_RX},
    {"uart1_tx",   PinFunction::UART1_TX},
    {"uart1_rx",   PinFunction::UART1_RX},
    {"i2c_sda",    PinFunction::I2C_SDA},
    {"i2c_scl",    PinFunction::I2C_SCL},
    {"pwm",        PinFunction::PWM_OUTPUT},
    {"analog_in",  PinFunction::ANALOG_INPUT},
    {"analog_out", PinFunction::ANALOG_OUTPUT},
    {"clk32k",     PinFunction::CLOCK_INPUT_32K},
};

static const struct {
    const char *name;
    PWM_TIMER_T timer;
} timer_names[] = {
    {"gpt0a", GPT0A}, {"gpt0b", GPT0B},
    {"gpt1a", GPT1A}, {"gpt1b", GPT1B},
    {"gpt2a", GPT2A}, {"gpt2b", GPT2B},
    {"gpt3a", GPT3A}, {"gpt3b", GPT3B},
};

// Pins are specified as dioN, gpioN or just N, N is 0-31
// modifiers after the number:-
// ^ = pull up
// v = pull down
// - = no pull
bool PinAssignments::parse_pin_spec(const std::string& spec, int& index, bool& has_pull, GpioPin::PULL_T& pull)
{
    std::string value = stringutils::toLower(stringutils::trim(spec));
    if(value.empty() || value == "nc") return false;

    size_t pos = 0;
    if(value.compare(0, 3, "dio") == 0) {
        pos = 3;
    } else if(value.compare(0, 4, "gpio") == 0) {
        pos = 4;
    }

    size_t end = value.find_first_not_of("0123456789", pos);
    if(end == pos) return false; // no number
    std::string number = value.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

    unsigned long n;
    if(!stringutils::parse_uint(number, n) || n >= (unsigned long)GpioPort::num_pins) return false;

    bool hp = false;
    GpioPin::PULL_T p = GpioPin::PULL_NONE;
    if(end != std::string::npos) {
        // only one modifier is allowed
        if(value.size() - end != 1) return false;
        switch(value[end]) {
            case '^': p = GpioPin::PULL_UP; break;
            case 'v': p = GpioPin::PULL_DOWN; break;
            case '-': p = GpioPin::PULL_NONE; break;
            default: return false;
        }
        hp = true;
    }

    index = n;
    has_pull = hp;
    pull = p;
    return true;
}

bool PinAssignments::parse_function(const std::string& name, PinFunction::KIND_T& kind)
{
    std::string s = stringutils::toLower(name);
    for(auto& f : function_names) {
        if(s == f.name) {
            kind = f.kind;
            return true;
        }
    }
    return false;
}

bool PinAssignments::parse_timer(const std::string& name, PWM_TIMER_T& timer)
{
    std::string s = stringutils::toLower(name);
    for(auto& t : timer_names) {
        if(s == t.name) {
            timer = t.timer;
            return true;
        }
    }
    return false;
}

bool PinAssignments::parse_edge(const std::string& name, GpioPin::EDGE_T& edge)
{
    std::string s = stringutils::toLower(name);
    if(s == "falling") edge = GpioPin::FALLING_EDGE;
    else if(s == "rising") edge = GpioPin::RISING_EDGE;
    else if(s == "either") edge = GpioPin::EITHER_EDGE;
    else return false;
    return true;
}

bool PinAssignments::configure(ConfigReader& cr, GpioPort& port)
{
    ConfigReader::sub_section_map_t ssmap;
    if(!cr.get_sub_sections(gpio_section, ssmap)) {
        printf("WARNING: configure-gpio: no gpio section found\n");
        return true;
    }

    bool ok = true;
    for(auto& i : ssmap) {
        const std::string& name = i.first;
        auto& m = i.second;
        if(!cr.get_bool(m, enable_key, true)) continue;

        if(!configure_entry(cr, port, name, m)) {
            printf("ERROR: configure-gpio: %s not configured\n", name.c_str());
            ok = false;
        }
    }

    return ok;
}

// everything is validated before the pin is touched
bool PinAssignments::configure_entry(ConfigReader& cr, GpioPort& port, const std::string& name, const std::map<std::string, std::string>& m)
{
    std::string spec = cr.get_string(m, pin_key, "nc");
    int index;
    bool has_pull;
    GpioPin::PULL_T pull;
    if(!parse_pin_spec(spec, index, has_pull, pull)) {
        printf("ERROR: configure-gpio: %s has an invalid pin: %s\n", name.c_str(), spec.c_str());
        return false;
    }

    PinFunction::KIND_T kind;
    std::string fn = cr.get_string(m, function_key, "");
    if(!parse_function(fn, kind)) {
        printf("ERROR: configure-gpio: %s has an unknown function: %s\n", name.c_str(), fn.c_str());
        return false;
    }

    PinFunction f(kind);
    if(kind == PinFunction::PWM_OUTPUT) {
        PWM_TIMER_T timer;
        std::string t = cr.get_string(m, timer_key, "");
        if(!parse_timer(t, timer)) {
            printf("ERROR: configure-gpio: %s needs a valid timer, got: %s\n", name.c_str(), t.c_str());
            return false;
        }
        f = PinFunction::pwm(timer);
    }

    bool has_edge = m.find(edge_key) != m.end();
    GpioPin::EDGE_T edge = GpioPin::EITHER_EDGE;
    if(has_edge) {
        std::string e = cr.get_string(m, edge_key, "");
        if(!parse_edge(e, edge)) {
            printf("ERROR: configure-gpio: %s has an unknown edge: %s\n", name.c_str(), e.c_str());
            return false;
        }
        if(!f.is_input()) {
            printf("ERROR: configure-gpio: %s edge needs an input function\n", name.c_str());
            return false;
        }
    }

    GpioPin *pin = port.get_pin(index);
    if(pin == nullptr) return false;

    for(auto& a : assigned) {
        // a repeat configure re-applies its own claims
        if(a.second == pin && a.first != name) {
            printf("ERROR: configure-gpio: DIO%d is already claimed by %s\n", index, a.first.c_str());
            return false;
        }
    }

    pin->configure_for(f);
    if(has_pull) pin->set_floating_state(pull);
    if(has_edge) pin->enable_interrupt(edge);

    assigned[name] = pin;
    return true;
}

GpioPin *PinAssignments::lookup(const char *name) const
{
    auto i = assigned.find(name);
    if(i == assigned.end()) return nullptr;
    return i->second;
}
