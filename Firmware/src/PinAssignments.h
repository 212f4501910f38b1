#pragma once

#include <map>
#include <string>

#include "GpioPin.h"
#include "PinFunction.h"

class ConfigReader;
class GpioPort;

// Claims pins for named roles from the [gpio] section of the config, eg
//   led.pin = dio7
//   led.function = output
//   button.pin = dio13^
//   button.function = input
//   button.edge = falling
class PinAssignments
{
public:
    PinAssignments() {};

    // returns false if any entry was rejected, the valid entries are applied regardless
    bool configure(ConfigReader& cr, GpioPort& port);

    // the pin claimed under name, nullptr if there is none
    GpioPin *lookup(const char *name) const;
    size_t size() const { return assigned.size(); }

    // pin spec is dioN, gpioN or N with an optional modifier, ^ pull up, v pull down, - no pull
    static bool parse_pin_spec(const std::string& spec, int& index, bool& has_pull, GpioPin::PULL_T& pull);
    static bool parse_function(const std::string& name, PinFunction::KIND_T& kind);
    static bool parse_timer(const std::string& name, PWM_TIMER_T& timer);
    static bool parse_edge(const std::string& name, GpioPin::EDGE_T& edge);

private:
    bool configure_entry(ConfigReader& cr, GpioPort& port, const std::string& name, const std::map<std::string, std::string>& m);

    std::map<std::string, GpioPin*> assigned;
};
