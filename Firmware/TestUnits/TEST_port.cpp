#include "unity.h"
#include "TestRegistry.h"

#include <vector>
#include <functional>

#include "GpioPort.h"
#include "GpioPin.h"
#include "GpioClient.h"
#include "IrqLine.h"
#include "ioc_regs.h"
#include "SimulatedSoc.h"

// records the order clients fire in, and optionally runs something from inside fired()
class RecordingClient : public GpioClient
{
public:
    RecordingClient(std::vector<int>& order, int id) : order(order), id(id) {}
    void fired() override
    {
        order.push_back(id);
        if(on_fired) on_fired();
    }

    std::function<void(void)> on_fired;

private:
    std::vector<int>& order;
    int id;
};

TEST_DECLARE(Port)
    SimulatedSoc soc;
    NvicIrqLine irq{soc, GPIO_EDGE_IRQn};
    GpioPort port{soc, irq};
    std::vector<int> order;
TEST_END_DECLARE

TEST_SETUP(Port)
{
    soc.reset();
    order.clear();
    for (int i = 0; i < GpioPort::num_pins; ++i) {
        port.get_pin(i)->set_client(nullptr);
    }
}

TEST_TEARDOWN(Port)
{
    for (int i = 0; i < GpioPort::num_pins; ++i) {
        port.get_pin(i)->set_client(nullptr);
    }
}

REGISTER_TESTF(Port, get_pin_bounds)
{
    TEST_ASSERT_NOT_NULL(port.get_pin(0));
    TEST_ASSERT_NOT_NULL(port.get_pin(31));
    TEST_ASSERT_NULL(port.get_pin(32));
    TEST_ASSERT_NULL(port.get_pin(-1));
    TEST_ASSERT_NULL(port.get_pin(1000));
    TEST_ASSERT_EQUAL_PTR(port.get_pin(7), port.get_pin(7));
}

REGISTER_TESTF(Port, dispatch_in_pin_order)
{
    RecordingClient c2(order, 2), c9(order, 9);
    port.get_pin(9)->set_client(&c9);
    port.get_pin(2)->set_client(&c2);

    // pin 5 has no client
    uint32_t flags = (1UL << 2) | (1UL << 5) | (1UL << 9);
    soc.latch_event(flags);
    soc.clear_log();

    port.handle_interrupt();

    TEST_ASSERT_EQUAL_INT(2, order.size());
    TEST_ASSERT_EQUAL_INT(2, order[0]);
    TEST_ASSERT_EQUAL_INT(9, order[1]);

    // only those three are written to the clear register
    int w = soc.find_write(GPIO_REG(GPIO_O_EVFLAGS31_0));
    TEST_ASSERT_TRUE(w >= 0);
    TEST_ASSERT_EQUAL_HEX32(flags, soc.get_log()[w].value);
    TEST_ASSERT_EQUAL_INT(-1, soc.find_write(GPIO_REG(GPIO_O_EVFLAGS31_0), w + 1));
    TEST_ASSERT_EQUAL_HEX32(0, soc.get_evflags());
}

REGISTER_TESTF(Port, evflags_cleared_with_the_snapshot)
{
    soc.latch_event((1UL << 0) | (1UL << 31));
    soc.clear_log();

    port.handle_interrupt();

    // one read, then the same value written back before anything else
    const auto& log = soc.get_log();
    TEST_ASSERT_TRUE(log.size() >= 2);
    TEST_ASSERT_FALSE(log[0].write);
    TEST_ASSERT_EQUAL_HEX32(GPIO_REG(GPIO_O_EVFLAGS31_0), log[0].addr);
    TEST_ASSERT_TRUE(log[1].write);
    TEST_ASSERT_EQUAL_HEX32(GPIO_REG(GPIO_O_EVFLAGS31_0), log[1].addr);
    TEST_ASSERT_EQUAL_HEX32(log[0].value, log[1].value);
    TEST_ASSERT_EQUAL_HEX32(0, soc.get_evflags());
}

REGISTER_TESTF(Port, irq_rearmed_after_clients)
{
    RecordingClient c3(order, 3), c30(order, 30);
    port.get_pin(3)->set_client(&c3);
    port.get_pin(30)->set_client(&c30);

    // log position when each client ran
    std::vector<size_t> when;
    c3.on_fired = [&]() { when.push_back(soc.get_log().size()); };
    c30.on_fired = [&]() { when.push_back(soc.get_log().size()); };

    // the vector disables the line before calling the port
    irq.disable();
    soc.latch_event((1UL << 3) | (1UL << 30));
    soc.clear_log();

    port.handle_interrupt();

    TEST_ASSERT_EQUAL_INT(2, when.size());
    int icpr = soc.find_write(NVIC_ICPR0);
    int iser = soc.find_write(NVIC_ISER0);
    TEST_ASSERT_TRUE(icpr >= 0);
    TEST_ASSERT_TRUE(iser > icpr);
    TEST_ASSERT_TRUE((size_t)icpr >= when[1]);
    TEST_ASSERT_EQUAL_HEX32(1UL << GPIO_EDGE_IRQn, soc.get_log()[icpr].value);

    TEST_ASSERT_TRUE(soc.nvic_enabled());
    TEST_ASSERT_FALSE(soc.nvic_pending());
}

REGISTER_TESTF(Port, empty_flags_still_rearm)
{
    irq.disable();
    port.handle_interrupt();

    TEST_ASSERT_TRUE(order.empty());
    TEST_ASSERT_TRUE(soc.nvic_enabled());
    TEST_ASSERT_FALSE(soc.nvic_pending());
}

REGISTER_TESTF(Port, replaced_client_gets_the_event)
{
    RecordingClient first(order, 1), second(order, 2);
    port.get_pin(12)->set_client(&first);
    port.get_pin(12)->set_client(&second);

    soc.latch_event(1UL << 12);
    port.handle_interrupt();

    TEST_ASSERT_EQUAL_INT(1, order.size());
    TEST_ASSERT_EQUAL_INT(2, order[0]);
}

REGISTER_TESTF(Port, edge_to_client)
{
    RecordingClient c(order, 13);
    GpioPin *p = port.get_pin(13);
    p->make_digital_input();
    p->set_client(&c);
    p->enable_interrupt(GpioPin::FALLING_EDGE);
    soc.drive_input(13, true);

    // rising edge is not the one asked for
    TEST_ASSERT_EQUAL_HEX32(0, soc.get_evflags());
    TEST_ASSERT_FALSE(soc.nvic_pending());

    soc.drive_input(13, false);
    TEST_ASSERT_EQUAL_HEX32(1UL << 13, soc.get_evflags());
    TEST_ASSERT_TRUE(soc.nvic_pending());

    port.handle_interrupt();
    TEST_ASSERT_EQUAL_INT(1, order.size());
    TEST_ASSERT_EQUAL_HEX32(0, soc.get_evflags());
}

REGISTER_TESTF(Port, edge_on_another_pin_during_drain_survives)
{
    RecordingClient c4(order, 4), c6(order, 6);
    port.get_pin(4)->set_client(&c4);
    port.get_pin(6)->set_client(&c6);
    port.get_pin(6)->make_digital_input();
    port.get_pin(6)->enable_interrupt(GpioPin::RISING_EDGE);

    soc.latch_event(1UL << 4);
    soc.on_evflags_read = [this]() { soc.drive_input(6, true); };
    port.handle_interrupt();
    soc.on_evflags_read = nullptr;

    TEST_ASSERT_EQUAL_INT(1, order.size());
    TEST_ASSERT_EQUAL_INT(4, order[0]);
    TEST_ASSERT_EQUAL_HEX32(1UL << 6, soc.get_evflags());

    // and is handled by the next interrupt
    port.handle_interrupt();
    TEST_ASSERT_EQUAL_INT(2, order.size());
    TEST_ASSERT_EQUAL_INT(6, order[1]);
    TEST_ASSERT_EQUAL_HEX32(0, soc.get_evflags());
}

REGISTER_TESTF(Port, edge_on_same_pin_during_drain_is_lost)
{
    RecordingClient c(order, 10);
    GpioPin *p = port.get_pin(10);
    p->make_digital_input();
    p->set_client(&c);
    p->enable_interrupt(GpioPin::EITHER_EDGE);

    soc.drive_input(10, true);
    soc.on_evflags_read = [this]() { soc.drive_input(10, false); };
    port.handle_interrupt();
    soc.on_evflags_read = nullptr;

    // two edges, one callback, nothing left over
    TEST_ASSERT_EQUAL_INT(1, order.size());
    TEST_ASSERT_EQUAL_HEX32(0, soc.get_evflags());
}

REGISTER_TESTF(Port, edge_caused_by_client_stays_pending)
{
    RecordingClient c1(order, 1);
    GpioPin *p1 = port.get_pin(1);
    p1->make_digital_input();
    p1->set_client(&c1);
    p1->enable_interrupt(GpioPin::EITHER_EDGE);

    // the client wiggles its own line, as if it had written to a device looped back to it
    bool level = false;
    c1.on_fired = [&]() { level = !level; soc.drive_input(1, level); };

    soc.drive_input(1, true);
    level = true;
    port.handle_interrupt();

    TEST_ASSERT_EQUAL_INT(1, order.size());
    TEST_ASSERT_EQUAL_HEX32(1UL << 1, soc.get_evflags());
    TEST_ASSERT_TRUE(soc.nvic_enabled());
    // the latched flag keeps the line asserted through clear_pending
    TEST_ASSERT_TRUE(soc.nvic_pending());

    c1.on_fired = nullptr;
    port.handle_interrupt();
    TEST_ASSERT_EQUAL_INT(2, order.size());
    TEST_ASSERT_EQUAL_HEX32(0, soc.get_evflags());
    TEST_ASSERT_FALSE(soc.nvic_pending());
}

REGISTER_TEST(PortTest, nvic_line_banks)
{
    SimulatedSoc soc;
    NvicIrqLine l0(soc, 0);
    NvicIrqLine l5(soc, 5);
    NvicIrqLine l33(soc, 33);

    l5.enable();
    TEST_ASSERT_EQUAL_HEX32(NVIC_ISER0, soc.get_log().back().addr);
    TEST_ASSERT_EQUAL_HEX32(1UL << 5, soc.get_log().back().value);

    l33.disable();
    TEST_ASSERT_EQUAL_HEX32(NVIC_ICER0 + 4, soc.get_log().back().addr);
    TEST_ASSERT_EQUAL_HEX32(1UL << 1, soc.get_log().back().value);

    l0.clear_pending();
    TEST_ASSERT_EQUAL_HEX32(NVIC_ICPR0, soc.get_log().back().addr);
    TEST_ASSERT_EQUAL_HEX32(1UL, soc.get_log().back().value);
    TEST_ASSERT_EQUAL_INT(33, l33.get_irqn());
}
