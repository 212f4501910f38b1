#pragma once

// Implemented by whoever wants to be told about an edge on a pin.
// fired() is called in the GPIO interrupt context and must not block.
class GpioClient
{
public:
    virtual ~GpioClient() {};
    virtual void fired() = 0;
};
