#pragma once

// report an unreachable state and stop, does not return
void fatal_error(const char *msg) __attribute__ ((noreturn));
