#include "fatal.h"

#include <stdio.h>
#include <stdlib.h>

void fatal_error(const char *msg)
{
    printf("FATAL: %s\n", msg);
    fflush(stdout);

#if defined(__arm__)
    __asm("bkpt #0");
    for(;;) ;
#else
    abort();
#endif
}
