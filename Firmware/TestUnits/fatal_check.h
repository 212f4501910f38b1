#pragma once

#include <stdio.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <functional>

// Runs fnc in a child process, true if it ended in fatal_error(), which aborts on a host build
static inline bool is_fatal(std::function<void(void)> fnc)
{
    fflush(stdout);
    pid_t pid = fork();
    if(pid < 0) return false;

    if(pid == 0) {
        fnc();
        _exit(0);
    }

    int status;
    if(waitpid(pid, &status, 0) != pid) return false;
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}
