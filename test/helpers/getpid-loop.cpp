/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  getpid-loop
 *
 *      Test helper. Makes lots of cheap syscalls without ever exec'ing, so
 *      that a trace of it should see nothing but its own exec.
 */
#include <cstdlib>
#include <unistd.h>
#include <sys/syscall.h>

int main(int argc, char** argv)
{
    long count = argc > 1 ? strtol(argv[1], nullptr, 10) : 1000;
    for (long i = 0; i < count; ++i)
    {
        syscall(SYS_getpid);
    }
    return 0;
}
