/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  thread-exec
 *
 *      Test helper. Starts a second thread which execs argv[1] (with the
 *      rest of argv) while the main thread sits in pause(). The kernel has
 *      to kill the main thread and hand its pid over to the one that exec'd.
 */
#include <cstdio>
#include <cstring>
#include <pthread.h>
#include <unistd.h>

static char** execArgv;

static void* exec_from_thread(void*)
{
    execv(execArgv[0], execArgv);
    perror("execv");
    _exit(127);
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        fprintf(stderr, "usage: %s program [args...]\n", argv[0]);
        return 2;
    }
    execArgv = &argv[1];

    pthread_t thread;
    int err = pthread_create(&thread, nullptr, exec_from_thread, nullptr);
    if (err != 0)
    {
        fprintf(stderr, "pthread_create: %s\n", strerror(err));
        return 2;
    }
    for (;;)
    {
        pause();
    }
}
