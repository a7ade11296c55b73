/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  fork-exec
 *
 *      Test helper. Forks a child that adds one environment variable and
 *      then execs argv[1] (with the rest of argv), while the parent waits.
 *      Exits with whatever the child exited with.
 */
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <sys/wait.h>

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        fprintf(stderr, "usage: %s program [args...]\n", argv[0]);
        return 2;
    }

    pid_t child = fork();
    if (child == -1)
    {
        perror("fork");
        return 2;
    }
    if (child == 0)
    {
        setenv("EXECTRACE_TEST_CHILD", "1", 1);
        execv(argv[1], &argv[1]);
        perror("execv");
        _exit(127);
    }

    int status;
    pid_t waited;
    do
    {
        waited = waitpid(child, &status, 0);
    }
    while (waited == -1 && errno == EINTR);
    if (waited == -1)
    {
        perror("waitpid");
        return 2;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : 1;
}
