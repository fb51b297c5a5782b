#include "PingCommandProber.hpp"

#include <cstdio>
#include <string>
#include <sys/wait.h>

namespace lan_sweep::platform
{
    bool PingCommandProber::IsAlive(common::Address addr, std::chrono::milliseconds timeout)
    {
        // ping -W takes whole seconds.
        long seconds = static_cast<long>((timeout.count() + 999) / 1000);
        if (seconds < 1)
            seconds = 1;

        std::string cmd = "ping -n -q -c 1 -W " + std::to_string(seconds) + " " +
                          common::FormatAddress(addr) + " 2>/dev/null";

        FILE *pipe = popen(cmd.c_str(), "r");
        if (!pipe)
            return false;

        char buffer[256];
        while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
        {
        }

        int status = pclose(pipe);
        if (status == -1)
            return false;
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
}
