#include <cstddef>
#include <iostream>
#include <string>

#include "boxpuzzle/app/CommandConsole.hpp"
#include "boxpuzzle/app/GeneratorConfig.hpp"

namespace
{
void FlushLog(boxpuzzle::app::CommandConsole& console)
{
    for (const std::string& line : console.GetLog())
    {
        if (line.rfind("Error: ", 0) == 0)
        {
            std::cerr << line << "\n";
        }
        else
        {
            std::cout << line << "\n";
        }
    }
    console.ClearLog();
}
} // namespace

// boxgen split 4 2 3 5 42
// boxgen < commands.txt
int main(int argc, char** argv)
{
    boxpuzzle::app::GeneratorConfig config;
    if (!config.Load())
    {
        std::cerr << "[Config] " << config.GetStatus() << "\n";
    }

    boxpuzzle::app::CommandConsole console(config);

    if (argc > 1)
    {
        std::string commandLine;
        for (int i = 1; i < argc; ++i)
        {
            if (i > 1)
            {
                commandLine += ' ';
            }
            commandLine += argv[i];
        }
        const bool ok = console.Execute(commandLine);
        FlushLog(console);
        return ok ? 0 : 1;
    }

    std::size_t failures = 0;
    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty() || line.front() == '#')
        {
            continue;
        }
        if (!console.Execute(line))
        {
            ++failures;
        }
        FlushLog(console);
    }
    if (failures > 0)
    {
        std::cerr << "[Console] " << failures << " command(s) failed\n";
    }
    return failures == 0 ? 0 : 1;
}
