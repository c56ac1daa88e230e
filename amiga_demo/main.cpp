#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>

#include "animation.hpp"
#include "terminal.hpp"

int main()
{
    if (!installStopHandlers())
    {
        std::cerr << "Error installing signal handlers: " << std::strerror(errno) << "\n";
        return 1;
    }

    DemoConfig config = defaultConfig();

    try
    {
        return runDemo(config, std::cout, terminalHooks(config));
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
