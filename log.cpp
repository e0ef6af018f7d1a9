#include <iostream>

#include "log.h"

static bool debug = false;

const std::string dashed_line(80, '-');

void set_debug(bool enabled)
{
    debug = enabled;
}

bool debug_enabled()
{
    return debug;
}

void debug_print(const std::string& message)
{
    if (debug) std::cout << message << std::endl;
}

void section_start(const std::string& description)
{
    std::cout << description << " ..." << std::endl;
    if (debug) std::cout << dashed_line << std::endl;
}

void section_end()
{
    if (debug) {
        std::cout << "... completed" << std::endl << std::endl;
    } else {
        std::cout << "  ... completed" << std::endl;
    }
}

void warn(const std::string& message)
{
    std::cerr << "Warning: " << message << std::endl;
}
