#pragma once

#include <string>

void set_debug(bool enabled);
bool debug_enabled();

// prints only when debug is enabled
void debug_print(const std::string& message);

void section_start(const std::string& description);
void section_end();

void warn(const std::string& message);

extern const std::string dashed_line;
