#ifndef UTILS_HPP
#define UTILS_HPP

#include <iostream>
#include <cstdio>
#include <chrono>
#include <string>
#include "protocol.hpp"

// print log
void log(const char *msg);

// print error, never exits
void err(const char *msg);

// print debug info, silent unless enabled
void debug(const char *msg);

void set_debug(bool enabled);
bool debug_enabled();

// one line summary of a raw frame for debug output
std::string get_debug_str(const char *prefix, const uint8_t *buf, size_t len);

#endif
