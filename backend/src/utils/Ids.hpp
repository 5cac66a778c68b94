#pragma once
#include <string>

// Simple unique ID generator (timestamp + random bits)
std::string generateID();
