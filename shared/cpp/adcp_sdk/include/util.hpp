#pragma once
#include <string>

std::string getenv_or(const char* key, const std::string& def);
// Positive integer from the environment; falls back to def (with a warning) when unset, malformed or < 1.
long getenv_positive(const char* key, long def);
bool is_blank(const std::string& s);
std::string trim(const std::string& s);
// Random UUID v4, lowercase 8-4-4-4-12.
std::string gen_uuid();
