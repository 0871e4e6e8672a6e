#pragma once

#include <string>

namespace sealdrop::log {

// Info is silent unless SEALDROP_VERBOSE is set (or SetVerbose(true)).
void Info(const std::string& message);
void Warn(const std::string& message);

void SetVerbose(bool verbose);
bool Verbose();

}  // namespace sealdrop::log
