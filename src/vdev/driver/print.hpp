#pragma once

#include <string>

#include "vdev/common/diagnostic.hpp"

namespace vdev::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintNote(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace vdev::driver
