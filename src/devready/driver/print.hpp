#pragma once

#include <string>

#include "devready/common/diagnostic.hpp"

namespace devready::driver {

// Styling of stderr messages; on by default.
void SetColorEnabled(bool enabled);

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace devready::driver
