#pragma once

#include "safecalc/cli_options.hpp"

namespace safecalc {

// Режим генерации выражений консольной утилиты
void runGenerateMode(const CliOptions& options);

} // namespace safecalc
