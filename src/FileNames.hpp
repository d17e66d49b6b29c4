#pragma once

#include <string>
#include <string_view>

/// One safe path component: letters, digits, '.', '-' and '_' are kept,
/// everything else becomes '_'. Never empty, "." or "..".
std::string SanitizeForFilename(std::string_view s);
