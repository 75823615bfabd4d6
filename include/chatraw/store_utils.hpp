#pragma once

#include "export.hpp"
#include <string>

namespace chatraw
{

// Random UUID v4, e.g. 3f2b8c1e-9a4d-4c2e-8f1a-0b9e7d6c5a43
CHATRAW_SERVER_API std::string generateUuid();

// Local time as ISO-8601 with microseconds, e.g. 2024-05-01T13:45:12.123456
CHATRAW_SERVER_API std::string currentIsoTimestamp();

} // namespace chatraw
