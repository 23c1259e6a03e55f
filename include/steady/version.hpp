#pragma once

#define STEADY_VERSION_MAJOR 0
#define STEADY_VERSION_MINOR 3
#define STEADY_VERSION_PATCH 0

#define STEADY_VERSION_CODE \
  ((STEADY_VERSION_MAJOR << 16) | (STEADY_VERSION_MINOR << 8) | (STEADY_VERSION_PATCH))

#define STEADY_VERSION_STRING "0.3.0"
