#pragma once

// Single source of truth for the Parley version.
// Reported by both executables at startup and by `parley-client --version`.
#define PARLEY_VERSION_MAJOR  1
#define PARLEY_VERSION_MINOR  0
#define PARLEY_VERSION_PATCH  0
#define PARLEY_VERSION_STRING "1.0.0"
