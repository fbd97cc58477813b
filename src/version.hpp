#pragma once

// Set by the build from the project version.
#ifndef CMDGATE_VERSION
#define CMDGATE_VERSION "1.0.0"
#endif
