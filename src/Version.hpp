#pragma once

// Normally defined by the build from the project version.
#ifndef MCPIFY_VERSION
#define MCPIFY_VERSION "0.1.0"
#endif
