#ifndef SPECFLOW_VERSION_HPP
#define SPECFLOW_VERSION_HPP

#define SPECFLOW_VERSION_MAJOR 0
#define SPECFLOW_VERSION_MINOR 3
#define SPECFLOW_VERSION_PATCH 0

/*
 * Release tag injected by the packaging step.
 * Example format: "0.3.0" or "2026.10.01-1".
 */
#define SPECFLOW_VERSION_STR "0.3.0"

constexpr const char* SPECFLOW_VERSION = SPECFLOW_VERSION_STR;

#endif /* SPECFLOW_VERSION_HPP */
