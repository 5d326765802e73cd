#ifndef MULTIDEPLOY_VERSION_HPP
#define MULTIDEPLOY_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define MULTIDEPLOY_VERSION_MAJOR 0
#define MULTIDEPLOY_VERSION_MINOR 3
#define MULTIDEPLOY_VERSION_PATCH 0

/*
 * Rolling release tag injected by the CI workflow.
 * Example format: "2025.07.31-1".
 */
#define MULTIDEPLOY_VERSION_STR "rolling"
/* ------------------------------------------------------------------ */

/* Human-friendly version string, also sent as the HTTP User-Agent */
constexpr const char* MULTIDEPLOY_VERSION = MULTIDEPLOY_VERSION_STR;

#endif /* MULTIDEPLOY_VERSION_HPP */
