#ifndef INDEXMIRROR_VERSION_HPP
#define INDEXMIRROR_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define INDEXMIRROR_VERSION_MAJOR 0
#define INDEXMIRROR_VERSION_MINOR 3
#define INDEXMIRROR_VERSION_PATCH 0

/*
 * Release tag injected by the packaging job.
 * Example format: "0.3.0" or "2025.07.31-1".
 */
#define INDEXMIRROR_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

constexpr const char* INDEXMIRROR_VERSION = INDEXMIRROR_VERSION_STR;

/// Value sent in the `Server` response header.
constexpr const char* INDEXMIRROR_SERVER_TOKEN = "indexmirror/" INDEXMIRROR_VERSION_STR;

#endif /* INDEXMIRROR_VERSION_HPP */
