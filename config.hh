// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef SCRUB_CONFIG_HH
#define SCRUB_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "pdfscrub"
#define PACKAGE_NAME "pdfscrub"
#define PACKAGE_STRING "pdfscrub 0.4.0"
#define PACKAGE_TARNAME "pdfscrub"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "0.4.0"
#define VERSION "0.4.0"

#define SCRUB_PDF_VERSION "1.7"

#define SCRUB_COPYRIGHT "Copyright 2019-2020 Thinkoid, LLC"

//------------------------------------------------------------------------
// configuration files
//------------------------------------------------------------------------

#define SCRUB_SCRUBRC ".scrubrc"
#define SCRUB_SYSTEM_SCRUBRC "/etc/scrubrc"

//------------------------------------------------------------------------
// defaults
//------------------------------------------------------------------------

// resolution of the raster fallback, in dots per inch
#define SCRUB_RASTER_DPI 300

// pages with fewer extractable characters are treated as scanned
#define SCRUB_SCANNED_THRESHOLD 10

// printable runs shorter than this are ignored by the strings check
#define SCRUB_STRINGS_MIN_LENGTH 4

#endif // SCRUB_CONFIG_HH
