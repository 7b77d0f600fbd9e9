#pragma once

#define BI_VERSION_MAJOR 1
#define BI_VERSION_MINOR 0
#define BI_VERSION_PATCH 0

#define BI_STRINGIFY(x) #x
#define BI_TOSTRING(x) BI_STRINGIFY(x)

// "MAJOR.MINOR.PATCH"
#define BI_VERSION_STRING BI_TOSTRING(BI_VERSION_MAJOR) "." BI_TOSTRING(BI_VERSION_MINOR) "." BI_TOSTRING(BI_VERSION_PATCH)

// 10000*MAJOR + 100*MINOR + PATCH
#define BI_VERSION_NUM ((BI_VERSION_MAJOR * 10000) + (BI_VERSION_MINOR * 100) + BI_VERSION_PATCH)
