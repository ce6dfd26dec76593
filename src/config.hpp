#pragma once

/* compile-time defaults; ~/.splitviewrc overrides the runtime ones */

#ifndef SV_DEFAULT_ROOT
#define SV_DEFAULT_ROOT "assets"
#endif

#ifndef SV_LOG_FILE
#define SV_LOG_FILE "viewer_debug.log"
#endif

#define SV_RC_NAME ".splitviewrc"
#define SV_TITLE "splitview"

#define SV_SIDEBAR_PERCENT 30
#define SV_SIDEBAR_MIN_PERCENT 10
#define SV_SIDEBAR_MAX_PERCENT 90

#define SV_TAB_WIDTH 4

// larger files are shown up to this many bytes
#define SV_MAX_FILE_BYTES (8u << 20)
