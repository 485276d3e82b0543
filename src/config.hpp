#pragma once

/*compile-time defaults; ~/.kvviewrc overrides the runtime ones*/

#ifndef KVVIEW_DEFAULT_KEYMODE
#define KVVIEW_DEFAULT_KEYMODE KeyMode::Vim
#endif

#define KVVIEW_RC_NAME ".kvviewrc"

/* milliseconds */
#define KVVIEW_SPINNER_INTERVAL_MS 100
#define KVVIEW_FLASH_MS 2000
#define KVVIEW_DONE_DELAY_MS 2000
#define KVVIEW_IDLE_POLL_MS 100
#define KVVIEW_ESC_DELAY_MS 25

#define KVVIEW_SUBTITLE_MAX_LINES 1
#define KVVIEW_SUGGESTION_LIMIT 8
