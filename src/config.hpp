#pragma once

/*here you can choose the compile-time defaults of the miner*/

#define MM_SPLIT_WORD 1
#define MM_SPLIT_CHAR 2

#ifndef MM_DEFAULT_SPLIT
#define MM_DEFAULT_SPLIT MM_SPLIT_CHAR
#endif

#ifndef MM_DEFAULT_RATE_MS
#define MM_DEFAULT_RATE_MS 250
#endif

#ifndef MM_DEFAULT_MANTRA
#define MM_DEFAULT_MANTRA "om mani padme hum"
#endif

#ifndef MM_RC_NAME
#define MM_RC_NAME ".mminerrc"
#endif

#ifndef MM_DEFAULT_LOG_FILE
#define MM_DEFAULT_LOG_FILE "mminer.log"
#endif

// longest accepted interval between units: one day
#define MM_MAX_RATE_MS 86400000LL

#define MM_UI_REFRESH_MS 100
