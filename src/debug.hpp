#pragma once

/* progress messages on stderr, set from BACNET_DEBUG */
extern bool bacnet_debug_enabled;
