#include "debug.hpp"

bool bacnet_debug_enabled = false;
