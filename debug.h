/*
 * Debug level support for Tower
 * Provides fine-grained wire tracing with the dprintf macro
 */

#ifndef __TOWER_DEBUG_H
#define __TOWER_DEBUG_H

#include "logger.h"
#include <cstdio>

// Global debug level variable (defined per executable)
extern int g_debug_level;

#define dprintf(level,format,args...) \
	do { \
		if (g_debug_level >= level) { \
			fprintf(stderr, "[DEBUG] %s(%d) %s: " format "\n",__FILE__,__LINE__, __FUNCTION__, ## args); \
		} \
	} while(0)

#endif /* __TOWER_DEBUG_H */
