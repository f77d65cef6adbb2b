// Globals normally defined by main.cpp / shepherd_main.cpp

// Debug level - off in tests unless a test raises it
int g_debug_level = 0;
