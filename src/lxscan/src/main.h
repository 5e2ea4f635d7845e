#ifndef HEADER_GUARD_LXSCAN_MAIN
#define HEADER_GUARD_LXSCAN_MAIN

// Runs the scanner driver on a null-terminated argument vector.
// Tokens go to stdout, diagnostics to stderr. Returns the exit status.
int lxscan_main(int argc, char const *const *argv);

#endif // HEADER_GUARD_LXSCAN_MAIN
