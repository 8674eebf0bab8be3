//! # Todo Driver Interface
//!
//! `todo_main()` dispatches to the appropriate command handler based on the
//! first argument that is not a global option.

#pragma once

#include <ostream>

// Main entry point, writing to std::cout and std::cerr
int todo_main(int argc, char* argv[]);

// Same, with the user-facing and usage-error streams supplied by the caller
int todo_main(int argc, char* argv[], std::ostream& out, std::ostream& err);
