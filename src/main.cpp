//! # todo Entry Point
//!
//! A personal command-line todo list kept in `~/.todo/todo.json`.
//!
//! ## Usage
//!
//! ```bash
//! todo init                   # Create ~/.todo
//! todo new "Walk the dog"     # Add an item
//! todo complete 1             # Mark item 1 as done
//! todo list --all --verbose   # Show every item with timestamps
//! ```
//!
//! All work happens in `todo_main()` (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return todo_main(argc, argv);
}
