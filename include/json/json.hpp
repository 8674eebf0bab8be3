//! # todo JSON Library
//!
//! Umbrella header for the JSON support used by the storage file codec and
//! the JSON log format.
//!
//! | Header | Description |
//! |--------|-------------|
//! | `json_error.hpp` | Parse error with line/column |
//! | `json_value.hpp` | `JsonValue`, `JsonNumber`, factory functions |
//! | `json_parser.hpp` | `parse_json()` |
//!
//! Serialization is provided by `JsonValue::to_string()`.

#pragma once

#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include "json/json_parser.hpp"
