//! # CLI Utilities Interface
//!
//! | Function          | Description            |
//! |-------------------|------------------------|
//! | `print_usage()`   | Print CLI help text    |
//! | `print_version()` | Print packager version |

#pragma once

namespace pypack::cli {

// Help text
void print_usage();
void print_version();

} // namespace pypack::cli
