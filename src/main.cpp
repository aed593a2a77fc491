//! # pypack Entry Point
//!
//! ```bash
//! pypack app.py                    # app.so plus one .so per local import
//! pypack app.py -f exe -o dist     # single-file executable in dist/
//! pypack app.py -f zip --no-deps   # app.zip with only app.py
//! ```
//!
//! All work happens in `pypack_main()` (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return pypack_main(argc, argv);
}
