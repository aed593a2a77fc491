//! # Packager Driver Interface
//!
//! `pypack_main()` parses the command line, runs one packaging request and
//! returns the process exit code.

#pragma once

int pypack_main(int argc, char* argv[]);
