#pragma once

// process exit statuses, one per failure class
enum ExitCode : int {
    EXIT_OK             = 0,
    EXIT_USAGE          = 1, // bad arguments or option values
    EXIT_OPEN_FAILED    = 2, // input file can't be opened
    EXIT_MULTIPLE_FILES = 3, // more than one input file given
    EXIT_READ_ERROR     = 4, // read() failed mid-stream
    EXIT_EMPTY_READ     = 5, // read returned nothing but didn't signal EOF
    EXIT_UNREACHABLE    = 6, // internal invariant violated
    EXIT_CHECK_FAILED   = 7, // "check": at least one number is invalid
    EXIT_SELFTEST       = 8,
};
