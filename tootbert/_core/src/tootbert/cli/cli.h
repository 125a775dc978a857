#pragma once

// Argument parsing for the tootbert executable: nested subcommands,
// multi-spelling options, validators and generated --help.

#include "app.h"
#include "errors.h"
#include "formatter.h"
#include "option.h"
#include "types.h"
#include "validators.h"

/// Parses argv inside the calling function; on a cli::Error prints help or
/// the error and returns the exit code from that function.
#define TOOTBERT_PARSE(app, argc, argv)       \
    try {                                     \
        (app).parse(argc, argv);              \
    } catch (const tootbert::cli::Error& e) { \
        return (app).exit(e);                 \
    }
