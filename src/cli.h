#ifndef _CLI_H_
#define _CLI_H_

#include "config.h"

#include <wx/string.h>

struct CommandLineArgs {
    wxString airfield;
    bool has_lat;
    bool has_lon;
    double lat;
    double lon;
    bool taf;
    wxString config_file;   // empty: default location
    bool verbose;

    CommandLineArgs()
        : has_lat(false), has_lon(false), lat(0), lon(0), taf(false),
          verbose(false) {}
};

// Parse argv. Returns false after printing usage (for --help or a
// syntax error); exit_code is then the status to exit with.
bool ParseCommandLine(int argc, char **argv, CommandLineArgs &args,
                      int &exit_code);

// Apply -a / --lat --lon on top of the position read from the config
// file. An airfield wins over coordinates; a lone --lat or --lon only
// warns.
void ApplyPositionOverrides(const CommandLineArgs &args, Config &config);

#endif // _CLI_H_
