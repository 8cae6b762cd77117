#include "cli.h"

#include "wxfetch.h"

#include <wx/cmdline.h>
#include <wx/log.h>

static const wxCmdLineEntryDesc CMDLINE_DESC[] = {
    { wxCMD_LINE_SWITCH, "h", "help", "show this help message",
      wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP },
    { wxCMD_LINE_OPTION, "a", "airfield", "ICAO code of an airfield",
      wxCMD_LINE_VAL_STRING, 0 },
    { wxCMD_LINE_OPTION, NULL, "lat", "latitude",
      wxCMD_LINE_VAL_DOUBLE, 0 },
    { wxCMD_LINE_OPTION, NULL, "lon", "longitude",
      wxCMD_LINE_VAL_DOUBLE, 0 },
    { wxCMD_LINE_SWITCH, "t", "taf", "fetch the forecast instead of the observation",
      wxCMD_LINE_VAL_NONE, 0 },
    { wxCMD_LINE_OPTION, "c", "config-file", "path to config.ini",
      wxCMD_LINE_VAL_STRING, 0 },
    { wxCMD_LINE_SWITCH, "v", "verbose", "log requests and decoding steps",
      wxCMD_LINE_VAL_NONE, 0 },
    { wxCMD_LINE_NONE, NULL, NULL, NULL, wxCMD_LINE_VAL_NONE, 0 }
};

bool ParseCommandLine(int argc, char **argv, CommandLineArgs &args,
                      int &exit_code) {
    wxCmdLineParser parser(CMDLINE_DESC, argc, argv);
    parser.SetLogo(wxString::Format(
        wxT("wxfetch %d.%d - aviation weather on the command line"),
        WXFETCH_VERSION_MAJOR, WXFETCH_VERSION_MINOR));

    int res = parser.Parse();
    if (res != 0) {
        // -1: --help was given, > 0: syntax error already reported
        exit_code = res == -1 ? 0 : 1;
        return false;
    }

    parser.Found(wxT("a"), &args.airfield);
    args.has_lat = parser.Found(wxT("lat"), &args.lat);
    args.has_lon = parser.Found(wxT("lon"), &args.lon);
    args.taf = parser.Found(wxT("t"));
    parser.Found(wxT("c"), &args.config_file);
    args.verbose = parser.Found(wxT("v"));
    exit_code = 0;
    return true;
}

void ApplyPositionOverrides(const CommandLineArgs &args, Config &config) {
    if (!args.airfield.IsEmpty()) {
        config.position = Position::Airfield(args.airfield.Upper());
        return;
    }
    if (args.has_lat && args.has_lon) {
        config.position = Position::Coordinates(args.lat, args.lon);
        return;
    }
    if (args.has_lat || args.has_lon)
        wxLogWarning("WxFetch: please provide both latitude and longitude, ignoring coordinate");
}
