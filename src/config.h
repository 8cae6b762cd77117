#ifndef _CONFIG_H_
#define _CONFIG_H_

#include "position.h"

#include <wx/datetime.h>
#include <wx/string.h>

// Severity thresholds and the requested position. Built once at startup
// from defaults, the config file and the command line, then only read.
struct Config {
    Position position;

    long cloud_minimum;         // hundreds of ft; at or below is bad
    long cloud_marginal;        // at or below is marginal
    long temp_minimum;          // deg C; at or below is bad
    long spread_minimum;        // deg C temp/dewpoint spread; at or below is bad
    long wind_var_maximum;      // degrees of variability before marginal
    long wind_maximum;          // kt; above is bad
    long gust_maximum;          // kt above mean wind; above is bad
    wxTimeSpan age_maximum;     // observation age; at or above is bad
    wxTimeSpan age_marginal;    // at or above is marginal
    long visibility_minimum;    // metres; at or below is bad
    long visibility_marginal;   // below is marginal

    bool taf_show_change_times;
    wxTimeSpan taf_age_maximum;
    wxTimeSpan taf_age_marginal;

    Config()
        : cloud_minimum(6), cloud_marginal(15),
          temp_minimum(0), spread_minimum(3),
          wind_var_maximum(45), wind_maximum(15), gust_maximum(10),
          age_maximum(wxTimeSpan::Hours(6)), age_marginal(wxTimeSpan::Hours(1)),
          visibility_minimum(1500), visibility_marginal(5000),
          taf_show_change_times(true),
          taf_age_maximum(wxTimeSpan::Hours(12)),
          taf_age_marginal(wxTimeSpan::Hours(6)) {}
};

struct Secrets {
    wxString avwx_api_key;
};

// $HOME/.config/wxfetch/<name>
wxString DefaultConfigDir();
wxString DefaultConfigPath();
wxString DefaultSecretsPath();

// Overlay the INI file at path onto the defaults. A missing file yields
// the defaults; warn_if_missing controls whether that is logged.
Config ReadConfigFile(const wxString &path, bool warn_if_missing);

// Read the provider API key. Missing file or key is an error.
bool ReadSecrets(const wxString &path, Secrets &out, wxString &error_msg);

#endif // _CONFIG_H_
