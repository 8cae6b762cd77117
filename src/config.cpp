#include "config.h"

#include <wx/fileconf.h>
#include <wx/filefn.h>
#include <wx/log.h>
#include <wx/utils.h>

wxString DefaultConfigDir() {
    return wxGetHomeDir() + wxFILE_SEP_PATH + wxT(".config") +
           wxFILE_SEP_PATH + wxT("wxfetch");
}

wxString DefaultConfigPath() {
    return DefaultConfigDir() + wxFILE_SEP_PATH + wxT("config.ini");
}

wxString DefaultSecretsPath() {
    return DefaultConfigDir() + wxFILE_SEP_PATH + wxT("secrets.ini");
}

static wxTimeSpan ReadSeconds(wxFileConfig &conf, const wxString &key,
                              const wxTimeSpan &def) {
    long seconds = 0;
    if (!conf.Read(key, &seconds)) return def;
    return wxTimeSpan::Seconds(seconds);
}

Config ReadConfigFile(const wxString &path, bool warn_if_missing) {
    Config config;
    if (path.IsEmpty() || !wxFileExists(path)) {
        if (warn_if_missing)
            wxLogWarning("WxFetch: could not open config file at %s, proceeding with defaults", path);
        else
            wxLogVerbose("WxFetch: no config file at %s, using defaults", path);
        return config;
    }

    wxFileConfig conf(wxEmptyString, wxEmptyString, path, wxEmptyString,
                      wxCONFIG_USE_LOCAL_FILE);

    // an airfield wins over a coordinate, as on the command line
    wxString airfield;
    double lat = 0, lon = 0;
    if (conf.Read(wxT("/position/airfield"), &airfield) && !airfield.IsEmpty())
        config.position = Position::Airfield(airfield.Upper());
    else if (conf.Read(wxT("/position/lat"), &lat) &&
             conf.Read(wxT("/position/lon"), &lon))
        config.position = Position::Coordinates(lat, lon);

    conf.Read(wxT("/clouds/cloud_minimum"), &config.cloud_minimum, config.cloud_minimum);
    conf.Read(wxT("/clouds/cloud_marginal"), &config.cloud_marginal, config.cloud_marginal);

    conf.Read(wxT("/temperature/temp_minimum"), &config.temp_minimum, config.temp_minimum);
    conf.Read(wxT("/temperature/spread_minimum"), &config.spread_minimum, config.spread_minimum);

    conf.Read(wxT("/wind/wind_var_maximum"), &config.wind_var_maximum, config.wind_var_maximum);
    conf.Read(wxT("/wind/wind_maximum"), &config.wind_maximum, config.wind_maximum);
    conf.Read(wxT("/wind/gust_maximum"), &config.gust_maximum, config.gust_maximum);

    config.age_maximum  = ReadSeconds(conf, wxT("/age/age_maximum"), config.age_maximum);
    config.age_marginal = ReadSeconds(conf, wxT("/age/age_marginal"), config.age_marginal);

    conf.Read(wxT("/visibility/visibility_minimum"), &config.visibility_minimum, config.visibility_minimum);
    conf.Read(wxT("/visibility/visibility_marginal"), &config.visibility_marginal, config.visibility_marginal);

    conf.Read(wxT("/taf/show_change_times"), &config.taf_show_change_times, config.taf_show_change_times);
    config.taf_age_maximum  = ReadSeconds(conf, wxT("/taf/age_maximum"), config.taf_age_maximum);
    config.taf_age_marginal = ReadSeconds(conf, wxT("/taf/age_marginal"), config.taf_age_marginal);

    wxLogVerbose("WxFetch: loaded config from %s", path);
    return config;
}

bool ReadSecrets(const wxString &path, Secrets &out, wxString &error_msg) {
    if (!wxFileExists(path)) {
        error_msg = wxT("Could not load secret keys.");
        wxLogError("WxFetch: secrets file %s not found", path);
        return false;
    }

    wxFileConfig conf(wxEmptyString, wxEmptyString, path, wxEmptyString,
                      wxCONFIG_USE_LOCAL_FILE);
    if (!conf.Read(wxT("/avwx/api_key"), &out.avwx_api_key) ||
        out.avwx_api_key.IsEmpty()) {
        error_msg = wxT("Could not load secret keys.");
        wxLogError("WxFetch: no [avwx] api_key in %s", path);
        return false;
    }
    return true;
}
