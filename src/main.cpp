#include "api_client.h"
#include "cli.h"
#include "config.h"
#include "metar.h"
#include "taf.h"

#include <curl/curl.h>
#include <wx/crt.h>
#include <wx/init.h>
#include <wx/jsonval.h>
#include <wx/log.h>

static void ResolveConfig(const CommandLineArgs &args, const Secrets &secrets,
                          Config &config) {
    bool explicit_path = !args.config_file.IsEmpty();
    config = ReadConfigFile(explicit_path ? args.config_file : DefaultConfigPath(),
                            explicit_path);
    ApplyPositionOverrides(args, config);

    if (config.position.kind == POSITION_AIRFIELD &&
        !CheckIcaoCode(config.position.icao, secrets)) {
        wxLogWarning("WxFetch: invalid airfield %s, defaulting to GeoIP",
                     config.position.icao);
        config.position = Position::GeoIP();
    }
}

static bool GetWeather(const CommandLineArgs &args, wxString &out,
                       wxString &error_msg) {
    Secrets secrets;
    if (!ReadSecrets(DefaultSecretsPath(), secrets, error_msg)) return false;

    Config config;
    ResolveConfig(args, secrets, config);

    ReportKind kind = args.taf ? REPORT_TAF : REPORT_METAR;
    wxJSONValue report;
    if (!RequestReport(kind, config, secrets, report, error_msg)) return false;

    if (kind == REPORT_TAF) {
        Taf taf;
        if (!ParseTaf(report, config, taf, error_msg)) return false;
        out = RenderTaf(taf, config);
    } else {
        Metar metar;
        if (!ParseMetar(report, config, metar, error_msg)) return false;
        out = RenderMetar(metar, config);
    }
    return true;
}

int main(int argc, char **argv) {
    wxInitializer initializer(argc, argv);
    if (!initializer.IsOk()) {
        wxFprintf(stderr, wxT("WxFetch: failed to initialize wxWidgets\n"));
        return 1;
    }
    delete wxLog::SetActiveTarget(new wxLogStderr());

    CommandLineArgs args;
    int exit_code = 0;
    if (!ParseCommandLine(argc, argv, args, exit_code)) return exit_code;
    wxLog::SetVerbose(args.verbose);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    wxString out, error_msg;
    bool ok = GetWeather(args, out, error_msg);
    curl_global_cleanup();

    if (!ok) {
        wxLogError("WxFetch: %s", error_msg);
        return 1;
    }
    wxPrintf(wxT("%s\n"), out);
    return 0;
}
