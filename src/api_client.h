#ifndef _API_CLIENT_H_
#define _API_CLIENT_H_

#include "config.h"
#include "position.h"
#include "url_builder.h"

#include <functional>
#include <string>
#include <wx/string.h>

class wxJSONValue;

enum FetchStatus {
    FETCH_OK,          // HTTP 200, body holds the report
    FETCH_NOT_FOUND,   // provider answered with another status
    FETCH_FAILED       // transport error, nothing to fall back on
};

// GET url. api_key, when non-empty, is sent as a bearer token. Returns
// false only if the request could not be performed; any HTTP status is
// reported through http_code.
bool HttpGet(const std::string &url, const wxString &api_key,
             wxString &body, long &http_code, wxString &error_msg);

FetchStatus FetchReport(ReportKind kind, const wxString &location,
                        const Secrets &secrets, wxString &body,
                        wxString &error_msg);

// Coordinates of `location`, then the closest reporting station to them.
bool ResolveNearestStation(const wxString &location, const Secrets &secrets,
                           wxString &icao, wxString &error_msg);

// True if the provider knows the station.
bool CheckIcaoCode(const wxString &icao, const Secrets &secrets);

// Approximate position of this machine from its public IP address.
bool GetGeoIp(LatLong &out, wxString &error_msg);

// The location part of a report URL: ICAO code or "lat,lon". GeoIP
// positions are resolved here.
bool LocationString(const Position &position, wxString &out,
                    wxString &error_msg);

typedef std::function<FetchStatus(const wxString &location, wxString &body,
                                  wxString &error_msg)> ReportFetcher;
typedef std::function<bool(wxString &icao, wxString &error_msg)> StationResolver;

// Fetch for location. If the provider has no report there, resolve the
// nearest station and fetch exactly once more. Transport failures are
// not retried.
bool FetchWithFallback(const wxString &location, const ReportFetcher &fetch,
                       const StationResolver &resolve, wxString &body,
                       wxString &error_msg);

// Fetch and parse the report for config.position.
bool RequestReport(ReportKind kind, const Config &config,
                   const Secrets &secrets, wxJSONValue &report,
                   wxString &error_msg);

#endif // _API_CLIENT_H_
