#ifndef _URL_BUILDER_H_
#define _URL_BUILDER_H_

// Pure URL-building utilities, no wx or curl dependencies, so they can be
// unit-tested on their own.

#include <iomanip>
#include <locale>
#include <sstream>
#include <string>

#define AVWX_API_BASE "https://avwx.rest/api"
#define GEOIP_URL     "http://ip-api.com/json/"

enum ReportKind { REPORT_METAR, REPORT_TAF };

inline const char *ReportKindPath(ReportKind kind) {
    return kind == REPORT_TAF ? "taf" : "metar";
}

// Format a double with period decimal separator regardless of system locale.
inline std::string FmtDbl(double d) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(4) << d;
    return oss.str();
}

// location is an ICAO code or "lat,lon". The provider substitutes the
// nearest station itself when it can.
inline std::string BuildReportUrl(ReportKind kind, const std::string &location) {
    return std::string(AVWX_API_BASE) + "/" + ReportKindPath(kind) + "/" +
           location + "?onfail=nearest&options=info";
}

inline std::string BuildStationUrl(const std::string &icao) {
    return std::string(AVWX_API_BASE) + "/station/" + icao;
}

inline std::string BuildStationCoordsUrl(const std::string &location) {
    return BuildStationUrl(location) + "?filter=latitude,longitude";
}

// Closest station that currently issues reports.
inline std::string BuildNearestStationUrl(double lat, double lon) {
    return std::string(AVWX_API_BASE) + "/station/near/" + FmtDbl(lat) + "," +
           FmtDbl(lon) + "?n=1&reporting=true";
}

inline std::string BuildAuthHeader(const std::string &api_key) {
    return "Authorization: BEARER " + api_key;
}

#endif // _URL_BUILDER_H_
