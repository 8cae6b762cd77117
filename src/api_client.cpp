#include "api_client.h"

#include "report_json.h"

#include <curl/curl.h>
#include <wx/jsonval.h>
#include <wx/log.h>

static size_t CurlWriteCallback(char *ptr, size_t size, size_t nmemb,
                                void *userdata) {
    std::string *buf = static_cast<std::string *>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string ToStd(const wxString &s) {
    return std::string(s.mb_str(wxConvUTF8));
}

bool HttpGet(const std::string &url, const wxString &api_key,
             wxString &body, long &http_code, wxString &error_msg) {
    wxLogVerbose("WxFetch: GET %s", url.c_str());

    CURL *curl = curl_easy_init();
    if (!curl) {
        error_msg = wxT("Failed to initialize HTTP client");
        wxLogError("WxFetch: failed to initialize curl");
        return false;
    }

    struct curl_slist *headers = NULL;
    if (!api_key.IsEmpty())
        headers = curl_slist_append(headers, BuildAuthHeader(ToStd(api_key)).c_str());

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        error_msg = wxT("Failed to connect to weather service");
        wxLogError("WxFetch: request failed: %s", curl_easy_strerror(res));
        return false;
    }

    wxLogVerbose("WxFetch: HTTP %ld, %zu bytes", http_code, response.size());
    body = wxString::FromUTF8(response.c_str(), response.size());
    return true;
}

FetchStatus FetchReport(ReportKind kind, const wxString &location,
                        const Secrets &secrets, wxString &body,
                        wxString &error_msg) {
    long http_code = 0;
    if (!HttpGet(BuildReportUrl(kind, ToStd(location)), secrets.avwx_api_key,
                 body, http_code, error_msg))
        return FETCH_FAILED;

    if (http_code != 200) {
        wxString excerpt = body.Left(300);
        wxLogVerbose("WxFetch: no report for %s (HTTP %ld): %s", location,
                     http_code, excerpt);
        error_msg = wxString::Format(wxT("Weather service returned HTTP %ld"),
                                     http_code);
        return FETCH_NOT_FOUND;
    }
    return FETCH_OK;
}

// Coordinates may come back as integers when they are whole degrees.
static bool GetCoordinate(const wxJSONValue &obj, const wxString &key,
                          double &out) {
    if (!obj.HasMember(key)) return false;
    wxJSONValue v = obj.ItemAt(key);
    if (v.IsDouble()) { out = v.AsDouble(); return true; }
    long l = 0;
    if (!SafeLong(v, l)) return false;
    out = static_cast<double>(l);
    return true;
}

bool ResolveNearestStation(const wxString &location, const Secrets &secrets,
                           wxString &icao, wxString &error_msg) {
    wxString body;
    long http_code = 0;
    if (!HttpGet(BuildStationCoordsUrl(ToStd(location)), secrets.avwx_api_key,
                 body, http_code, error_msg))
        return false;

    wxJSONValue coords;
    if (!ParseJsonDocument(body, coords, error_msg)) return false;
    double lat = 0, lon = 0;
    if (!GetCoordinate(coords, wxT("latitude"), lat) ||
        !GetCoordinate(coords, wxT("longitude"), lon)) {
        error_msg = wxT("No nearest station found");
        wxLogError("WxFetch: no coordinates for %s", location);
        return false;
    }

    if (!HttpGet(BuildNearestStationUrl(lat, lon), secrets.avwx_api_key,
                 body, http_code, error_msg))
        return false;

    wxJSONValue stations;
    if (!ParseJsonDocument(body, stations, error_msg)) return false;
    if (!stations.IsArray() || stations.Size() == 0) {
        error_msg = wxT("No nearest station found");
        wxLogError("WxFetch: no reporting station near %f,%f", lat, lon);
        return false;
    }

    wxJSONValue first = stations[0];
    wxJSONValue station;
    if (!GetNested(first, wxT("station"), wxT("icao"), station) ||
        !station.IsString()) {
        error_msg = wxT("No nearest station found");
        wxLogError("WxFetch: nearest station has no ICAO code");
        return false;
    }
    icao = station.AsString();
    wxLogVerbose("WxFetch: nearest reporting station is %s", icao);
    return true;
}

bool CheckIcaoCode(const wxString &icao, const Secrets &secrets) {
    wxString body, error_msg;
    long http_code = 0;
    if (!HttpGet(BuildStationUrl(ToStd(icao)), secrets.avwx_api_key, body,
                 http_code, error_msg))
        return false;

    wxJSONValue root;
    if (!ParseJsonDocument(body, root, error_msg)) return false;
    return !root.HasMember(wxT("error"));
}

bool GetGeoIp(LatLong &out, wxString &error_msg) {
    wxString body;
    long http_code = 0;
    if (!HttpGet(GEOIP_URL, wxEmptyString, body, http_code, error_msg))
        return false;

    wxJSONValue root;
    if (!ParseJsonDocument(body, root, error_msg)) return false;

    wxString status;
    if (!GetString(root, wxT("status"), status) || status != wxT("success") ||
        !GetCoordinate(root, wxT("lat"), out.lat) ||
        !GetCoordinate(root, wxT("lon"), out.lon)) {
        error_msg = wxT("Could not get location based on IP. Try supplying "
                        "position instead or check your internet connection.");
        wxLogError("WxFetch: GeoIP lookup failed");
        return false;
    }
    wxLogVerbose("WxFetch: GeoIP position %s", out.ToString());
    return true;
}

bool LocationString(const Position &position, wxString &out,
                    wxString &error_msg) {
    switch (position.kind) {
    case POSITION_AIRFIELD:
        out = position.icao;
        return true;
    case POSITION_LATLONG:
        out = position.latlong.ToString();
        return true;
    case POSITION_GEOIP: {
        LatLong latlong;
        if (!GetGeoIp(latlong, error_msg)) return false;
        out = latlong.ToString();
        return true;
    }
    }
    return false;
}

bool FetchWithFallback(const wxString &location, const ReportFetcher &fetch,
                       const StationResolver &resolve, wxString &body,
                       wxString &error_msg) {
    switch (fetch(location, body, error_msg)) {
    case FETCH_OK:
        return true;
    case FETCH_FAILED:
        return false;
    case FETCH_NOT_FOUND:
        break;
    }

    wxString nearest;
    if (!resolve(nearest, error_msg)) return false;
    wxLogWarning("WxFetch: no report for %s, trying nearest station %s",
                 location, nearest);
    return fetch(nearest, body, error_msg) == FETCH_OK;
}

bool RequestReport(ReportKind kind, const Config &config,
                   const Secrets &secrets, wxJSONValue &report,
                   wxString &error_msg) {
    wxString location;
    if (!LocationString(config.position, location, error_msg)) return false;

    ReportFetcher fetch = [kind, &secrets](const wxString &loc, wxString &body,
                                           wxString &err) {
        return FetchReport(kind, loc, secrets, body, err);
    };
    StationResolver resolve = [&location, &secrets](wxString &icao,
                                                   wxString &err) {
        return ResolveNearestStation(location, secrets, icao, err);
    };

    wxString body;
    if (!FetchWithFallback(location, fetch, resolve, body, error_msg))
        return false;
    return ParseJsonDocument(body, report, error_msg);
}
