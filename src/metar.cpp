#include "metar.h"

#include "colourise.h"
#include "report_json.h"

#include <algorithm>
#include <cmath>
#include <vector>
#include <wx/jsonval.h>
#include <wx/log.h>

// obj[key]["value"] as an integer.
static bool GetValue(const wxJSONValue &json, const wxString &key, long &out) {
    wxJSONValue v;
    if (!GetNested(json, key, wxT("value"), v)) return false;
    return SafeLong(v, out);
}

bool GetTimestamp(const wxJSONValue &json, const Units &, WxField &out) {
    wxDateTime time;
    if (!GetInstant(json, wxT("time"), time)) return false;
    out = WxField::TimeStamp(time);
    return true;
}

bool GetWinds(const wxJSONValue &json, const Units &units, WxField &out) {
    long direction = 0, speed = 0, gusts = 0;
    if (!GetValue(json, wxT("wind_direction"), direction)) return false;
    if (!GetValue(json, wxT("wind_speed"), speed)) return false;
    if (!GetValue(json, wxT("wind_gust"), gusts)) gusts = 0;
    out = WxField::Wind(direction, speed, gusts, units.wind_speed);
    return true;
}

// Only the extremes of the variable sector are shown. One bad entry
// drops the whole field.
bool GetWindVar(const wxJSONValue &json, const Units &, WxField &out) {
    if (!json.HasMember(wxT("wind_variable_direction"))) return false;
    wxJSONValue arr = json.ItemAt(wxT("wind_variable_direction"));
    if (!arr.IsArray() || arr.Size() == 0) return false;

    std::vector<long> dirs;
    for (int i = 0; i < arr.Size(); i++) {
        wxJSONValue entry = arr[i];
        long dir = 0;
        if (!entry.HasMember(wxT("value")) ||
            !SafeLong(entry[wxT("value")], dir))
            return false;
        dirs.push_back(dir);
    }
    std::sort(dirs.begin(), dirs.end());
    out = WxField::WindVariability(dirs.front(), dirs.back());
    return true;
}

bool GetVisibility(const wxJSONValue &json, const Units &units, WxField &out) {
    long vis = 0;
    if (!GetValue(json, wxT("visibility"), vis)) return false;
    out = WxField::Visibility(vis, units.distance);
    return true;
}

bool GetTemp(const wxJSONValue &json, const Units &units, WxField &out) {
    long temp = 0, dewpoint = 0;
    if (!GetValue(json, wxT("temperature"), temp)) return false;
    if (!GetValue(json, wxT("dewpoint"), dewpoint)) return false;
    out = WxField::Temperature(temp, dewpoint, units.temperature);
    return true;
}

// inHg arrives as 29.92 and is kept as 2992 so both units are integers.
bool GetQnh(const wxJSONValue &json, const Units &units, WxField &out) {
    wxJSONValue v;
    if (!GetNested(json, wxT("altimeter"), wxT("value"), v)) return false;

    long qnh = 0;
    if (v.IsDouble())
        qnh = static_cast<long>(std::floor(v.AsDouble() * 100.0 + 0.5));
    else if (!SafeLong(v, qnh))
        return false;
    out = WxField::Altimeter(qnh, units.pressure);
    return true;
}

bool GetRemarks(const wxJSONValue &json, const Units &, WxField &out) {
    wxString remarks;
    if (!GetString(json, wxT("remarks"), remarks)) return false;
    out = WxField::Remarks(remarks);
    return true;
}

typedef bool (*FieldExtractor)(const wxJSONValue &, const Units &, WxField &);

WxFieldList ExtractFields(const wxJSONValue &json, const Units &units) {
    static const FieldExtractor leading[] = {
        GetTimestamp, GetWinds, GetWindVar, GetVisibility, GetTemp, GetQnh,
    };

    WxFieldList fields;
    WxField field;
    for (size_t i = 0; i < sizeof(leading) / sizeof(leading[0]); i++) {
        if (leading[i](json, units, field)) fields.push_back(field);
    }
    GetWxCodesFromJson(json, fields);
    GetCloudsFromJson(json, fields);
    if (GetRemarks(json, units, field)) fields.push_back(field);
    return fields;
}

bool ParseMetar(const wxJSONValue &json, const Config &config, Metar &out,
                wxString &error_msg) {
    if (!GetString(json, wxT("station"), out.station)) {
        error_msg = wxT("Report has no station");
        wxLogError("WxFetch: METAR without station identifier");
        return false;
    }

    Units units = UnitsFromJson(json);
    out.fields = ExtractFields(json, units);
    out.exact_match = IsExactMatch(out.station, config.position);

    wxLogVerbose("WxFetch: METAR %s, %d field(s)", out.station,
                 (int)out.fields.size());
    return true;
}

wxString RenderMetar(const Metar &metar, const Config &config) {
    wxDateTime now = wxDateTime::Now();
    wxString out = StationBadge(metar.station, metar.exact_match);
    if (!metar.fields.empty())
        out += wxT(" ") + ColouriseFields(metar.fields, config, now);
    return out;
}
