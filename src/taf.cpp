#include "taf.h"

#include "colourise.h"
#include "metar.h"
#include "report_json.h"

#include <wx/jsonval.h>
#include <wx/log.h>

bool PeriodTypeFromString(const wxString &s, PeriodType &out) {
    if (s == wxT("FM"))    { out = PERIOD_FROM; return true; }
    if (s == wxT("BECMG")) { out = PERIOD_BECOMING; return true; }
    if (s == wxT("TEMPO")) { out = PERIOD_TEMPORARY; return true; }
    if (s == wxT("PROB"))  { out = PERIOD_PROBABILITY; return true; }
    return false;
}

WxFieldList ExtractPeriodFields(const wxJSONValue &json, const Units &units) {
    WxFieldList fields;
    WxField field;
    if (GetWinds(json, units, field)) fields.push_back(field);
    if (GetVisibility(json, units, field)) fields.push_back(field);
    GetWxCodesFromJson(json, fields);
    GetCloudsFromJson(json, fields);
    return fields;
}

static bool ParsePeriod(const wxJSONValue &json, const Units &units,
                        bool initial, ForecastPeriod &out) {
    if (initial) {
        out.type = PERIOD_INITIAL;
    } else {
        wxString type;
        if (!GetString(json, wxT("type"), type)) return false;
        if (!PeriodTypeFromString(type, out.type)) {
            wxLogVerbose("WxFetch: skipping change group of type %s", type);
            return false;
        }
    }

    // absent times stay invalid
    GetInstant(json, wxT("start_time"), out.start_time);
    GetInstant(json, wxT("end_time"), out.end_time);

    wxJSONValue prob;
    long percent = 0;
    if (GetNested(json, wxT("probability"), wxT("value"), prob) &&
        SafeLong(prob, percent) && percent >= 0 && percent <= 100)
        out.probability = static_cast<int>(percent);

    out.fields = ExtractPeriodFields(json, units);
    return true;
}

bool ParseTaf(const wxJSONValue &json, const Config &config, Taf &out,
              wxString &error_msg) {
    if (!GetString(json, wxT("station"), out.station)) {
        error_msg = wxT("Forecast has no station");
        wxLogError("WxFetch: TAF without station identifier");
        return false;
    }
    if (!GetInstant(json, wxT("time"), out.issue_time)) {
        error_msg = wxT("Forecast has no issue time");
        wxLogError("WxFetch: TAF %s without issue time", out.station);
        return false;
    }
    if (!GetInstant(json, wxT("start_time"), out.validity_start) ||
        !GetInstant(json, wxT("end_time"), out.validity_end)) {
        error_msg = wxT("Forecast has no validity period");
        wxLogError("WxFetch: TAF %s without validity period", out.station);
        return false;
    }

    Units units = UnitsFromJson(json);
    out.periods.clear();
    if (json.HasMember(wxT("forecast")) && json.ItemAt(wxT("forecast")).IsArray()) {
        wxJSONValue arr = json.ItemAt(wxT("forecast"));
        for (int i = 0; i < arr.Size(); i++) {
            ForecastPeriod period;
            if (ParsePeriod(arr[i], units, out.periods.empty(), period))
                out.periods.push_back(period);
        }
    }

    out.exact_match = IsExactMatch(out.station, config.position);
    wxLogVerbose("WxFetch: TAF %s, %d period(s)", out.station,
                 (int)out.periods.size());
    return true;
}

// "DDHH" in UTC.
static wxString FormatDayHour(const wxDateTime &time) {
    return time.Format(wxT("%d%H"), wxDateTime::UTC);
}

static wxString FormatWindow(const ForecastPeriod &period) {
    if (!period.start_time.IsValid() || !period.end_time.IsValid())
        return wxEmptyString;
    return wxT(" ") + FormatDayHour(period.start_time) + wxT("/") +
           FormatDayHour(period.end_time);
}

wxString ChangeIndicator(const ForecastPeriod &period) {
    switch (period.type) {
    case PERIOD_FROM:
        if (!period.start_time.IsValid()) break;
        return Paint(wxT("FM") + period.start_time.Format(wxT("%d%H%M"),
                                                          wxDateTime::UTC),
                     TC_BRIGHT_YELLOW);
    case PERIOD_BECOMING:
        return Paint(wxT("BECMG") + FormatWindow(period), TC_BRIGHT_MAGENTA);
    case PERIOD_TEMPORARY:
        return Paint(wxT("TEMPO") + FormatWindow(period), TC_BRIGHT_BLUE);
    case PERIOD_PROBABILITY:
        if (period.probability < 0) break;
        return Paint(wxString::Format(wxT("PROB%d"), period.probability) +
                         FormatWindow(period),
                     TC_BRIGHT_RED);
    case PERIOD_INITIAL:
        break;
    }
    return wxEmptyString;
}

static wxString RenderPeriod(const ForecastPeriod &period, const Config &config,
                             const wxDateTime &now) {
    wxString out;
    if (config.taf_show_change_times) out = ChangeIndicator(period);
    if (!period.fields.empty()) {
        if (!out.IsEmpty()) out += wxT(" ");
        out += ColouriseFields(period.fields, config, now);
    }
    return out;
}

wxString RenderTaf(const Taf &taf, const Config &config) {
    wxDateTime now = wxDateTime::Now();

    wxString out = Paint(wxT("TAF "), TC_BRIGHT_WHITE);
    out += StationBadge(taf.station, taf.exact_match);
    out += wxT(" ") + ColouriseTimestamp(taf.issue_time, now,
                                         config.taf_age_marginal,
                                         config.taf_age_maximum);
    out += wxT(" ") + Paint(FormatDayHour(taf.validity_start) + wxT("/") +
                                FormatDayHour(taf.validity_end),
                            TC_BRIGHT_CYAN);

    for (size_t i = 0; i < taf.periods.size(); i++) {
        wxString period = RenderPeriod(taf.periods[i], config, now);
        out += (i == 0 ? wxT(" ") : wxT("\n     ")) + period;
    }
    return out;
}
