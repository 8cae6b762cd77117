#ifndef _TAF_H_
#define _TAF_H_

#include "config.h"
#include "wx_field.h"

#include <vector>
#include <wx/datetime.h>
#include <wx/string.h>

class wxJSONValue;

enum PeriodType {
    PERIOD_INITIAL,      // conditions at the start of validity
    PERIOD_FROM,         // FM, permanent change from a time
    PERIOD_BECOMING,     // BECMG, gradual change
    PERIOD_TEMPORARY,    // TEMPO, temporary fluctuation
    PERIOD_PROBABILITY   // PROBxx
};

struct ForecastPeriod {
    PeriodType type;
    wxDateTime start_time;   // invalid when not given
    wxDateTime end_time;     // invalid when not given
    int probability;         // percent, -1 when not given
    WxFieldList fields;

    ForecastPeriod() : type(PERIOD_INITIAL), probability(-1) {}
};

typedef std::vector<ForecastPeriod> ForecastPeriodList;

struct Taf {
    wxString station;
    bool exact_match;
    wxDateTime issue_time;
    wxDateTime validity_start;
    wxDateTime validity_end;
    ForecastPeriodList periods;   // periods[0] is always PERIOD_INITIAL

    Taf() : exact_match(true) {}
};

// Maps the provider's change-group "type" ("FM", "BECMG", "TEMPO", "PROB").
bool PeriodTypeFromString(const wxString &s, PeriodType &out);

// Wind, visibility, weather and clouds of one forecast period.
WxFieldList ExtractPeriodFields(const wxJSONValue &json, const Units &units);

// Decode a forecast. Missing station, issue time or validity window is
// fatal. The first "forecast" entry becomes the initial period; later
// entries with an unknown type are skipped.
bool ParseTaf(const wxJSONValue &json, const Config &config, Taf &out,
              wxString &error_msg);

// Change indicator of a period, e.g. "BECMG 2112/2114", or empty.
wxString ChangeIndicator(const ForecastPeriod &period);

// Header line with the initial period, then one indented line per
// change group.
wxString RenderTaf(const Taf &taf, const Config &config);

#endif // _TAF_H_
