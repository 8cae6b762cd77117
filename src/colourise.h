#ifndef _COLOURISE_H_
#define _COLOURISE_H_

#include "config.h"
#include "term_colour.h"
#include "wx_field.h"

#include <wx/datetime.h>
#include <wx/string.h>

enum Severity { SEVERITY_GOOD, SEVERITY_MARGINAL, SEVERITY_BAD };

// Green / yellow / red, or their bright variants.
TermColour SeverityColour(Severity s, bool bright = false);

// ---- classification --------------------------------------------------------
// Pure threshold checks. Values are converted to the config's units
// (metres, knots, deg C) for the comparison only.

Severity ClassifyVisibility(long vis, DistanceUnit unit, const Config &config);
Severity ClassifyCloudHeight(long height, const Config &config);
Severity ClassifyCoverage(Clouds coverage);
Severity ClassifyTemperature(long temp, TemperatureUnit unit, const Config &config);
Severity ClassifySpread(long temp, long dewpoint, TemperatureUnit unit,
                        const Config &config);
Severity ClassifyWindSpeed(long speed, SpeedUnit unit, const Config &config);
Severity ClassifyGust(long speed, long gusts, SpeedUnit unit, const Config &config);
Severity ClassifyWindVariability(long low_dir, long hi_dir, const Config &config);
Severity ClassifyAltimeter(long value, PressureUnit unit);
Severity ClassifyAge(const wxTimeSpan &age, const wxTimeSpan &marginal,
                     const wxTimeSpan &maximum);

// ---- rendering -------------------------------------------------------------
// Each returns a painted fragment; callers only concatenate them.

wxString ColouriseTimestamp(const wxDateTime &time, const wxDateTime &now,
                            const wxTimeSpan &marginal,
                            const wxTimeSpan &maximum);
wxString ColouriseWind(long direction, long speed, long gusts, SpeedUnit unit,
                       const Config &config);
wxString ColouriseWindVariability(long low_dir, long hi_dir, const Config &config);
wxString ColouriseVisibility(long vis, DistanceUnit unit, const Config &config);
wxString ColouriseTemperature(long temp, long dewpoint, TemperatureUnit unit,
                              const Config &config);
wxString ColouriseAltimeter(long value, PressureUnit unit);
wxString ColouriseClouds(Clouds coverage, long height, const Config &config);
wxString ColourisePhenomenon(WxCode code, WxCodeIntensity intensity,
                             WxCodeDescriptor descriptor,
                             WxCodeProximity proximity);
wxString ColouriseRemarks(const wxString &remarks);

// Observation fields age against age_marginal/age_maximum.
wxString ColouriseField(const WxField &field, const Config &config,
                        const wxDateTime &now);

// Space-joined fields, e.g. the body of a METAR or a forecast period.
wxString ColouriseFields(const WxFieldList &fields, const Config &config,
                         const wxDateTime &now);

// Inverse-video badge; yellow when a substitute station answered.
wxString StationBadge(const wxString &station, bool exact_match);

// "DDHHMMZ" in UTC.
wxString FormatDayTime(const wxDateTime &time);

#endif // _COLOURISE_H_
