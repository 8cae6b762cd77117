#include "colourise.h"

#include <cstdlib>

TermColour SeverityColour(Severity s, bool bright) {
    switch (s) {
    case SEVERITY_GOOD:     return bright ? TC_BRIGHT_GREEN : TC_GREEN;
    case SEVERITY_MARGINAL: return bright ? TC_BRIGHT_YELLOW : TC_YELLOW;
    case SEVERITY_BAD:      return bright ? TC_BRIGHT_RED : TC_RED;
    }
    return TC_DEFAULT;
}

// ---------- Classification ----------

// Marginal bound is inclusive, minimum bound exclusive.
Severity ClassifyVisibility(long vis, DistanceUnit unit, const Config &config) {
    double metres = ToMetres(vis, unit);
    if (metres >= config.visibility_marginal) return SEVERITY_GOOD;
    if (metres > config.visibility_minimum) return SEVERITY_MARGINAL;
    return SEVERITY_BAD;
}

Severity ClassifyCloudHeight(long height, const Config &config) {
    if (height <= config.cloud_minimum) return SEVERITY_BAD;
    if (height <= config.cloud_marginal) return SEVERITY_MARGINAL;
    return SEVERITY_GOOD;
}

Severity ClassifyCoverage(Clouds coverage) {
    switch (coverage) {
    case CLOUDS_OVC: return SEVERITY_BAD;
    case CLOUDS_BRK: return SEVERITY_MARGINAL;
    default:         break;
    }
    return SEVERITY_GOOD;
}

Severity ClassifyTemperature(long temp, TemperatureUnit unit, const Config &config) {
    return ToCelsius(temp, unit) > config.temp_minimum ? SEVERITY_GOOD
                                                       : SEVERITY_BAD;
}

Severity ClassifySpread(long temp, long dewpoint, TemperatureUnit unit,
                        const Config &config) {
    return ToCelsiusDelta(temp - dewpoint, unit) > config.spread_minimum
               ? SEVERITY_GOOD
               : SEVERITY_BAD;
}

Severity ClassifyWindSpeed(long speed, SpeedUnit unit, const Config &config) {
    return ToKnots(speed, unit) > config.wind_maximum ? SEVERITY_BAD
                                                      : SEVERITY_GOOD;
}

Severity ClassifyGust(long speed, long gusts, SpeedUnit unit, const Config &config) {
    return ToKnots(gusts - speed, unit) > config.gust_maximum ? SEVERITY_BAD
                                                              : SEVERITY_GOOD;
}

Severity ClassifyWindVariability(long low_dir, long hi_dir, const Config &config) {
    return hi_dir - low_dir < config.wind_var_maximum ? SEVERITY_GOOD
                                                      : SEVERITY_MARGINAL;
}

// Standard pressure is the boundary; there is no bad tier.
Severity ClassifyAltimeter(long value, PressureUnit unit) {
    long standard = unit == PRESSURE_INHG ? 2992 : 1013;
    return value >= standard ? SEVERITY_GOOD : SEVERITY_MARGINAL;
}

Severity ClassifyAge(const wxTimeSpan &age, const wxTimeSpan &marginal,
                     const wxTimeSpan &maximum) {
    if (age < marginal) return SEVERITY_GOOD;
    if (age < maximum) return SEVERITY_MARGINAL;
    return SEVERITY_BAD;
}

// ---------- Rendering ----------

wxString FormatDayTime(const wxDateTime &time) {
    return time.Format(wxT("%d%H%MZ"), wxDateTime::UTC);
}

// METAR writes negative temperatures with an M prefix: -5 -> "M05".
static wxString FormatTemp(long t) {
    if (t < 0) return wxString::Format(wxT("M%02ld"), std::labs(t));
    return wxString::Format(wxT("%02ld"), t);
}

static wxString SpeedSuffix(SpeedUnit unit) {
    switch (unit) {
    case SPEED_KPH: return wxT("KMH");
    case SPEED_MPH: return wxT("MPH");
    case SPEED_KT:  break;
    }
    return wxT("KT");
}

wxString ColouriseTimestamp(const wxDateTime &time, const wxDateTime &now,
                            const wxTimeSpan &marginal,
                            const wxTimeSpan &maximum) {
    wxTimeSpan age = now.Subtract(time);
    return Paint(FormatDayTime(time),
                 SeverityColour(ClassifyAge(age, marginal, maximum)));
}

wxString ColouriseWind(long direction, long speed, long gusts, SpeedUnit unit,
                       const Config &config) {
    wxString out = wxString::Format(wxT("%03ld"), direction);
    out += Paint(wxString::Format(wxT("%02ld"), speed),
                 SeverityColour(ClassifyWindSpeed(speed, unit, config)));
    if (gusts > 0) {
        Severity s = ClassifyGust(speed, gusts, unit, config);
        out += wxT("G");
        out += Paint(wxString::Format(wxT("%02ld"), gusts),
                     SeverityColour(s, s == SEVERITY_BAD));
    }
    out += SpeedSuffix(unit);
    return out;
}

wxString ColouriseWindVariability(long low_dir, long hi_dir, const Config &config) {
    return Paint(wxString::Format(wxT("%03ldV%03ld"), low_dir, hi_dir),
                 SeverityColour(ClassifyWindVariability(low_dir, hi_dir, config)));
}

wxString ColouriseVisibility(long vis, DistanceUnit unit, const Config &config) {
    wxString text;
    switch (unit) {
    case DISTANCE_KM: text = wxString::Format(wxT("%ldKM"), vis); break;
    case DISTANCE_MI: text = wxString::Format(wxT("%ldSM"), vis); break;
    case DISTANCE_NM: text = wxString::Format(wxT("%ldNM"), vis); break;
    case DISTANCE_M:  text = wxString::Format(wxT("%04ld"), vis); break;
    }
    return Paint(text, SeverityColour(ClassifyVisibility(vis, unit, config)));
}

wxString ColouriseTemperature(long temp, long dewpoint, TemperatureUnit unit,
                              const Config &config) {
    wxString temp_str =
        Paint(FormatTemp(temp),
              SeverityColour(ClassifyTemperature(temp, unit, config), true));
    wxString dew_str =
        Paint(FormatTemp(dewpoint),
              SeverityColour(ClassifySpread(temp, dewpoint, unit, config)));
    return temp_str + wxT("/") + dew_str;
}

wxString ColouriseAltimeter(long value, PressureUnit unit) {
    wxString text = wxString::Format(
        unit == PRESSURE_INHG ? wxT("A%04ld") : wxT("Q%04ld"), value);
    return Paint(text, SeverityColour(ClassifyAltimeter(value, unit)));
}

// Coverage and height are tinted independently.
wxString ColouriseClouds(Clouds coverage, long height, const Config &config) {
    return Paint(ToCanonicalString(coverage),
                 SeverityColour(ClassifyCoverage(coverage))) +
           Paint(wxString::Format(wxT("%03ld"), height),
                 SeverityColour(ClassifyCloudHeight(height, config)));
}

static TermColour WxCodeColour(WxCode code) {
    switch (code) {
    case WXCODE_RA: return TC_BRIGHT_YELLOW;
    case WXCODE_GR:
    case WXCODE_SN:
    case WXCODE_UP: return TC_RED;
    case WXCODE_GS: return TC_YELLOW;
    case WXCODE_PO: return TC_BRIGHT_RED;
    default:        break;
    }
    return TC_WHITE;
}

static TermColour IntensityColour(WxCodeIntensity intensity) {
    switch (intensity) {
    case INTENSITY_LIGHT: return TC_BRIGHT_GREEN;
    case INTENSITY_HEAVY: return TC_BRIGHT_RED;
    case INTENSITY_MODERATE: break;
    }
    return TC_WHITE;
}

static TermColour DescriptorColour(WxCodeDescriptor descriptor) {
    switch (descriptor) {
    case DESCRIPTOR_TS: return TC_RED;
    case DESCRIPTOR_FZ: return TC_BRIGHT_BLUE;
    case DESCRIPTOR_SH: return TC_YELLOW;
    default:            break;
    }
    return TC_WHITE;
}

wxString ColourisePhenomenon(WxCode code, WxCodeIntensity intensity,
                             WxCodeDescriptor descriptor,
                             WxCodeProximity proximity) {
    return Paint(ToCanonicalString(intensity), IntensityColour(intensity)) +
           Paint(ToCanonicalString(descriptor), DescriptorColour(descriptor)) +
           Paint(ToCanonicalString(code), WxCodeColour(code)) +
           Paint(ToCanonicalString(proximity), TC_WHITE);
}

wxString ColouriseRemarks(const wxString &remarks) {
    return Paint(remarks, TC_BLACK, TC_WHITE);
}

wxString ColouriseField(const WxField &field, const Config &config,
                        const wxDateTime &now) {
    switch (field.kind) {
    case FIELD_TIMESTAMP:
        return ColouriseTimestamp(field.time, now, config.age_marginal,
                                  config.age_maximum);
    case FIELD_WIND:
        return ColouriseWind(field.direction, field.speed, field.gusts,
                             field.speed_unit, config);
    case FIELD_WIND_VARIABILITY:
        return ColouriseWindVariability(field.low_dir, field.hi_dir, config);
    case FIELD_VISIBILITY:
        return ColouriseVisibility(field.visibility, field.distance_unit, config);
    case FIELD_TEMPERATURE:
        return ColouriseTemperature(field.temp, field.dewpoint, field.temp_unit,
                                    config);
    case FIELD_ALTIMETER:
        return ColouriseAltimeter(field.altimeter, field.pressure_unit);
    case FIELD_CLOUD_LAYER:
        return ColouriseClouds(field.coverage, field.height, config);
    case FIELD_WX_PHENOMENON:
        return ColourisePhenomenon(field.code, field.intensity,
                                   field.descriptor, field.proximity);
    case FIELD_REMARKS:
        return ColouriseRemarks(field.remarks);
    }
    return wxEmptyString;
}

wxString ColouriseFields(const WxFieldList &fields, const Config &config,
                         const wxDateTime &now) {
    wxString out;
    for (size_t i = 0; i < fields.size(); i++) {
        if (i > 0) out += wxT(" ");
        out += ColouriseField(fields[i], config, now);
    }
    return out;
}

wxString StationBadge(const wxString &station, bool exact_match) {
    if (exact_match) return Paint(station, TC_BRIGHT_WHITE, TC_BLUE);
    return Paint(station, TC_BLACK, TC_YELLOW);
}
