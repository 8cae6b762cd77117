#include "units.h"

#include <wx/jsonval.h>

PressureUnit PressureUnitFromString(const wxString &s) {
    wxString v = s.Lower();
    if (v == wxT("inhg")) return PRESSURE_INHG;
    return PRESSURE_HPA;
}

AltitudeUnit AltitudeUnitFromString(const wxString &s) {
    wxString v = s.Lower();
    if (v == wxT("m")) return ALTITUDE_M;
    return ALTITUDE_FT;
}

SpeedUnit SpeedUnitFromString(const wxString &s) {
    wxString v = s.Lower();
    if (v == wxT("kph") || v == wxT("kmh")) return SPEED_KPH;
    if (v == wxT("mph")) return SPEED_MPH;
    return SPEED_KT;
}

TemperatureUnit TemperatureUnitFromString(const wxString &s) {
    wxString v = s.Lower();
    if (v == wxT("f")) return TEMPERATURE_F;
    return TEMPERATURE_C;
}

DistanceUnit DistanceUnitFromString(const wxString &s) {
    wxString v = s.Lower();
    if (v == wxT("nm")) return DISTANCE_NM;
    if (v == wxT("mi") || v == wxT("sm")) return DISTANCE_MI;
    if (v == wxT("km")) return DISTANCE_KM;
    return DISTANCE_M;
}

// Returns an empty string when the key is missing or not a string, which
// the *FromString functions map to the default unit.
static wxString UnitString(const wxJSONValue &units, const wxChar *key) {
    if (!units.HasMember(key)) return wxEmptyString;
    wxJSONValue v = units.ItemAt(key);
    return v.IsString() ? v.AsString() : wxString();
}

Units UnitsFromJson(const wxJSONValue &report) {
    Units units;
    if (!report.HasMember(wxT("units"))) return units;

    wxJSONValue u = report.ItemAt(wxT("units"));
    if (!u.IsObject()) return units;

    units.pressure    = PressureUnitFromString(UnitString(u, wxT("altimeter")));
    units.altitude    = AltitudeUnitFromString(UnitString(u, wxT("altitude")));
    units.wind_speed  = SpeedUnitFromString(UnitString(u, wxT("wind_speed")));
    units.temperature = TemperatureUnitFromString(UnitString(u, wxT("temperature")));
    units.distance    = DistanceUnitFromString(UnitString(u, wxT("visibility")));
    return units;
}

double ToKnots(long speed, SpeedUnit unit) {
    switch (unit) {
    case SPEED_KPH: return speed / 1.852;
    case SPEED_MPH: return speed * 0.868976;
    case SPEED_KT:  break;
    }
    return static_cast<double>(speed);
}

double ToMetres(long distance, DistanceUnit unit) {
    switch (unit) {
    case DISTANCE_NM: return distance * 1852.0;
    case DISTANCE_MI: return distance * 1609.344;
    case DISTANCE_KM: return distance * 1000.0;
    case DISTANCE_M:  break;
    }
    return static_cast<double>(distance);
}

double ToCelsius(long temp, TemperatureUnit unit) {
    if (unit == TEMPERATURE_F) return (temp - 32) * 5.0 / 9.0;
    return static_cast<double>(temp);
}

double ToCelsiusDelta(long delta, TemperatureUnit unit) {
    if (unit == TEMPERATURE_F) return delta * 5.0 / 9.0;
    return static_cast<double>(delta);
}
