#ifndef _UNITS_H_
#define _UNITS_H_

#include <wx/string.h>

class wxJSONValue;

enum PressureUnit { PRESSURE_HPA, PRESSURE_INHG };
enum AltitudeUnit { ALTITUDE_FT, ALTITUDE_M };
enum SpeedUnit { SPEED_KT, SPEED_KPH, SPEED_MPH };
enum TemperatureUnit { TEMPERATURE_C, TEMPERATURE_F };
enum DistanceUnit { DISTANCE_M, DISTANCE_NM, DISTANCE_MI, DISTANCE_KM };

// Units a report was issued in. Defaults are the ICAO/metric conventions.
struct Units {
    PressureUnit pressure;
    AltitudeUnit altitude;
    SpeedUnit wind_speed;
    TemperatureUnit temperature;
    DistanceUnit distance;

    Units()
        : pressure(PRESSURE_HPA), altitude(ALTITUDE_FT),
          wind_speed(SPEED_KT), temperature(TEMPERATURE_C),
          distance(DISTANCE_M) {}

    bool operator==(const Units &o) const {
        return pressure == o.pressure && altitude == o.altitude &&
               wind_speed == o.wind_speed && temperature == o.temperature &&
               distance == o.distance;
    }
};

// Unknown strings map to the default unit (case-insensitive).
PressureUnit PressureUnitFromString(const wxString &s);
AltitudeUnit AltitudeUnitFromString(const wxString &s);
SpeedUnit SpeedUnitFromString(const wxString &s);
TemperatureUnit TemperatureUnitFromString(const wxString &s);
DistanceUnit DistanceUnitFromString(const wxString &s);

// Read the "units" object of a report. Missing object or keys fall back
// to the defaults above.
Units UnitsFromJson(const wxJSONValue &report);

// Conversions used for threshold comparisons only. Decoded values are
// always kept in the unit they were reported in.
double ToKnots(long speed, SpeedUnit unit);
double ToMetres(long distance, DistanceUnit unit);
double ToCelsius(long temp, TemperatureUnit unit);
double ToCelsiusDelta(long delta, TemperatureUnit unit);

#endif // _UNITS_H_
