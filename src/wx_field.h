#ifndef _WX_FIELD_H_
#define _WX_FIELD_H_

#include "clouds.h"
#include "units.h"
#include "wx_codes.h"

#include <vector>
#include <wx/datetime.h>
#include <wx/string.h>

enum WxFieldKind {
    FIELD_TIMESTAMP,
    FIELD_WIND,
    FIELD_WIND_VARIABILITY,
    FIELD_VISIBILITY,
    FIELD_TEMPERATURE,
    FIELD_ALTIMETER,
    FIELD_CLOUD_LAYER,
    FIELD_WX_PHENOMENON,
    FIELD_REMARKS
};

// One decoded element of a report. Only the members belonging to `kind`
// are meaningful; numeric values are in the unit the report used.
struct WxField {
    WxFieldKind kind;

    wxDateTime time;              // TIMESTAMP

    long direction;               // WIND, degrees true
    long speed;
    long gusts;                   // 0 when no gusts were reported
    SpeedUnit speed_unit;

    long low_dir;                 // WIND_VARIABILITY
    long hi_dir;

    long visibility;              // VISIBILITY
    DistanceUnit distance_unit;

    long temp;                    // TEMPERATURE
    long dewpoint;
    TemperatureUnit temp_unit;

    long altimeter;               // ALTIMETER, hPa or hundredths of inHg
    PressureUnit pressure_unit;

    Clouds coverage;              // CLOUD_LAYER
    long height;                  // hundreds of feet

    WxCode code;                  // WX_PHENOMENON
    WxCodeIntensity intensity;
    WxCodeDescriptor descriptor;
    WxCodeProximity proximity;

    wxString remarks;             // REMARKS

    WxField()
        : kind(FIELD_REMARKS),
          direction(0), speed(0), gusts(0), speed_unit(SPEED_KT),
          low_dir(0), hi_dir(0),
          visibility(0), distance_unit(DISTANCE_M),
          temp(0), dewpoint(0), temp_unit(TEMPERATURE_C),
          altimeter(0), pressure_unit(PRESSURE_HPA),
          coverage(CLOUDS_SKC), height(0),
          code(WXCODE_RA), intensity(INTENSITY_MODERATE),
          descriptor(DESCRIPTOR_NONE), proximity(PROXIMITY_ON_STATION) {}

    static WxField TimeStamp(const wxDateTime &time);
    static WxField Wind(long direction, long speed, long gusts, SpeedUnit unit);
    static WxField WindVariability(long low_dir, long hi_dir);
    static WxField Visibility(long visibility, DistanceUnit unit);
    static WxField Temperature(long temp, long dewpoint, TemperatureUnit unit);
    static WxField Altimeter(long value, PressureUnit unit);
    static WxField CloudLayer(Clouds coverage, long height);
    static WxField Phenomenon(WxCode code, WxCodeIntensity intensity,
                              WxCodeDescriptor descriptor,
                              WxCodeProximity proximity);
    static WxField Remarks(const wxString &text);

    // Compares the kind and the members that belong to it.
    bool operator==(const WxField &o) const;
    bool operator!=(const WxField &o) const { return !(*this == o); }
};

typedef std::vector<WxField> WxFieldList;

#endif // _WX_FIELD_H_
