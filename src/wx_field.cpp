#include "wx_field.h"

WxField WxField::TimeStamp(const wxDateTime &time) {
    WxField f;
    f.kind = FIELD_TIMESTAMP;
    f.time = time;
    return f;
}

WxField WxField::Wind(long direction, long speed, long gusts, SpeedUnit unit) {
    WxField f;
    f.kind = FIELD_WIND;
    f.direction = direction;
    f.speed = speed;
    f.gusts = gusts;
    f.speed_unit = unit;
    return f;
}

WxField WxField::WindVariability(long low_dir, long hi_dir) {
    WxField f;
    f.kind = FIELD_WIND_VARIABILITY;
    f.low_dir = low_dir;
    f.hi_dir = hi_dir;
    return f;
}

WxField WxField::Visibility(long visibility, DistanceUnit unit) {
    WxField f;
    f.kind = FIELD_VISIBILITY;
    f.visibility = visibility;
    f.distance_unit = unit;
    return f;
}

WxField WxField::Temperature(long temp, long dewpoint, TemperatureUnit unit) {
    WxField f;
    f.kind = FIELD_TEMPERATURE;
    f.temp = temp;
    f.dewpoint = dewpoint;
    f.temp_unit = unit;
    return f;
}

WxField WxField::Altimeter(long value, PressureUnit unit) {
    WxField f;
    f.kind = FIELD_ALTIMETER;
    f.altimeter = value;
    f.pressure_unit = unit;
    return f;
}

WxField WxField::CloudLayer(Clouds coverage, long height) {
    WxField f;
    f.kind = FIELD_CLOUD_LAYER;
    f.coverage = coverage;
    f.height = height;
    return f;
}

WxField WxField::Phenomenon(WxCode code, WxCodeIntensity intensity,
                            WxCodeDescriptor descriptor,
                            WxCodeProximity proximity) {
    WxField f;
    f.kind = FIELD_WX_PHENOMENON;
    f.code = code;
    f.intensity = intensity;
    f.descriptor = descriptor;
    f.proximity = proximity;
    return f;
}

WxField WxField::Remarks(const wxString &text) {
    WxField f;
    f.kind = FIELD_REMARKS;
    f.remarks = text;
    return f;
}

bool WxField::operator==(const WxField &o) const {
    if (kind != o.kind) return false;
    switch (kind) {
    case FIELD_TIMESTAMP:
        return time.IsValid() == o.time.IsValid() &&
               (!time.IsValid() || time.IsEqualTo(o.time));
    case FIELD_WIND:
        return direction == o.direction && speed == o.speed &&
               gusts == o.gusts && speed_unit == o.speed_unit;
    case FIELD_WIND_VARIABILITY:
        return low_dir == o.low_dir && hi_dir == o.hi_dir;
    case FIELD_VISIBILITY:
        return visibility == o.visibility && distance_unit == o.distance_unit;
    case FIELD_TEMPERATURE:
        return temp == o.temp && dewpoint == o.dewpoint &&
               temp_unit == o.temp_unit;
    case FIELD_ALTIMETER:
        return altimeter == o.altimeter && pressure_unit == o.pressure_unit;
    case FIELD_CLOUD_LAYER:
        return coverage == o.coverage && height == o.height;
    case FIELD_WX_PHENOMENON:
        return code == o.code && intensity == o.intensity &&
               descriptor == o.descriptor && proximity == o.proximity;
    case FIELD_REMARKS:
        return remarks == o.remarks;
    }
    return false;
}
