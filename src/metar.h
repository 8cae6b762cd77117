#ifndef _METAR_H_
#define _METAR_H_

#include "config.h"
#include "units.h"
#include "wx_field.h"

#include <wx/string.h>

class wxJSONValue;

struct Metar {
    wxString station;
    bool exact_match;
    WxFieldList fields;

    Metar() : exact_match(true) {}
};

// Single-field extractors. Each returns false when its sub-tree is missing
// or malformed; the field is then simply left out of the report.
bool GetTimestamp(const wxJSONValue &json, const Units &units, WxField &out);
bool GetWinds(const wxJSONValue &json, const Units &units, WxField &out);
bool GetWindVar(const wxJSONValue &json, const Units &units, WxField &out);
bool GetVisibility(const wxJSONValue &json, const Units &units, WxField &out);
bool GetTemp(const wxJSONValue &json, const Units &units, WxField &out);
bool GetQnh(const wxJSONValue &json, const Units &units, WxField &out);
bool GetRemarks(const wxJSONValue &json, const Units &units, WxField &out);

// All observation fields in report order: time, wind, variability,
// visibility, temperature, altimeter, weather, clouds, remarks.
WxFieldList ExtractFields(const wxJSONValue &json, const Units &units);

// Decode an observation. Only a missing station is fatal.
bool ParseMetar(const wxJSONValue &json, const Config &config, Metar &out,
                wxString &error_msg);

// Station badge followed by the colourised fields on one line.
wxString RenderMetar(const Metar &metar, const Config &config);

#endif // _METAR_H_
