#ifndef _WX_CODES_H_
#define _WX_CODES_H_

#include <vector>
#include <wx/string.h>

class wxJSONValue;
struct WxField;

// Standardised codes for weather phenomena.
enum WxCode {
    WXCODE_RA,  // rain
    WXCODE_DZ,  // drizzle
    WXCODE_GR,  // hail, diameter >= 5mm
    WXCODE_GS,  // small hail, diameter < 5mm
    WXCODE_IC,  // ice crystals
    WXCODE_PL,  // ice pellets
    WXCODE_SG,  // snow grains
    WXCODE_SN,  // snow
    WXCODE_UP,  // unknown precipitation (automated stations)
    WXCODE_BR,  // mist
    WXCODE_DU,  // widespread dust
    WXCODE_FG,  // fog
    WXCODE_FU,  // smoke
    WXCODE_HZ,  // haze
    WXCODE_PY,  // spray
    WXCODE_SA,  // sand
    WXCODE_VA,  // volcanic ash
    WXCODE_DS,  // dust storm
    WXCODE_FC,  // funnel cloud
    WXCODE_PO,  // well-developed dust/sand whirls
    WXCODE_SQ,  // squalls
    WXCODE_SS   // sandstorm
};

enum WxCodeIntensity { INTENSITY_MODERATE, INTENSITY_LIGHT, INTENSITY_HEAVY };

enum WxCodeDescriptor {
    DESCRIPTOR_NONE,
    DESCRIPTOR_TS,  // thunderstorm
    DESCRIPTOR_BC,  // patches
    DESCRIPTOR_BL,  // blowing
    DESCRIPTOR_DR,  // low drifting
    DESCRIPTOR_FZ,  // freezing
    DESCRIPTOR_MI,  // shallow
    DESCRIPTOR_PR,  // partial
    DESCRIPTOR_SH   // shower(s)
};

// On station, in the vicinity (5-10 sm) or distant (more than 10 sm).
enum WxCodeProximity { PROXIMITY_ON_STATION, PROXIMITY_VICINITY, PROXIMITY_DISTANT };

const std::vector<WxCode> &AllWxCodes();
const std::vector<WxCodeIntensity> &AllIntensities();
const std::vector<WxCodeDescriptor> &AllDescriptors();
const std::vector<WxCodeProximity> &AllProximities();

// Canonical METAR spelling. The "none" variants (moderate, no descriptor,
// on station) are the empty string.
wxString ToCanonicalString(WxCode c);
wxString ToCanonicalString(WxCodeIntensity i);
wxString ToCanonicalString(WxCodeDescriptor d);
wxString ToCanonicalString(WxCodeProximity p);

// Case-insensitive inverse of ToCanonicalString(). Only the three
// optional kinds accept the empty string.
bool WxCodeFromString(const wxString &s, WxCode &out);
bool IntensityFromString(const wxString &s, WxCodeIntensity &out);
bool DescriptorFromString(const wxString &s, WxCodeDescriptor &out);
bool ProximityFromString(const wxString &s, WxCodeProximity &out);

// Regex alternations generated from the canonical spellings.
wxString WxCodeAlternation();
wxString IntensityAlternation();
wxString DescriptorAlternation();
wxString ProximityAlternation();

// Decode a token of the form intensity? descriptor? code proximity?,
// e.g. "-RA", "+TSRA", "FZFGVC". Returns false if the code is missing or
// unknown.
bool WxPhenomenonFromString(const wxString &repr, WxField &out);

// Decode every "wx_codes[].repr" token of a report, appending in order.
void GetWxCodesFromJson(const wxJSONValue &report, std::vector<WxField> &out);

#endif // _WX_CODES_H_
