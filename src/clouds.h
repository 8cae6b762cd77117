#ifndef _CLOUDS_H_
#define _CLOUDS_H_

#include <vector>
#include <wx/arrstr.h>
#include <wx/string.h>

class wxJSONValue;
struct WxField;

// Cloud layer coverage, ordered by increasing obscuration.
enum Clouds {
    CLOUDS_SKC,  // sky clear
    CLOUDS_FEW,  // 1-2 oktas
    CLOUDS_SCT,  // 3-4 oktas
    CLOUDS_BRK,  // 5-7 oktas
    CLOUDS_OVC   // 8 oktas
};

// All coverage kinds in declaration order.
const std::vector<Clouds> &AllClouds();

wxString ToCanonicalString(Clouds c);
bool CloudsFromString(const wxString &s, Clouds &out);

// "SKC|FEW|SCT|BRK|OVC", generated from ToCanonicalString().
wxString CloudsAlternation();

// Decode one cloud token such as "SCT050" into a CLOUD_LAYER field.
// Missing height digits decode as height 0. Returns false when the token
// does not start with a coverage code.
bool CloudLayerFromString(const wxString &repr, WxField &out);

// Decode every "clouds[].repr" token of a report, appending in order.
// Undecodable tokens are skipped.
void GetCloudsFromJson(const wxJSONValue &report, std::vector<WxField> &out);

#endif // _CLOUDS_H_
