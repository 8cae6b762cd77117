#include "clouds.h"
#include "token_grammar.h"
#include "wx_field.h"

#include <wx/regex.h>

const std::vector<Clouds> &AllClouds() {
    static const std::vector<Clouds> all = {
        CLOUDS_SKC, CLOUDS_FEW, CLOUDS_SCT, CLOUDS_BRK, CLOUDS_OVC};
    return all;
}

wxString ToCanonicalString(Clouds c) {
    switch (c) {
    case CLOUDS_SKC: return wxT("SKC");
    case CLOUDS_FEW: return wxT("FEW");
    case CLOUDS_SCT: return wxT("SCT");
    case CLOUDS_BRK: return wxT("BRK");
    case CLOUDS_OVC: return wxT("OVC");
    }
    return wxEmptyString;
}

bool CloudsFromString(const wxString &s, Clouds &out) {
    for (Clouds c : AllClouds()) {
        if (s.CmpNoCase(ToCanonicalString(c)) == 0) {
            out = c;
            return true;
        }
    }
    return false;
}

wxString CloudsAlternation() {
    wxArrayString names;
    for (Clouds c : AllClouds()) names.Add(ToCanonicalString(c));
    return BuildAlternation(names);
}

// Anchored at the start only: trailing cloud types ("CB", "TCU") are
// ignored. Group 1 is the coverage, group 2 the height digits.
static const wxRegEx &CloudRegex() {
    static const wxRegEx re(
        wxT("^(") + CloudsAlternation() + wxT(")([0-9]*)"),
        wxRE_EXTENDED | wxRE_ICASE);
    return re;
}

bool CloudLayerFromString(const wxString &repr, WxField &out) {
    const wxRegEx &re = CloudRegex();
    if (!re.IsValid() || !re.Matches(repr)) return false;

    Clouds coverage;
    if (!CloudsFromString(re.GetMatch(repr, 1), coverage)) return false;

    long height = 0;
    wxString digits = re.GetMatch(repr, 2);
    if (!digits.IsEmpty() && !digits.ToLong(&height)) height = 0;

    out = WxField::CloudLayer(coverage, height);
    return true;
}

void GetCloudsFromJson(const wxJSONValue &report, std::vector<WxField> &out) {
    wxArrayString reprs = ReprStrings(report, wxT("clouds"));
    for (size_t i = 0; i < reprs.size(); i++) {
        WxField field;
        if (CloudLayerFromString(reprs[i], field)) out.push_back(field);
    }
}
