#include "wx_codes.h"
#include "token_grammar.h"
#include "wx_field.h"

#include <wx/regex.h>

const std::vector<WxCode> &AllWxCodes() {
    static const std::vector<WxCode> all = {
        WXCODE_RA, WXCODE_DZ, WXCODE_GR, WXCODE_GS, WXCODE_IC, WXCODE_PL,
        WXCODE_SG, WXCODE_SN, WXCODE_UP, WXCODE_BR, WXCODE_DU, WXCODE_FG,
        WXCODE_FU, WXCODE_HZ, WXCODE_PY, WXCODE_SA, WXCODE_VA, WXCODE_DS,
        WXCODE_FC, WXCODE_PO, WXCODE_SQ, WXCODE_SS};
    return all;
}

const std::vector<WxCodeIntensity> &AllIntensities() {
    static const std::vector<WxCodeIntensity> all = {
        INTENSITY_MODERATE, INTENSITY_LIGHT, INTENSITY_HEAVY};
    return all;
}

const std::vector<WxCodeDescriptor> &AllDescriptors() {
    static const std::vector<WxCodeDescriptor> all = {
        DESCRIPTOR_NONE, DESCRIPTOR_TS, DESCRIPTOR_BC, DESCRIPTOR_BL,
        DESCRIPTOR_DR,   DESCRIPTOR_FZ, DESCRIPTOR_MI, DESCRIPTOR_PR,
        DESCRIPTOR_SH};
    return all;
}

const std::vector<WxCodeProximity> &AllProximities() {
    static const std::vector<WxCodeProximity> all = {
        PROXIMITY_ON_STATION, PROXIMITY_VICINITY, PROXIMITY_DISTANT};
    return all;
}

wxString ToCanonicalString(WxCode c) {
    switch (c) {
    case WXCODE_RA: return wxT("RA");
    case WXCODE_DZ: return wxT("DZ");
    case WXCODE_GR: return wxT("GR");
    case WXCODE_GS: return wxT("GS");
    case WXCODE_IC: return wxT("IC");
    case WXCODE_PL: return wxT("PL");
    case WXCODE_SG: return wxT("SG");
    case WXCODE_SN: return wxT("SN");
    case WXCODE_UP: return wxT("UP");
    case WXCODE_BR: return wxT("BR");
    case WXCODE_DU: return wxT("DU");
    case WXCODE_FG: return wxT("FG");
    case WXCODE_FU: return wxT("FU");
    case WXCODE_HZ: return wxT("HZ");
    case WXCODE_PY: return wxT("PY");
    case WXCODE_SA: return wxT("SA");
    case WXCODE_VA: return wxT("VA");
    case WXCODE_DS: return wxT("DS");
    case WXCODE_FC: return wxT("FC");
    case WXCODE_PO: return wxT("PO");
    case WXCODE_SQ: return wxT("SQ");
    case WXCODE_SS: return wxT("SS");
    }
    return wxEmptyString;
}

wxString ToCanonicalString(WxCodeIntensity i) {
    switch (i) {
    case INTENSITY_LIGHT: return wxT("-");
    case INTENSITY_HEAVY: return wxT("+");
    case INTENSITY_MODERATE: break;
    }
    return wxEmptyString;
}

wxString ToCanonicalString(WxCodeDescriptor d) {
    switch (d) {
    case DESCRIPTOR_TS: return wxT("TS");
    case DESCRIPTOR_BC: return wxT("BC");
    case DESCRIPTOR_BL: return wxT("BL");
    case DESCRIPTOR_DR: return wxT("DR");
    case DESCRIPTOR_FZ: return wxT("FZ");
    case DESCRIPTOR_MI: return wxT("MI");
    case DESCRIPTOR_PR: return wxT("PR");
    case DESCRIPTOR_SH: return wxT("SH");
    case DESCRIPTOR_NONE: break;
    }
    return wxEmptyString;
}

wxString ToCanonicalString(WxCodeProximity p) {
    switch (p) {
    case PROXIMITY_VICINITY: return wxT("VC");
    case PROXIMITY_DISTANT: return wxT("DSNT");
    case PROXIMITY_ON_STATION: break;
    }
    return wxEmptyString;
}

// Linear lookup over one of the All*() tables.
template <typename T>
static bool FromCanonical(const std::vector<T> &all, const wxString &s, T &out) {
    for (T v : all) {
        if (s.CmpNoCase(ToCanonicalString(v)) == 0) {
            out = v;
            return true;
        }
    }
    return false;
}

template <typename T>
static wxString Alternation(const std::vector<T> &all) {
    wxArrayString names;
    for (T v : all) names.Add(ToCanonicalString(v));
    return BuildAlternation(names);
}

bool WxCodeFromString(const wxString &s, WxCode &out) {
    return FromCanonical(AllWxCodes(), s, out);
}

bool IntensityFromString(const wxString &s, WxCodeIntensity &out) {
    return FromCanonical(AllIntensities(), s, out);
}

bool DescriptorFromString(const wxString &s, WxCodeDescriptor &out) {
    return FromCanonical(AllDescriptors(), s, out);
}

bool ProximityFromString(const wxString &s, WxCodeProximity &out) {
    return FromCanonical(AllProximities(), s, out);
}

wxString WxCodeAlternation()     { return Alternation(AllWxCodes()); }
wxString IntensityAlternation()  { return Alternation(AllIntensities()); }
wxString DescriptorAlternation() { return Alternation(AllDescriptors()); }
wxString ProximityAlternation()  { return Alternation(AllProximities()); }

// Each optional part is wrapped as ((alt)?) so its outer group always
// participates, matching "" for the none variant. Outer groups: 1 intensity,
// 3 descriptor, 5 code, 6 proximity.
static const wxRegEx &WxPhenomenonRegex() {
    static const wxRegEx re(
        wxT("^((") + IntensityAlternation() + wxT(")?)") +
        wxT("((") + DescriptorAlternation() + wxT(")?)") +
        wxT("(") + WxCodeAlternation() + wxT(")") +
        wxT("((") + ProximityAlternation() + wxT(")?)"),
        wxRE_EXTENDED | wxRE_ICASE);
    return re;
}

bool WxPhenomenonFromString(const wxString &repr, WxField &out) {
    const wxRegEx &re = WxPhenomenonRegex();
    if (!re.IsValid() || !re.Matches(repr)) return false;

    WxCodeIntensity intensity;
    WxCodeDescriptor descriptor;
    WxCode code;
    WxCodeProximity proximity;
    if (!IntensityFromString(re.GetMatch(repr, 1), intensity)) return false;
    if (!DescriptorFromString(re.GetMatch(repr, 3), descriptor)) return false;
    if (!WxCodeFromString(re.GetMatch(repr, 5), code)) return false;
    if (!ProximityFromString(re.GetMatch(repr, 6), proximity)) return false;

    out = WxField::Phenomenon(code, intensity, descriptor, proximity);
    return true;
}

void GetWxCodesFromJson(const wxJSONValue &report, std::vector<WxField> &out) {
    wxArrayString reprs = ReprStrings(report, wxT("wx_codes"));
    for (size_t i = 0; i < reprs.size(); i++) {
        WxField field;
        if (WxPhenomenonFromString(reprs[i], field)) out.push_back(field);
    }
}
