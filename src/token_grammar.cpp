#include "token_grammar.h"

#include <wx/jsonval.h>

static const wxString REGEX_META = wxT("\\^$.|?*+()[]{}");

wxString BuildAlternation(const wxArrayString &tokens) {
    wxString res;
    for (size_t i = 0; i < tokens.size(); i++) {
        const wxString &tok = tokens[i];
        if (tok.IsEmpty()) continue;
        if (!res.IsEmpty()) res += wxT('|');
        for (wxString::const_iterator it = tok.begin(); it != tok.end(); ++it) {
            if (REGEX_META.Find(*it) != wxNOT_FOUND) res += wxT('\\');
            res += *it;
        }
    }
    return res;
}

wxArrayString ReprStrings(const wxJSONValue &report, const wxString &key) {
    wxArrayString out;
    if (!report.HasMember(key)) return out;

    wxJSONValue arr = report.ItemAt(key);
    if (!arr.IsArray()) return out;

    for (int i = 0; i < arr.Size(); i++) {
        wxJSONValue item = arr[i];
        if (!item.HasMember(wxT("repr"))) continue;
        wxJSONValue repr = item.ItemAt(wxT("repr"));
        if (repr.IsString()) out.Add(repr.AsString());
    }
    return out;
}
