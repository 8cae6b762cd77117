#include "report_json.h"

#include <wx/jsonreader.h>
#include <wx/jsonval.h>
#include <wx/log.h>

bool ParseJsonDocument(const wxString &json, wxJSONValue &root,
                       wxString &error_msg) {
    wxJSONReader reader;
    int errors = reader.Parse(json, &root);
    if (errors > 0) {
        error_msg = wxT("JSON parse error");
        wxString excerpt = json.Left(300);
        wxLogError("WxFetch: JSON parse error, response: %s", excerpt);
        return false;
    }
    if (!root.IsObject() && !root.IsArray()) {
        error_msg = wxT("Unexpected JSON document");
        return false;
    }
    return true;
}

bool SafeLong(const wxJSONValue &v, long &out) {
    if (v.IsInt())   { out = v.AsInt(); return true; }
    if (v.IsLong())  { out = v.AsLong(); return true; }
    if (v.IsUInt())  { out = static_cast<long>(v.AsUInt()); return true; }
    if (v.IsULong()) { out = static_cast<long>(v.AsULong()); return true; }
#if defined(wxJSON_64BIT_INT)
    if (v.IsInt64()) { out = static_cast<long>(v.AsInt64()); return true; }
#endif
    return false;
}

bool GetNested(const wxJSONValue &obj, const wxString &key,
               const wxString &sub, wxJSONValue &out) {
    if (!obj.HasMember(key)) return false;
    wxJSONValue inner = obj.ItemAt(key);
    if (!inner.HasMember(sub)) return false;
    out = inner.ItemAt(sub);
    return true;
}

bool GetString(const wxJSONValue &obj, const wxString &key, wxString &out) {
    if (!obj.HasMember(key)) return false;
    wxJSONValue v = obj.ItemAt(key);
    if (!v.IsString()) return false;
    out = v.AsString();
    return true;
}

// Splits a trailing "Z" or "+HH:MM" from s; offset is seconds east of UTC.
static bool SplitUtcOffset(const wxString &s, wxString &body, long &offset) {
    if (s.EndsWith(wxT("Z"), &body) || s.EndsWith(wxT("z"), &body)) {
        offset = 0;
        return true;
    }

    size_t len = s.length();
    if (len < 6 || s[len - 3] != wxT(':')) return false;
    wxUniChar sign = s[len - 6];
    if (sign != wxT('+') && sign != wxT('-')) return false;

    long hh = 0, mm = 0;
    if (!s.Mid(len - 5, 2).ToLong(&hh) || !s.Mid(len - 2, 2).ToLong(&mm))
        return false;
    offset = hh * 3600 + mm * 60;
    if (sign == wxT('-')) offset = -offset;
    body = s.Left(len - 6);
    return true;
}

bool ParseIsoInstant(const wxString &s, wxDateTime &out) {
    wxString body;
    long offset = 0;
    if (!SplitUtcOffset(s, body, offset)) return false;

    // fractional seconds carry no information at report resolution
    int dot = body.Find(wxT('.'));
    if (dot != wxNOT_FOUND) body = body.Left(dot);

    wxDateTime dt;
    if (!dt.ParseISOCombined(body) || !dt.IsValid()) return false;

    // ParseISOCombined() reads local time; reinterpret in the given offset
    dt.MakeFromTimezone(wxDateTime::TimeZone(offset));
    out = dt;
    return true;
}

bool GetInstant(const wxJSONValue &obj, const wxString &key, wxDateTime &out) {
    wxJSONValue dt;
    if (!GetNested(obj, key, wxT("dt"), dt) || !dt.IsString()) return false;
    return ParseIsoInstant(dt.AsString(), out);
}
