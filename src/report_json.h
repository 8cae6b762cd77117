#ifndef _REPORT_JSON_H_
#define _REPORT_JSON_H_

#include <wx/datetime.h>
#include <wx/string.h>

class wxJSONValue;

// Parse a provider response body. On a syntax error logs an excerpt of
// the body, sets error_msg and returns false.
bool ParseJsonDocument(const wxString &json, wxJSONValue &root,
                       wxString &error_msg);

// Read an integer regardless of how wxJSONReader chose to store it
// (int, uint, long, ulong, int64). Doubles are rejected.
bool SafeLong(const wxJSONValue &v, long &out);

// obj[key][sub], e.g. report["wind_speed"]["value"]. False if either level
// is missing.
bool GetNested(const wxJSONValue &obj, const wxString &key,
               const wxString &sub, wxJSONValue &out);

// obj[key] as a string.
bool GetString(const wxJSONValue &obj, const wxString &key, wxString &out);

// "YYYY-MM-DDTHH:MM:SS[.fff]" followed by "Z" or "+HH:MM"/"-HH:MM".
// The result is the absolute instant; the offset is not kept.
bool ParseIsoInstant(const wxString &s, wxDateTime &out);

// obj[key]["dt"] parsed with ParseIsoInstant(), the provider's shape for
// "time", "start_time" and "end_time".
bool GetInstant(const wxJSONValue &obj, const wxString &key, wxDateTime &out);

#endif // _REPORT_JSON_H_
