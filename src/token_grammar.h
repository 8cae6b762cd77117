#ifndef _TOKEN_GRAMMAR_H_
#define _TOKEN_GRAMMAR_H_

#include <wx/arrstr.h>
#include <wx/string.h>

class wxJSONValue;

// Join canonical token spellings into a regex alternation ("SKC|FEW|...").
// Empty spellings are left out (optional groups express them) and regex
// metacharacters are escaped, so "+" becomes "\+".
wxString BuildAlternation(const wxArrayString &tokens);

// Collect the "repr" strings of a report array such as "clouds" or
// "wx_codes". Entries without a string "repr" are skipped.
wxArrayString ReprStrings(const wxJSONValue &report, const wxString &key);

#endif // _TOKEN_GRAMMAR_H_
