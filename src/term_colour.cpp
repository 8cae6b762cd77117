#include "term_colour.h"

static const wxChar ESC = wxT('\x1b');

// SGR foreground code; background is the same plus 10.
static int ForegroundCode(TermColour c) {
    switch (c) {
    case TC_BLACK:          return 30;
    case TC_RED:            return 31;
    case TC_GREEN:          return 32;
    case TC_YELLOW:         return 33;
    case TC_BLUE:           return 34;
    case TC_MAGENTA:        return 35;
    case TC_CYAN:           return 36;
    case TC_WHITE:          return 37;
    case TC_BRIGHT_BLACK:   return 90;
    case TC_BRIGHT_RED:     return 91;
    case TC_BRIGHT_GREEN:   return 92;
    case TC_BRIGHT_YELLOW:  return 93;
    case TC_BRIGHT_BLUE:    return 94;
    case TC_BRIGHT_MAGENTA: return 95;
    case TC_BRIGHT_CYAN:    return 96;
    case TC_BRIGHT_WHITE:   return 97;
    case TC_DEFAULT:        break;
    }
    return 0;
}

wxString Paint(const wxString &text, TermColour fg, TermColour bg) {
    if (text.IsEmpty()) return text;
    if (fg == TC_DEFAULT && bg == TC_DEFAULT) return text;

    wxString codes;
    if (fg != TC_DEFAULT)
        codes += wxString::Format(wxT("%d"), ForegroundCode(fg));
    if (bg != TC_DEFAULT) {
        if (!codes.IsEmpty()) codes += wxT(';');
        codes += wxString::Format(wxT("%d"), ForegroundCode(bg) + 10);
    }
    return wxString(ESC) + wxT("[") + codes + wxT("m") + text +
           wxString(ESC) + wxT("[0m");
}

wxString StripColour(const wxString &text) {
    wxString out;
    out.reserve(text.length());
    size_t i = 0;
    while (i < text.length()) {
        if (text[i] == ESC && i + 1 < text.length() && text[i + 1] == wxT('[')) {
            size_t j = i + 2;
            while (j < text.length() && text[j] != wxT('m')) j++;
            i = j + 1;
            continue;
        }
        out += text[i];
        i++;
    }
    return out;
}
