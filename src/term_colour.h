#ifndef _TERM_COLOUR_H_
#define _TERM_COLOUR_H_

#include <wx/string.h>

// The 16 ANSI terminal colours plus the terminal's own default.
enum TermColour {
    TC_DEFAULT,
    TC_BLACK, TC_RED, TC_GREEN, TC_YELLOW,
    TC_BLUE, TC_MAGENTA, TC_CYAN, TC_WHITE,
    TC_BRIGHT_BLACK, TC_BRIGHT_RED, TC_BRIGHT_GREEN, TC_BRIGHT_YELLOW,
    TC_BRIGHT_BLUE, TC_BRIGHT_MAGENTA, TC_BRIGHT_CYAN, TC_BRIGHT_WHITE
};

// Wrap text in SGR escape sequences and a trailing reset. Empty text stays
// empty so optional components leave no stray escapes behind.
wxString Paint(const wxString &text, TermColour fg,
               TermColour bg = TC_DEFAULT);

// Remove all SGR sequences, e.g. to compare rendered text in tests.
wxString StripColour(const wxString &text);

#endif // _TERM_COLOUR_H_
