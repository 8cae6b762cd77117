#ifndef _WXFETCH_H_
#define _WXFETCH_H_

#define WXFETCH_VERSION_MAJOR 0
#define WXFETCH_VERSION_MINOR 4

#endif // _WXFETCH_H_
