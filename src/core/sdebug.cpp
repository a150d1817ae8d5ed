/*
** $Id: sdebug.c $
** Error reporting of Sky
** See Copyright Notice in sky.h
*/

#define sdebug_c
#define SKY_CORE


#include <cstdarg>
#include <cstdio>

#include "sky.h"

#include "sdebug.h"
#include "sstate.h"


/*
** Format an error message into the state's error buffer and raise it
** with the given status. Arguments must not point into that buffer;
** callers embedding a previous message copy it first.
*/
l_noret skyG_runerror (sky_State *L, int status, const char *fmt, ...) {
  va_list argp;
  va_start(argp, fmt);
  std::vsnprintf(L->getErrorBuffer(), SKYI_MAXERRMSG, fmt, argp);
  va_end(argp);
  L->doThrow(status);
}
