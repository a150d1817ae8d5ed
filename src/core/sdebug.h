/*
** $Id: sdebug.h $
** Error reporting of Sky
** See Copyright Notice in sky.h
*/

#ifndef sdebug_h
#define sdebug_h


#include "sstate.h"


SKYI_FUNC l_noret skyG_runerror (sky_State *L, int status,
                                               const char *fmt, ...);


#endif
