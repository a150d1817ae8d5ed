/*
** $Id: sudata.c $
** Host-defined values
** See Copyright Notice in sky.h
*/

#define sudata_c
#define SKY_CORE


#include "sky.h"

#include "sdebug.h"
#include "sudata.h"


l_hash Udata::hash(sky_State *L) const {
  skyG_runerror(L, SKY_ERRUNHASHABLE, "unhashable type: %s", typeName());
}


bool Udata::equals(sky_State *L, const Udata *other, int depth) const {
  UNUSED(L); UNUSED(depth);
  return this == other;
}


void Udata::freeze(sky_State *L) {
  UNUSED(L);
}
