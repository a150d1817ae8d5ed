/*
** $Id: sdict.c $
** Dictionary values
** See Copyright Notice in sky.h
*/

#define sdict_c
#define SKY_CORE


#include "sky.h"

#include "sdict.h"
#include "sobject.h"


/*
** Two dicts are equal when they have the same keys, each mapped to
** equal values; order does not matter.
*/
bool Dict::equals (sky_State *L, const Dict *other, int depth) const {
  if (len() != other->len())
    return false;
  auto it = map.iterate();
  TValue k, xv;
  while (it.next(&k, &xv)) {
    TValue yv;
    if (!other->get(k, &yv))
      return false;
    if (!skyV_equalDepth(L, &xv, &yv, depth - 1))
      return false;
  }
  return true;
}


void Dict::write (ValuePrinter& p) const {
  auto it = map.iterate();
  TValue k, v;
  bool first = true;
  p.writeRaw("{");
  while (it.next(&k, &v)) {
    if (!first)
      p.writeRaw(", ");
    first = false;
    p.write(&k);
    p.writeRaw(": ");
    p.write(&v);
  }
  p.writeRaw("}");
}
