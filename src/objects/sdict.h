/*
** $Id: sdict.h $
** Dictionary values
** See Copyright Notice in sky.h
*/

#ifndef sdict_h
#define sdict_h

#include "sobject_core.h"
#include "smap.h"
#include "sstate.h"


class ValuePrinter;


/*
** The associative collection value: an insertion-ordered mapping
** from hashable values to values.
*/
class Dict : public GCObject {
private:
  OrderedMap map;

public:
  Dict(sky_State *L, unsigned sizehint) : map(L, sizehint) {}

  static Dict *create (sky_State *L, unsigned sizehint = 0) {
    return skyC_newobj<Dict>(L, SkyT::DICT, L, sizehint);
  }

  void set (const TValue& k, const TValue& v) { map.insert(k, v); }
  [[nodiscard]] bool get (const TValue& k, TValue *v) const {
    return map.lookup(k, v);
  }
  bool del (const TValue& k, TValue *removed = nullptr) {
    return map.erase(k, removed);
  }
  void clear () { map.clear(); }
  void freeze () { map.freeze(); }
  bool isFrozen () const noexcept { return map.isFrozen(); }
  unsigned len () const noexcept { return map.len(); }

  OrderedMap& getMap () noexcept { return map; }
  const OrderedMap& getMap () const noexcept { return map; }

  bool equals (sky_State *L, const Dict *other, int depth) const;
  void write (ValuePrinter& p) const;
};


#endif
