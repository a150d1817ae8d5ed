/*
** $Id: sudata.h $
** Host-defined values
** See Copyright Notice in sky.h
*/

#ifndef sudata_h
#define sudata_h

#include <new>
#include <string>
#include <utility>

#include "sobject_core.h"
#include "smem.h"
#include "sstate.h"


/*
** Base of all values defined by the host. A userdata supplies its own
** type name, display, hashing, equality and freezing; the defaults are
** "unhashable", identity and "nothing to freeze".
**
** Userdata are created with 'skyU_new' and belong to the state like
** every other object.
*/
class Udata : public GCObject {
private:
  size_t objsize;   /* size of the complete object, set by 'skyU_new' */

public:
  Udata() noexcept : objsize(0) {}
  virtual ~Udata() = default;

  Udata(const Udata&) = delete;
  Udata& operator=(const Udata&) = delete;

  size_t getObjSize() const noexcept { return objsize; }
  void setObjSize(size_t s) noexcept { objsize = s; }

  virtual const char *typeName() const noexcept = 0;
  virtual void tostring(sky_State *L, std::string& out) const = 0;
  virtual l_hash hash(sky_State *L) const;
  /* 'other' always has the same dynamic type as 'this' */
  virtual bool equals(sky_State *L, const Udata *other, int depth) const;
  virtual void freeze(sky_State *L);
};


template<typename T, typename... Args>
T *skyU_new (sky_State *L, Args&&... args) {
  void *block = skyM_malloc_(L, sizeof(T));
  T *u;
  try {
    u = ::new (block) T(std::forward<Args>(args)...);
  }
  catch (...) {
    skyM_free_(L, block, sizeof(T));
    throw;
  }
  u->setObjSize(sizeof(T));
  L->linkObject(static_cast<Udata*>(u), SkyT::USERDATA);
  return u;
}


#endif
