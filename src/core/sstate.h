/*
** $Id: sstate.h $
** Global State
** See Copyright Notice in sky.h
*/

#ifndef sstate_h
#define sstate_h

#include <new>
#include <utility>

#include "sky.h"

#include "slimits.h"
#include "smem.h"
#include "sobject_core.h"


/*
** About the ownership of objects:
**
** Every collectable object (strings, dicts, structs, userdata) is
** created through its state and linked into the 'allgc' list. There
** is no collector: objects live until the state is closed, when
** 'sky_close' walks the list and frees all of them. Values (TValue)
** are plain references into that list and never own anything.
**
** Containers embedded in objects or on the host stack (HashTable,
** OrderedView) own their bucket arrays and free them in their
** destructors.
*/


/* type of protected functions, to be run by 'runProtected' */
typedef void (*Pfunc) (sky_State *L, void *ud);


class TString;


class sky_State {
private:
  sky_Alloc frealloc;          /* function to reallocate memory */
  void *ud;                    /* auxiliary data to 'frealloc' */
  l_mem totalbytes;            /* number of bytes currently allocated */
  GCObject *allgc;             /* list of all collectable objects */
  TString *structName;         /* name of the default struct constructor */
  char errmsg[SKYI_MAXERRMSG]; /* message of the last error */

public:
  sky_State(sky_Alloc f, void *u) noexcept
    : frealloc(f), ud(u), totalbytes(0), allgc(nullptr),
      structName(nullptr) {
    errmsg[0] = '\0';
  }

  sky_State(const sky_State&) = delete;
  sky_State& operator=(const sky_State&) = delete;

  /* memory */
  sky_Alloc getFrealloc() const noexcept { return frealloc; }
  void *getUd() const noexcept { return ud; }
  void *callAllocator(void *block, size_t osize, size_t nsize) noexcept {
    return (*frealloc)(ud, block, osize, nsize);
  }
  l_mem getTotalBytes() const noexcept { return totalbytes; }
  void addTotalBytes(l_mem delta) noexcept { totalbytes += delta; }

  /* objects */
  void linkObject(GCObject *o, SkyT tt) noexcept {
    o->setType(tt);
    o->setNext(allgc);
    allgc = o;
  }
  GCObject *getAllGC() const noexcept { return allgc; }
  void freeAllObjects();

  TString *getStructName() const noexcept { return structName; }
  void setStructName(TString *s) noexcept { structName = s; }

  /* errors (implemented in sdo.cpp) */
  const char *getErrorMessage() const noexcept { return errmsg; }
  void setErrorMessage(const char *msg) noexcept;
  char *getErrorBuffer() noexcept { return errmsg; }

  l_noret doThrow(int errcode);
  l_noret memoryError();
  [[nodiscard]] int runProtected(Pfunc f, void *ud);
  template<typename F>
  [[nodiscard]] int protect(F&& f);
};


/*
** Allocate and construct a collectable object of type 'T', linking it
** into the state. If the constructor raises an error, the block is
** released before the error propagates.
*/
template<typename T, typename... Args>
T *skyC_newobj (sky_State *L, SkyT tt, Args&&... args) {
  void *block = skyM_malloc_(L, sizeof(T));
  T *o;
  try {
    o = ::new (block) T(std::forward<Args>(args)...);
  }
  catch (...) {
    skyM_free_(L, block, sizeof(T));
    throw;
  }
  L->linkObject(o, tt);
  return o;
}


#endif
