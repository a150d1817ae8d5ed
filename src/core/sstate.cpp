/*
** $Id: sstate.c $
** Global State
** See Copyright Notice in sky.h
*/

#define sstate_c
#define SKY_CORE


#include <cstdlib>
#include <new>

#include "sky.h"

#include "sdo.h"
#include "smem.h"
#include "sobject.h"
#include "sstate.h"
#include "sstring.h"


static void freeobj (sky_State *L, GCObject *o) {
  switch (o->getType()) {
    case SkyT::STRING:
      static_cast<TString*>(o)->destroy(L);
      break;
    case SkyT::DICT: {
      Dict *d = static_cast<Dict*>(o);
      d->~Dict();
      skyM_free(L, d);
      break;
    }
    case SkyT::STRUCT: {
      Struct *s = static_cast<Struct*>(o);
      s->~Struct();
      skyM_free(L, s);
      break;
    }
    case SkyT::USERDATA: {
      Udata *u = static_cast<Udata*>(o);
      void *block = dynamic_cast<void*>(u);  /* start of the full object */
      size_t size = u->getObjSize();
      u->~Udata();
      skyM_free_(L, block, size);
      break;
    }
    default: sky_assert(0);
  }
}


/*
** Free every object of the state. Objects never refer to each other
** from their destructors, so the order does not matter.
*/
void sky_State::freeAllObjects() {
  while (allgc != nullptr) {
    GCObject *o = allgc;
    allgc = o->getNext();
    freeobj(this, o);
  }
  structName = nullptr;
}


static void f_skyopen (sky_State *L, void *ud) {
  UNUSED(ud);
  L->setStructName(TString::create(L, "struct"));
}


static void close_state (sky_State *L) {
  sky_Alloc f = L->getFrealloc();
  void *ud = L->getUd();
  L->freeAllObjects();
  sky_assert(L->getTotalBytes() == 0);
  L->~sky_State();
  (*f)(ud, L, sizeof(sky_State), 0);  /* free main block */
}


SKY_API sky_State *sky_newstate (sky_Alloc f, void *ud) {
  void *block = (*f)(ud, nullptr, 0, sizeof(sky_State));
  if (block == nullptr) return nullptr;
  sky_State *L = ::new (block) sky_State(f, ud);
  if (L->runProtected(f_skyopen, nullptr) != SKY_OK) {
    /* memory allocation error: free partial state */
    close_state(L);
    L = nullptr;
  }
  return L;
}


SKY_API void sky_close (sky_State *L) {
  close_state(L);
}


SKY_API sky_Alloc sky_getallocf (sky_State *L, void **ud) {
  if (ud) *ud = L->getUd();
  return L->getFrealloc();
}


/*
** Default allocator, on top of the C library
*/
static void *l_alloc (void *ud, void *ptr, size_t osize, size_t nsize) {
  UNUSED(ud); UNUSED(osize);
  if (nsize == 0) {
    std::free(ptr);
    return nullptr;
  }
  else
    return std::realloc(ptr, nsize);
}


SKY_API sky_State *skyL_newstate (void) {
  return sky_newstate(l_alloc, nullptr);
}
