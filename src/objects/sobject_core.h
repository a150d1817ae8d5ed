/*
** $Id: sobject_core.h $
** Core collectable object type
** See Copyright Notice in sky.h
*/


#ifndef sobject_core_h
#define sobject_core_h


#include "slimits.h"
#include "sky.h"
#include "stvalue.h"  /* TValue class */


/*
** {==================================================================
** Collectable Objects
** ===================================================================
*/

/*
** Common base of all collectable objects. Every object belongs to
** exactly one state and is linked into its 'allgc' list through
** 'next' from creation until the state is closed.
*/
class GCObject {
protected:
  GCObject* next;     /* 'allgc' list linkage */
  SkyT tt;            /* type tag */

public:
  GCObject() noexcept : next(nullptr), tt(SkyT::NONE) {}

  GCObject* getNext() const noexcept { return next; }
  void setNext(GCObject* n) noexcept { next = n; }
  SkyT getType() const noexcept { return tt; }
  void setType(SkyT t) noexcept { tt = t; }
};

/* }================================================================== */


#endif
