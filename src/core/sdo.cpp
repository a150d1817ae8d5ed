/*
** $Id: sdo.c $
** Error recovery of Sky
** See Copyright Notice in sky.h
*/

#define sdo_c
#define SKY_CORE


#include <cstring>
#include <new>

#include "sky.h"

#include "sdo.h"
#include "sstate.h"
#include "sstring.h"


/*
** {======================================================
** Error-recovery functions
** =======================================================
*/

void sky_State::setErrorMessage(const char *msg) noexcept {
  size_t l = std::strlen(msg);
  if (l >= SKYI_MAXERRMSG)
    l = SKYI_MAXERRMSG - 1;
  std::memmove(errmsg, msg, l);  /* 'msg' may point into 'errmsg' */
  errmsg[l] = '\0';
}


/*
** Throw an error with the given status. The message must already be
** in the error buffer.
*/
l_noret sky_State::doThrow(int errcode) {
  sky_assert(errcode != SKY_OK);
  throw SkyException(errcode);
}


l_noret sky_State::memoryError() {
  setErrorMessage(MEMERRMSG);
  doThrow(SKY_ERRMEM);
}


/*
** Execute 'f' in protected mode. Errors raised by the core are turned
** back into their status, and so is a failed allocation of a standard
** container; any other exception goes on to the caller.
** Nested calls need no handler chain: each level has its own 'try'.
*/
int sky_State::runProtected(Pfunc f, void *u) {
  try {
    f(this, u);  /* call function protected */
  }
  catch (const SkyException& ex) {
    return ex.status();
  }
  catch (const std::bad_alloc&) {  /* from a standard container */
    setErrorMessage(MEMERRMSG);
    return SKY_ERRMEM;
  }
  errmsg[0] = '\0';
  return SKY_OK;
}

/* }====================================================== */


SKY_API const char *sky_statusname (int status) {
  switch (status) {
    case SKY_OK: return "ok";
    case SKY_ERRRUN: return "runtime error";
    case SKY_ERRMEM: return "memory error";
    case SKY_ERRUNHASHABLE: return "unhashable";
    case SKY_ERRFROZEN: return "frozen";
    case SKY_ERRITER: return "iteration in progress";
    case SKY_ERRATTR: return "no such attribute";
    case SKY_ERRCTOR: return "constructor mismatch";
    case SKY_ERRDUPKEY: return "duplicate key";
    case SKY_ERRDEPTH: return "depth exceeded";
    default: return "unknown status";
  }
}
