/*
** $Id: sdo.h $
** Error recovery of Sky
** See Copyright Notice in sky.h
*/

#ifndef sdo_h
#define sdo_h


#include <type_traits>
#include <utility>

#include "slimits.h"
#include "sstate.h"


/*
** Exception thrown by 'sky_State::doThrow'. It carries only the error
** status; the message stays in the state's error buffer.
*/
class SkyException {
private:
  int status_;

public:
  explicit SkyException(int status) noexcept : status_(status) {}

  int status() const noexcept { return status_; }
};


/*
** Run a callable in protected mode. Returns SKY_OK, or the status of
** the error raised inside it (its message is then available through
** 'getErrorMessage').
**
**   int st = L->protect([&] { m.insert(k, v); });
*/
template<typename F>
int sky_State::protect(F&& f) {
  auto call = [](sky_State *L, void *ud) {
    UNUSED(L);
    (*static_cast<std::remove_reference_t<F>*>(ud))();
  };
  return runProtected(call, static_cast<void*>(&f));
}


#endif
