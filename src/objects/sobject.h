/*
** $Id: sobject.h $
** Sky values and the operations on them
** See Copyright Notice in sky.h
*/


#ifndef sobject_h
#define sobject_h


#include <string>
#include <string_view>

#include "slimits.h"
#include "sky.h"
#include "sobject_core.h"
#include "sdict.h"
#include "sstring.h"
#include "sstruct.h"
#include "sudata.h"
#include "stvalue.h"
#include "SkyVector.h"


/*
** {==================================================================
** Typed access to collectable values
** ===================================================================
*/

inline TString *TValue::stringValue () const noexcept {
  return check_exp(isString(), static_cast<TString*>(value_.gc));
}

inline Dict *TValue::dictValue () const noexcept {
  return check_exp(isDict(), static_cast<Dict*>(value_.gc));
}

inline Struct *TValue::structValue () const noexcept {
  return check_exp(isStruct(), static_cast<Struct*>(value_.gc));
}

inline Udata *TValue::userdataValue () const noexcept {
  return check_exp(isUserdata(), static_cast<Udata*>(value_.gc));
}

inline void TValue::setString (TString *s) noexcept {
  setGC(s, SkyT::STRING);
}

inline void TValue::setDict (Dict *d) noexcept {
  setGC(d, SkyT::DICT);
}

inline void TValue::setStruct (Struct *s) noexcept {
  setGC(s, SkyT::STRUCT);
}

inline void TValue::setUserdata (Udata *u) noexcept {
  setGC(u, SkyT::USERDATA);
}

/* }================================================================== */


/* comparison operators */
enum class CmpOp { EQ, NE, LT, LE, GT, GE };


/*
** Writes the display form of values into a string. It remembers the
** containers it is inside of, so a container reached again through
** itself is written as an ellipsis.
*/
class ValuePrinter {
private:
  sky_State *L;
  std::string& out;
  SkyVector<const GCObject *> path;  /* containers being written */

public:
  ValuePrinter(sky_State *L, std::string& o) : L(L), out(o), path(L) {}

  sky_State *getState () const noexcept { return L; }
  void write (const TValue *v);
  void writeRaw (std::string_view s) { out.append(s); }
};


SKYI_FUNC const char *skyO_opname (CmpOp op);

SKYI_FUNC l_hash skyV_hash (sky_State *L, const TValue *v);
SKYI_FUNC bool skyV_equal (sky_State *L, const TValue *x, const TValue *y);
SKYI_FUNC bool skyV_equalDepth (sky_State *L, const TValue *x,
                                const TValue *y, int depth);
SKYI_FUNC void skyV_freeze (sky_State *L, TValue *v);
SKYI_FUNC std::string skyV_tostring (sky_State *L, const TValue *v);
SKYI_FUNC const char *skyV_typename (const TValue *v);


#endif
