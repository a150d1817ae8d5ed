/*
** $Id: stvalue.h $
** Tagged Values (TValue class)
** See Copyright Notice in sky.h
*/

#ifndef stvalue_h
#define stvalue_h

#include "slimits.h"
#include "sky.h"


/*
** tags for Tagged Values have the following use of bits:
** bits 0-3: actual tag (a SKY_T* constant)
** bit 6: whether value is collectable
*/

/* Bit mark for collectable types */
inline constexpr int BIT_ISCOLLECTABLE = (1 << 6);


/*
** {==================================================================
** Tags for all Sky types
** ===================================================================
*/

enum class SkyT : lu_byte {
  NONE     = SKY_TNONE,
  BOOL     = SKY_TBOOL,
  INT      = SKY_TINT,
  FLOAT    = SKY_TFLOAT,
  STRING   = SKY_TSTRING | BIT_ISCOLLECTABLE,
  DICT     = SKY_TDICT | BIT_ISCOLLECTABLE,
  STRUCT   = SKY_TSTRUCT | BIT_ISCOLLECTABLE,
  USERDATA = SKY_TUSERDATA | BIT_ISCOLLECTABLE
};

/* tag with no collectable bit (bits 0-3) */
constexpr int novariant(SkyT t) noexcept { return (static_cast<int>(t) & 0x0F); }

/* }================================================================== */


class GCObject;


/*
** Union of all Sky values
*/
typedef union Value {
  GCObject *gc;    /* collectable objects */
  sky_Integer i;   /* integer numbers */
  sky_Number n;    /* float numbers */
  int b;           /* booleans */
} Value;


class TString;
class Dict;
class Struct;
class Udata;


/*
** Tagged Values. This is the basic representation of values in Sky:
** an actual value plus a tag with its type. Values never own the
** objects they point to; objects belong to their state.
*/
class TValue {
private:
  Value value_;
  SkyT tt_;

public:
  constexpr TValue() noexcept : value_{nullptr}, tt_(SkyT::NONE) {}

  // Factories
  static TValue none() noexcept { return TValue(); }
  static TValue ofBool(bool b) noexcept { TValue v; v.setBool(b); return v; }
  static TValue ofInt(sky_Integer i) noexcept { TValue v; v.setInt(i); return v; }
  static TValue ofFloat(sky_Number n) noexcept { TValue v; v.setFloat(n); return v; }
  static TValue ofString(TString* s) noexcept { TValue v; v.setString(s); return v; }
  static TValue ofDict(Dict* d) noexcept { TValue v; v.setDict(d); return v; }
  static TValue ofStruct(Struct* s) noexcept { TValue v; v.setStruct(s); return v; }
  static TValue ofUserdata(Udata* u) noexcept { TValue v; v.setUserdata(u); return v; }

  SkyT getType() const noexcept { return tt_; }
  int baseType() const noexcept { return novariant(tt_); }
  const Value& getValue() const noexcept { return value_; }

  // Type checks
  bool isNone() const noexcept { return tt_ == SkyT::NONE; }
  bool isBool() const noexcept { return tt_ == SkyT::BOOL; }
  bool isInt() const noexcept { return tt_ == SkyT::INT; }
  bool isFloat() const noexcept { return tt_ == SkyT::FLOAT; }
  bool isNumber() const noexcept { return isInt() || isFloat(); }
  bool isString() const noexcept { return tt_ == SkyT::STRING; }
  bool isDict() const noexcept { return tt_ == SkyT::DICT; }
  bool isStruct() const noexcept { return tt_ == SkyT::STRUCT; }
  bool isUserdata() const noexcept { return tt_ == SkyT::USERDATA; }
  bool isCollectable() const noexcept {
    return (static_cast<int>(tt_) & BIT_ISCOLLECTABLE) != 0;
  }

  // Value accessors
  bool boolValue() const noexcept { return value_.b != 0; }
  sky_Integer intValue() const noexcept { return value_.i; }
  sky_Number floatValue() const noexcept { return value_.n; }
  sky_Number numberValue() const noexcept {
    return isInt() ? cast_num(value_.i) : value_.n;
  }
  GCObject* gcValue() const noexcept { return value_.gc; }
  // Typed object accessors and setters (defined in sobject.h, where the
  // object classes are complete)
  inline TString* stringValue() const noexcept;
  inline Dict* dictValue() const noexcept;
  inline Struct* structValue() const noexcept;
  inline Udata* userdataValue() const noexcept;

  // Setters
  void setNone() noexcept { value_.gc = nullptr; tt_ = SkyT::NONE; }
  void setBool(bool b) noexcept { value_.b = b; tt_ = SkyT::BOOL; }
  void setInt(sky_Integer i) noexcept { value_.i = i; tt_ = SkyT::INT; }
  void setFloat(sky_Number n) noexcept { value_.n = n; tt_ = SkyT::FLOAT; }
  inline void setString(TString* s) noexcept;
  inline void setDict(Dict* d) noexcept;
  inline void setStruct(Struct* s) noexcept;
  inline void setUserdata(Udata* u) noexcept;

  void setGC(GCObject* o, SkyT t) noexcept { value_.gc = o; tt_ = t; }
};


#endif
