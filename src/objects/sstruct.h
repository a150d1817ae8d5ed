/*
** $Id: sstruct.h $
** Struct values
** See Copyright Notice in sky.h
*/

#ifndef sstruct_h
#define sstruct_h

#include <span>
#include <string>

#include "sobject_core.h"
#include "smap.h"
#include "sstate.h"
#include "sstring.h"
#include "sview.h"
#include "SkyVector.h"


class Dict;
class ValuePrinter;
enum class CmpOp;


/* a named field, as given to the constructors */
struct Field {
  TString *name;
  TValue value;
};


/*
** An immutable record of named fields. A struct carries a constructor,
** a value that brands a class of structs (the default constructor is
** the string "struct"); operations on two structs require equal
** constructors.
**
** The fields are inserted in ascending name order when the struct is
** built and never change afterwards, so walking them in insertion
** order walks them sorted. Merging and comparing rely on that.
*/
class Struct : public GCObject {
private:
  TValue ctor;
  StringMap fields;

public:
  Struct(sky_State *L, const TValue& c, unsigned sizehint)
    : ctor(c), fields(L, sizehint) {}

  /* build a struct; with repeated names, the last value wins */
  static Struct *create (sky_State *L, const TValue& c,
                         std::span<const Field> fs);
  /* the 'struct(**kwargs)' built-in */
  static Struct *make (sky_State *L, std::span<const TValue> args,
                       std::span<const Field> kwargs);

  const TValue& constructor () const noexcept { return ctor; }
  bool hasDefaultConstructor (sky_State *L) const noexcept;

  TValue attr (sky_State *L, TString *name) const;
  [[nodiscard]] bool hasAttr (TString *name) const;
  SkyVector<TString *> attrNames () const { return fields.keys(); }

  static Struct *merge (sky_State *L, const Struct *x, const Struct *y);
  static bool equals (sky_State *L, const Struct *x, const Struct *y,
                      int depth);
  static bool compareSameType (sky_State *L, CmpOp op, const Struct *x,
                               const Struct *y, int depth);
  l_hash hash (sky_State *L) const;

  void freeze () { fields.freeze(); }
  bool isFrozen () const noexcept { return fields.isFrozen(); }

  unsigned len () const noexcept { return fields.len(); }
  bool truth () const noexcept { return true; }  /* even when empty */
  static const char *typeName () noexcept { return "struct"; }

  std::string tostring (sky_State *L) const;
  void write (ValuePrinter& p) const;

  /* a positional view of the fields */
  OrderedView toView (sky_State *L) const { return OrderedView(L, fields); }
  /* add an entry to 'd' for each field */
  void toDict (Dict *d) const;

  const StringMap& getFields () const noexcept { return fields; }
};


#endif
