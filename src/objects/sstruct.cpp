/*
** $Id: sstruct.c $
** Struct values
** See Copyright Notice in sky.h
*/

#define sstruct_c
#define SKY_CORE


#include <algorithm>
#include <string>

#include "sky.h"

#include "sdebug.h"
#include "sdo.h"
#include "sobject.h"
#include "sstruct.h"


Struct *Struct::create (sky_State *L, const TValue& c,
                        std::span<const Field> fs) {
  SkyVector<Field> sorted(L);
  sorted.reserve(fs.size());
  for (const Field& f : fs)
    sorted.push_back(f);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Field& a, const Field& b) {
                     return *a.name < *b.name;
                   });
  Struct *s = skyC_newobj<Struct>(L, SkyT::STRUCT, L, c,
                                  static_cast<unsigned>(sorted.size()));
  for (const Field& f : sorted)
    s->fields.insert(f.name, f.value);  /* a repeated name updates its value */
  return s;
}


Struct *Struct::make (sky_State *L, std::span<const TValue> args,
                      std::span<const Field> kwargs) {
  if (!args.empty())
    skyG_runerror(L, SKY_ERRRUN, "struct: unexpected positional arguments");
  return create(L, TValue::ofString(L->getStructName()), kwargs);
}


bool Struct::hasDefaultConstructor (sky_State *L) const noexcept {
  return ctor.isString() && ctor.stringValue()->equals(L->getStructName());
}


TValue Struct::attr (sky_State *L, TString *name) const {
  TValue v;
  if (fields.lookup(name, &v))
    return v;
  std::string prefix;
  if (!hasDefaultConstructor(L))
    prefix = skyV_tostring(L, &ctor) + " ";
  skyG_runerror(L, SKY_ERRATTR, "%sstruct has no .%s attribute",
                prefix.c_str(), name->c_str());
}


bool Struct::hasAttr (TString *name) const {
  return fields.lookup(name, nullptr);
}


/*
** Compare two constructors with the full depth budget. An error in the
** comparison is raised again with its status, its message prefixed by
** 'fmt' (which receives both constructors and the inner message).
*/
static bool sameConstructor (sky_State *L, const TValue& x, const TValue& y,
                             const char *fmt) {
  bool eq = false;
  int status = L->protect([&] { eq = skyV_equal(L, &x, &y); });
  if (status != SKY_OK) {
    std::string msg(L->getErrorMessage());
    std::string xs = skyV_tostring(L, &x);
    std::string ys = skyV_tostring(L, &y);
    skyG_runerror(L, status, fmt, xs.c_str(), ys.c_str(), msg.c_str());
  }
  return eq;
}


/*
** x + y: a struct with the fields of both operands; fields present in
** both take their value from 'y'. As both field lists are sorted, one
** linear pass builds the result, again in sorted order.
*/
Struct *Struct::merge (sky_State *L, const Struct *x, const Struct *y) {
  if (!sameConstructor(L, x->ctor, y->ctor,
                       "in %s + %s: error comparing constructors: %s")) {
    std::string xs = skyV_tostring(L, &x->ctor);
    std::string ys = skyV_tostring(L, &y->ctor);
    skyG_runerror(L, SKY_ERRCTOR,
                  "cannot add structs of different constructors: %s + %s",
                  xs.c_str(), ys.c_str());
  }
  const StringMap& xf = x->fields;
  const StringMap& yf = y->fields;
  Struct *s = skyC_newobj<Struct>(L, SkyT::STRUCT, L, x->ctor,
                                  xf.len() + yf.len());
  int ex = xf.headIndex();
  int ey = yf.headIndex();
  while (ex >= 0 && ey >= 0) {
    const StringMap::Entry& a = xf.entry(ex);
    const StringMap::Entry& b = yf.entry(ey);
    int c = a.key->compare(b.key);
    if (c < 0) {
      s->fields.insert(a.key, a.value);
      ex = a.next;
    }
    else if (c == 0) {
      s->fields.insert(b.key, b.value);
      ex = a.next;
      ey = b.next;
    }
    else {
      s->fields.insert(b.key, b.value);
      ey = b.next;
    }
  }
  for (; ex >= 0; ex = xf.entry(ex).next)
    s->fields.insert(xf.entry(ex).key, xf.entry(ex).value);
  for (; ey >= 0; ey = yf.entry(ey).next)
    s->fields.insert(yf.entry(ey).key, yf.entry(ey).value);
  return s;
}


bool Struct::equals (sky_State *L, const Struct *x, const Struct *y,
                     int depth) {
  if (x->len() != y->len())
    return false;
  if (!sameConstructor(L, x->ctor, y->ctor,
                       "error comparing struct constructors %s and %s: %s"))
    return false;
  const StringMap& xf = x->fields;
  const StringMap& yf = y->fields;
  for (int ex = xf.headIndex(), ey = yf.headIndex(); ex >= 0;
       ex = xf.entry(ex).next, ey = yf.entry(ey).next) {
    const StringMap::Entry& a = xf.entry(ex);
    const StringMap::Entry& b = yf.entry(ey);
    if (!a.key->equals(b.key))
      return false;
    if (!skyV_equalDepth(L, &a.value, &b.value, depth - 1))
      return false;
  }
  return true;
}


bool Struct::compareSameType (sky_State *L, CmpOp op, const Struct *x,
                              const Struct *y, int depth) {
  switch (op) {
    case CmpOp::EQ:
      return equals(L, x, y, depth);
    case CmpOp::NE:
      return !equals(L, x, y, depth);
    default:
      skyG_runerror(L, SKY_ERRRUN, "%s %s %s not implemented",
                    typeName(), skyO_opname(op), typeName());
  }
}


/*
** Order-dependent mix of the field hashes. Fields are sorted, so equal
** structs hash alike.
*/
l_hash Struct::hash (sky_State *L) const {
  l_hash x = 8731;
  l_hash m = 9839;
  for (int idx = fields.headIndex(); idx >= 0; idx = fields.entry(idx).next) {
    const StringMap::Entry& e = fields.entry(idx);
    x = x ^ (3 * e.key->getHash());
    l_hash y = skyV_hash(L, &e.value);  /* errors propagate */
    x = x ^ (y * m);
    m += 7349;
  }
  return x;
}


std::string Struct::tostring (sky_State *L) const {
  std::string out;
  ValuePrinter p(L, out);
  write(p);
  return out;
}


void Struct::write (ValuePrinter& p) const {
  if (hasDefaultConstructor(p.getState()))
    p.writeRaw("struct");  /* not the quoted string */
  else
    p.write(&ctor);
  p.writeRaw("(");
  for (int idx = fields.headIndex(); idx >= 0; idx = fields.entry(idx).next) {
    const StringMap::Entry& e = fields.entry(idx);
    if (idx != fields.headIndex())
      p.writeRaw(", ");
    p.writeRaw(e.key->view());
    p.writeRaw(" = ");
    p.write(&e.value);
  }
  p.writeRaw(")");
}


void Struct::toDict (Dict *d) const {
  for (int idx = fields.headIndex(); idx >= 0; idx = fields.entry(idx).next) {
    const StringMap::Entry& e = fields.entry(idx);
    d->set(TValue::ofString(e.key), e.value);
  }
}
