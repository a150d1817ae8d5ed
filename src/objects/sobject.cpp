/*
** $Id: sobject.c $
** Generic functions over Sky values
** See Copyright Notice in sky.h
*/

#define sobject_c
#define SKY_CORE


#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <typeinfo>

#include "sky.h"

#include "sdebug.h"
#include "sobject.h"
#include "sstate.h"


static const char *const skyT_typenames_[SKY_NUMTYPES] = {
  "NoneType", "bool", "int", "float", "string", "dict", "struct", "userdata"
};


SKY_API const char *sky_typename (int tp) {
  if (tp < 0 || tp >= SKY_NUMTYPES)
    return "no value";
  return skyT_typenames_[tp];
}


const char *skyV_typename (const TValue *v) {
  if (v->isUserdata())
    return v->userdataValue()->typeName();
  return skyT_typenames_[v->baseType()];
}


const char *skyO_opname (CmpOp op) {
  switch (op) {
    case CmpOp::EQ: return "==";
    case CmpOp::NE: return "!=";
    case CmpOp::LT: return "<";
    case CmpOp::LE: return "<=";
    case CmpOp::GT: return ">";
    default: return ">=";
  }
}


/*
** {==================================================================
** Hashing
** ===================================================================
*/

static l_hash hashint (sky_Integer i) {
  return cast_hash(12582917u * (cast_hash(i) + 3u));
}


/*
** If 'n' has an exact integer value, put it in '*p'.
*/
static bool floattoint (sky_Number n, sky_Integer *p) {
  if (!std::isfinite(n) || std::floor(n) != n)
    return false;
  /* range of sky_Integer as floats: [-2^63, 2^63) */
  if (n < -9223372036854775808.0 || n >= 9223372036854775808.0)
    return false;
  *p = static_cast<sky_Integer>(n);
  return true;
}


l_hash skyV_hash (sky_State *L, const TValue *v) {
  switch (v->getType()) {
    case SkyT::NONE: return 0;
    case SkyT::BOOL: return v->boolValue() ? 1 : 0;
    case SkyT::INT: return hashint(v->intValue());
    case SkyT::FLOAT: {
      sky_Integer i;
      if (floattoint(v->floatValue(), &i))
        return hashint(i);  /* equal numbers hash alike */
      uint64_t bits;
      sky_Number n = v->floatValue();
      std::memcpy(&bits, &n, sizeof(bits));
      return cast_hash(bits ^ (bits >> 32));
    }
    case SkyT::STRING: return v->stringValue()->getHash();
    case SkyT::STRUCT: return v->structValue()->hash(L);
    case SkyT::USERDATA: return v->userdataValue()->hash(L);
    default:
      skyG_runerror(L, SKY_ERRUNHASHABLE, "unhashable type: %s",
                    skyV_typename(v));
  }
}

/* }================================================================== */


/*
** {==================================================================
** Equality
** ===================================================================
*/

static bool numequal (const TValue *x, const TValue *y) {
  if (x->isInt() && y->isInt())
    return x->intValue() == y->intValue();
  else if (x->isFloat() && y->isFloat())
    return x->floatValue() == y->floatValue();
  else {  /* one int and one float */
    const TValue *i = x->isInt() ? x : y;
    const TValue *f = x->isInt() ? y : x;
    sky_Integer fi;
    return floattoint(f->floatValue(), &fi) && fi == i->intValue();
  }
}


bool skyV_equal (sky_State *L, const TValue *x, const TValue *y) {
  return skyV_equalDepth(L, x, y, SKYI_MAXDEPTH);
}


/*
** Each level of containers consumes one unit of 'depth'; running out
** of it is an error, never an answer.
*/
bool skyV_equalDepth (sky_State *L, const TValue *x, const TValue *y,
                      int depth) {
  if (depth < 1)
    skyG_runerror(L, SKY_ERRDEPTH, "comparison exceeded maximum recursion depth");
  if (x->isNumber() && y->isNumber())
    return numequal(x, y);
  if (x->getType() != y->getType())
    return false;
  switch (x->getType()) {
    case SkyT::NONE: return true;
    case SkyT::BOOL: return x->boolValue() == y->boolValue();
    case SkyT::STRING: return x->stringValue()->equals(y->stringValue());
    case SkyT::DICT:
      return x->dictValue() == y->dictValue() ||
             x->dictValue()->equals(L, y->dictValue(), depth);
    case SkyT::STRUCT:
      return Struct::equals(L, x->structValue(), y->structValue(), depth);
    case SkyT::USERDATA: {
      const Udata *ux = x->userdataValue();
      const Udata *uy = y->userdataValue();
      if (typeid(*ux) != typeid(*uy))
        return false;
      return ux->equals(L, uy, depth);
    }
    default:
      sky_assert(0);
      return false;
  }
}

/* }================================================================== */


/*
** Deep freeze. Containers mark themselves frozen before visiting their
** contents, which stops the recursion on cycles.
*/
void skyV_freeze (sky_State *L, TValue *v) {
  switch (v->getType()) {
    case SkyT::DICT: v->dictValue()->freeze(); break;
    case SkyT::STRUCT: v->structValue()->freeze(); break;
    case SkyT::USERDATA: v->userdataValue()->freeze(L); break;
    default: break;  /* immutable */
  }
}


/*
** {==================================================================
** Display
** ===================================================================
*/

static void writenumber (std::string& out, sky_Number n) {
  if (std::isnan(n)) {
    out.append("nan");
    return;
  }
  if (std::isinf(n)) {
    out.append(n > 0 ? "+inf" : "-inf");
    return;
  }
  char buff[64];
  auto res = std::to_chars(buff, buff + sizeof(buff), n);
  std::string_view s(buff, res.ptr - buff);
  out.append(s);
  if (s.find_first_of(".e") == std::string_view::npos)
    out.append(".0");  /* looks like a float */
}


static void writequoted (std::string& out, std::string_view s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
      case '"': out.append("\\\""); break;
      case '\\': out.append("\\\\"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (c < 0x20 || c == 0x7f) {
          char buff[8];
          std::snprintf(buff, sizeof(buff), "\\x%02x", c);
          out.append(buff);
        }
        else
          out.push_back(static_cast<char>(c));
    }
  }
  out.push_back('"');
}


void ValuePrinter::write (const TValue *v) {
  switch (v->getType()) {
    case SkyT::NONE: out.append("None"); break;
    case SkyT::BOOL: out.append(v->boolValue() ? "True" : "False"); break;
    case SkyT::INT: out.append(std::to_string(v->intValue())); break;
    case SkyT::FLOAT: writenumber(out, v->floatValue()); break;
    case SkyT::STRING: writequoted(out, v->stringValue()->view()); break;
    case SkyT::USERDATA: v->userdataValue()->tostring(L, out); break;
    case SkyT::DICT:
    case SkyT::STRUCT: {
      const GCObject *o = v->gcValue();
      if (std::find(path.begin(), path.end(), o) != path.end()) {
        out.append(v->isDict() ? "{...}" : "struct(...)");  /* cycle */
        break;
      }
      path.push_back(o);
      if (v->isDict())
        v->dictValue()->write(*this);
      else
        v->structValue()->write(*this);
      path.pop_back();
      break;
    }
  }
}


std::string skyV_tostring (sky_State *L, const TValue *v) {
  std::string out;
  ValuePrinter p(L, out);
  p.write(v);
  return out;
}

/* }================================================================== */
