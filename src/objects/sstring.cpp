/*
** $Id: sstring.c $
** Strings
** See Copyright Notice in sky.h
*/

#define sstring_c
#define SKY_CORE


#include <algorithm>
#include <cstring>
#include <new>

#include "sky.h"

#include "smem.h"
#include "sstate.h"
#include "sstring.h"


/*
** 32-bit FNV-1a. The result must be the same for equal contents on
** every platform, as struct hashes are built from field-name hashes.
*/
l_hash TString::computeHash(const char* str, size_t l) noexcept {
  l_hash h = 2166136261u;
  for (size_t i = 0; i < l; i++) {
    h ^= cast_uchar(str[i]);
    h *= 16777619u;
  }
  return h;
}


int TString::compare(const TString* other) const noexcept {
  size_t minlen = std::min(len, other->len);
  int res = std::memcmp(c_str(), other->c_str(), minlen);
  if (res != 0)
    return res;
  else if (len == other->len)
    return 0;
  else
    return (len < other->len) ? -1 : 1;
}


TString* TString::create(sky_State* L, const char* str, size_t l) {
  if (l_unlikely(l >= MAX_SIZET - sizeof(TString)))
    skyM_toobig(L);
  size_t totalsize = totalSize(l);
  void* block = skyM_malloc_(L, totalsize);
  TString* ts = ::new (block) TString(l, computeHash(str, l));
  if (l > 0)
    std::memcpy(ts->getContents(), str, l * sizeof(char));
  ts->getContents()[l] = '\0';  /* ending 0 */
  L->linkObject(ts, SkyT::STRING);
  return ts;
}


TString* TString::create(sky_State* L, const char* str) {
  return create(L, str, std::strlen(str));
}


TString* TString::create(sky_State* L, std::string_view str) {
  return create(L, str.data(), str.size());
}


void TString::destroy(sky_State* L) {
  size_t totalsize = totalSize(len);
  this->~TString();
  skyM_free_(L, static_cast<void*>(this), totalsize);
}
