/*
** $Id: sstring.h $
** Strings
** See Copyright Notice in sky.h
*/

#ifndef sstring_h
#define sstring_h

#include <cstring>
#include <string_view>

#include "sobject_core.h"


/*
** Memory-allocation error message is fixed text (it cannot be created
** after memory is exhausted)
*/
#define MEMERRMSG       "not enough memory"


/*
** Header for a string value. The contents follow the header in the
** same block, terminated by a '\0' (which is not part of the string).
** Strings are immutable; their hash is computed once at creation.
*/
class TString : public GCObject {
private:
  l_hash hash;
  size_t len;

public:
  TString(size_t l, l_hash h) noexcept : hash(h), len(l) {}

  size_t length() const noexcept { return len; }
  l_hash getHash() const noexcept { return hash; }

  const char* c_str() const noexcept {
    return reinterpret_cast<const char*>(this + 1);
  }
  char* getContents() noexcept { return reinterpret_cast<char*>(this + 1); }
  std::string_view view() const noexcept { return std::string_view(c_str(), len); }

  bool equals(const TString* other) const noexcept {
    return this == other ||
           (len == other->len && hash == other->hash &&
            std::memcmp(c_str(), other->c_str(), len) == 0);
  }

  /* bytewise three-way comparison */
  [[nodiscard]] int compare(const TString* other) const noexcept;

  static constexpr size_t totalSize(size_t l) noexcept {
    return sizeof(TString) + (l + 1) * sizeof(char);
  }

  [[nodiscard]] static l_hash computeHash(const char* str, size_t l) noexcept;
  [[nodiscard]] static TString* create(sky_State* L, const char* str, size_t l);
  [[nodiscard]] static TString* create(sky_State* L, const char* str);  // null-terminated
  [[nodiscard]] static TString* create(sky_State* L, std::string_view str);
  void destroy(sky_State* L);

  friend bool operator<(const TString& l, const TString& r) noexcept {
    return l.compare(&r) < 0;
  }
};


#endif
