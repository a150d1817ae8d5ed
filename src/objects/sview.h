/*
** $Id: sview.h $
** Positionally indexed string-keyed views
** See Copyright Notice in sky.h
*/

#ifndef sview_h
#define sview_h

#include <string_view>

#include "slimits.h"
#include "smap.h"
#include "sstate.h"
#include "sstring.h"
#include "stvalue.h"
#include "SkyVector.h"


struct ViewEntry {
  l_hash hash;
  TString *key;
  TValue value;
};


/* slots hold an entry index plus one; 0 is an empty slot */
struct ViewBucket {
  int slots[BUCKETSIZE] = {};
  int next = -1;
};


/*
** An OrderedView maps strings to values and also gives positional
** access to its entries, in the order they were appended. Keys are
** fixed once appended (only values may change), so it is built once
** from a complete key set, usually in sorted order.
**
** The entries live in a flat array; the buckets index into it, so the
** array may be reallocated without touching the buckets.
*/
class OrderedView {
private:
  sky_State *L;
  ViewBucket *buckets;   /* chain heads followed by overflow buckets */
  int nheads;            /* number of chain heads (a power of 2) */
  int nused;             /* buckets in use */
  int ncap;              /* size of 'buckets' */
  ViewEntry *entries;
  int nentries;
  int entcap;            /* size of 'entries' */
  ViewBucket bucket0;    /* storage for single-chain views */

  int getEntry (l_hash h, std::string_view k) const noexcept;
  void place (int idx);
  void rehash (int newheads);
  void freeBuckets () noexcept;
  void checkIndex (int i) const;

public:
  explicit OrderedView(sky_State *L, unsigned sizehint = 0);
  /* a view with the keys of 'm' in ascending order */
  OrderedView(sky_State *L, const StringMap& m);
  ~OrderedView();

  OrderedView(const OrderedView&) = delete;
  OrderedView& operator=(const OrderedView&) = delete;
  OrderedView(OrderedView&&) = delete;
  OrderedView& operator=(OrderedView&&) = delete;

  void init (unsigned sizehint);

  void append (l_hash h, TString *k, const TValue& v);
  void append (TString *k, const TValue& v) { append(k->getHash(), k, v); }

  [[nodiscard]] bool get (std::string_view k, TValue *v) const noexcept;
  [[nodiscard]] bool get (const TString *k, TValue *v) const noexcept {
    return get(k->view(), v);
  }
  bool set (std::string_view k, const TValue& v) noexcept;
  bool set (const TString *k, const TValue& v) noexcept {
    return set(k->view(), v);
  }

  const TValue& index (int i) const;
  TString *keyIndex (int i, TValue *v = nullptr) const;
  int len () const noexcept { return nentries; }
  SkyVector<TString *> keys () const;

  /* call 'f(key, value)' for each entry, in order, until it returns false */
  template<typename F>
  void range (F&& f) const {
    for (int i = 0; i < nentries; i++) {
      if (!f(entries[i].key, entries[i].value))
        break;
    }
  }

  void dump () const;

  int numHeads () const noexcept { return nheads; }
};


#endif
