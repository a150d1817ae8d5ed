/*
** $Id: sview.c $
** Positionally indexed string-keyed views
** See Copyright Notice in sky.h
*/

#define sview_c
#define SKY_CORE


#include <algorithm>
#include <cstdio>
#include <new>
#include <string>

#include "sky.h"

#include "sdebug.h"
#include "smem.h"
#include "sobject.h"
#include "sstate.h"
#include "sview.h"


OrderedView::OrderedView (sky_State *L, unsigned sizehint)
    : L(L), buckets(&bucket0), nheads(1), nused(1), ncap(1),
      entries(nullptr), nentries(0), entcap(0), bucket0() {
  if (sizehint > 0)
    init(sizehint);
}


OrderedView::~OrderedView () {
  freeBuckets();
  skyM_freearray(L, entries, cast_sizet(entcap));
}


OrderedView::OrderedView (sky_State *L, const StringMap& m)
    : OrderedView(L, m.len()) {
  SkyVector<TString *> keys = m.keys();
  std::sort(keys.begin(), keys.end(),
            [](const TString *a, const TString *b) { return *a < *b; });
  for (TString *k : keys) {
    TValue v;
    bool found = m.lookup(k, &v);
    sky_assert(found);
    UNUSED(found);
    append(k, v);
  }
}


void OrderedView::freeBuckets () noexcept {
  if (buckets != &bucket0)
    skyM_freearray(L, buckets, cast_sizet(ncap));
  buckets = &bucket0;
  ncap = 1;
}


/*
** Size an empty view for 'sizehint' entries.
*/
void OrderedView::init (unsigned sizehint) {
  sky_assert(nentries == 0);
  int nb = 1;
  while (overloaded(sizehint, cast_sizet(nb))) {
    if (nb >= MAXHEADS)
      skyG_runerror(L, SKY_ERRMEM, "table overflow");
    nb <<= 1;
  }
  if (cast_int(sizehint) > entcap) {
    entries = skyM_reallocvector(L, entries, cast_sizet(entcap),
                                             cast_sizet(sizehint));
    entcap = cast_int(sizehint);
  }
  if (nb > 1)
    rehash(nb);
}


int OrderedView::getEntry (l_hash h, std::string_view k) const noexcept {
  for (int b = cast_int(h & cast_hash(nheads - 1)); b >= 0; b = buckets[b].next) {
    for (int i = 0; i < BUCKETSIZE; i++) {
      int idx = buckets[b].slots[i] - 1;
      if (idx < 0)
        break;  /* slots of a chain fill in order */
      const ViewEntry& e = entries[idx];
      if (e.hash == h && e.key->view() == k)
        return idx;  /* found */
    }
  }
  return -1;  /* not found */
}


/*
** Record entry 'idx' in the first free slot of its chain, adding an
** overflow bucket if the chain is full. Storage must have room.
*/
void OrderedView::place (int idx) {
  int b = cast_int(entries[idx].hash & cast_hash(nheads - 1));
  for (;;) {
    for (int i = 0; i < BUCKETSIZE; i++) {
      if (buckets[b].slots[i] == 0) {
        buckets[b].slots[i] = idx + 1;
        return;
      }
    }
    if (buckets[b].next < 0)
      break;
    b = buckets[b].next;
  }
  sky_assert(nused < ncap);
  int nb = nused++;
  ::new (&buckets[nb]) ViewBucket();
  buckets[b].next = nb;
  buckets[nb].slots[0] = idx + 1;
}


/*
** Rebuild the buckets with 'newheads' chains. As in 'HashTable::grow',
** room for every overflow bucket is allocated before any entry moves.
*/
void OrderedView::rehash (int newheads) {
  int newcap = newheads + std::max(nentries, entcap) / BUCKETSIZE + 1;
  ViewBucket *nb = skyM_newvectorchecked<ViewBucket>(L, cast_sizet(newcap));
  for (int i = 0; i < newcap; i++)
    ::new (&nb[i]) ViewBucket();
  freeBuckets();
  bucket0 = ViewBucket();  /* clear out unused initial bucket */
  buckets = nb;
  nheads = newheads;
  nused = newheads;
  ncap = newcap;
  for (int i = 0; i < nentries; i++)
    place(i);
}


void OrderedView::append (l_hash h, TString *k, const TValue& v) {
  if (getEntry(h, k->view()) >= 0)
    skyG_runerror(L, SKY_ERRDUPKEY, "duplicate key %s", k->c_str());
  /* does the number of elements exceed the buckets' load factor? */
  while (overloaded(cast_sizet(nentries), cast_sizet(nheads))) {
    if (nheads >= MAXHEADS)
      skyG_runerror(L, SKY_ERRMEM, "table overflow");
    rehash(nheads * 2);
  }
  if (nentries == entcap) {
    int newcap = (entcap == 0) ? 1 : entcap * 2;
    entries = skyM_reallocvector(L, entries, cast_sizet(entcap),
                                             cast_sizet(newcap));
    entcap = newcap;
  }
  if (nused == ncap) {  /* keep room for one more overflow bucket */
    int newcap = ncap * 2;
    ViewBucket *nb;
    if (buckets == &bucket0) {
      nb = skyM_newvectorchecked<ViewBucket>(L, cast_sizet(newcap));
      ::new (&nb[0]) ViewBucket(bucket0);
      bucket0 = ViewBucket();
    }
    else
      nb = skyM_reallocvector(L, buckets, cast_sizet(ncap), cast_sizet(newcap));
    buckets = nb;
    ncap = newcap;
  }
  int idx = nentries++;
  ::new (&entries[idx]) ViewEntry{h, k, v};
  place(idx);
}


bool OrderedView::get (std::string_view k, TValue *v) const noexcept {
  int idx = getEntry(TString::computeHash(k.data(), k.size()), k);
  if (idx < 0)
    return false;
  if (v != nullptr)
    *v = entries[idx].value;
  return true;
}


/*
** Overwrite the value of an existing key. A missing key is not added;
** the result tells whether it was found.
*/
bool OrderedView::set (std::string_view k, const TValue& v) noexcept {
  int idx = getEntry(TString::computeHash(k.data(), k.size()), k);
  if (idx < 0)
    return false;
  entries[idx].value = v;
  return true;
}


void OrderedView::checkIndex (int i) const {
  if (i < 0 || i >= nentries)
    skyG_runerror(L, SKY_ERRRUN, "view index %d out of range [0, %d)",
                  i, nentries);
}


const TValue& OrderedView::index (int i) const {
  checkIndex(i);
  return entries[i].value;
}


TString *OrderedView::keyIndex (int i, TValue *v) const {
  checkIndex(i);
  if (v != nullptr)
    *v = entries[i].value;
  return entries[i].key;
}


SkyVector<TString *> OrderedView::keys () const {
  SkyVector<TString *> res(L);
  res.reserve(cast_sizet(nentries));
  for (int i = 0; i < nentries; i++)
    res.push_back(entries[i].key);
  return res;
}


void OrderedView::dump () const {
  char buff[128];
  std::snprintf(buff, sizeof(buff), "view %p len=%d heads=%d buckets=%d\n",
                static_cast<const void*>(this), nentries, nheads, nused);
  sky_writestringerror("%s", buff);
  for (int j = 0; j < nheads; j++) {
    sky_writestringerror("bucket chain %d\n", j);
    for (int b = j; b >= 0; b = buckets[b].next) {
      for (int i = 0; i < BUCKETSIZE; i++) {
        int idx = buckets[b].slots[i] - 1;
        if (idx < 0)
          break;
        const ViewEntry& e = entries[idx];
        std::string line = "\tentry " + std::to_string(idx) +
                           " hash=" + std::to_string(e.hash) +
                           " key=" + std::string(e.key->view()) +
                           " value=" + skyV_tostring(L, &e.value) + "\n";
        sky_writestringerror("%s", line.c_str());
      }
    }
  }
}
