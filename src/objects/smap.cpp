/*
** $Id: smap.c $
** Insertion-ordered hash tables
** See Copyright Notice in sky.h
*/

#define smap_c
#define SKY_CORE


#include <cstdio>
#include <new>

#include "sky.h"

#include "sdebug.h"
#include "smap.h"
#include "smem.h"
#include "sobject.h"
#include "sstate.h"


/*
** {======================================================
** Key policies
** =======================================================
*/

l_hash ValueKeys::hash (sky_State *L, const TValue& k) {
  return skyV_hash(L, &k);
}


bool ValueKeys::equal (sky_State *L, const TValue& a, const TValue& b) {
  return skyV_equal(L, &a, &b);
}


void ValueKeys::freeze (sky_State *L, TValue& k) {
  skyV_freeze(L, &k);
}


std::string ValueKeys::display (sky_State *L, const TValue& k) {
  return skyV_tostring(L, &k);
}


std::string StringKeys::display (sky_State *L, TString *k) {
  UNUSED(L);
  return std::string(k->view());
}

/* }====================================================== */


template<typename Policy>
HashTable<Policy>::HashTable (sky_State *L, unsigned sizehint)
    : L(L), buckets(&bucket0), nheads(1), nused(1), ncap(1), length(0),
      itercount(0), head(-1), tail(-1), frozen(false), bucket0() {
  if (sizehint > 0)
    init(sizehint);
}


template<typename Policy>
HashTable<Policy>::~HashTable () {
  sky_assert(itercount == 0);
  freeBuckets();
}


template<typename Policy>
void HashTable<Policy>::freeBuckets () noexcept {
  if (buckets != &bucket0)
    skyM_freearray(L, buckets, cast_sizet(ncap));
  buckets = &bucket0;
  ncap = 1;
}


template<typename Policy>
void HashTable<Policy>::init (unsigned sizehint) {
  sky_assert(length == 0 && itercount == 0);
  int nb = 1;
  while (overloaded(sizehint, cast_sizet(nb))) {
    if (nb >= MAXHEADS)
      skyG_runerror(L, SKY_ERRMEM, "table overflow");
    nb <<= 1;
  }
  Bucket *nbuckets = &bucket0;
  if (nb > 1) {
    nbuckets = skyM_newvectorchecked<Bucket>(L, cast_sizet(nb));
    for (int i = 0; i < nb; i++)
      ::new (&nbuckets[i]) Bucket();
  }
  freeBuckets();
  bucket0 = Bucket();
  buckets = nbuckets;
  nheads = nused = ncap = nb;
  head = tail = -1;
}


/*
** Mutations are refused on frozen tables and while any iterator is
** active (frozen tables do not count their iterators).
*/
template<typename Policy>
void HashTable<Policy>::checkMutable (const char *what) const {
  if (frozen)
    skyG_runerror(L, SKY_ERRFROZEN, "cannot %s frozen hash table", what);
  if (itercount > 0)
    skyG_runerror(L, SKY_ERRITER, "cannot %s hash table during iteration",
                  what);
}


/*
** Search the chain of hash 'h' for key 'k'. Returns the index of its
** entry, or -1. When given, 'freeslot' receives an empty slot of the
** chain (-1 if it has none) and 'lastb' the last bucket of the chain.
** The key comparisons may run host code, so the table is kept
** immutable meanwhile.
*/
template<typename Policy>
int HashTable<Policy>::find (const Key& k, l_hash h, int *freeslot,
                                                     int *lastb) const {
  ScanGuard guard(this);
  int found = -1;
  int empty = -1;
  int b = cast_int(h & cast_hash(nheads - 1));
  for (;;) {
    const Bucket& p = buckets[b];
    for (int i = 0; i < BUCKETSIZE; i++) {
      const Entry& e = p.entries[i];
      if (e.hash != h) {
        if (e.hash == 0)
          empty = b * BUCKETSIZE + i;  /* found empty entry; make a note */
        continue;
      }
      if (Policy::equal(L, k, e.key)) {
        found = b * BUCKETSIZE + i;
        break;
      }
    }
    if (found >= 0 || p.next < 0)
      break;
    b = p.next;
  }
  if (freeslot) *freeslot = empty;
  if (lastb) *lastb = b;
  return found;
}


/*
** Append an empty overflow bucket to the chain ending at 'lastb' and
** return its index.
*/
template<typename Policy>
int HashTable<Policy>::newBucket (int lastb) {
  if (nused == ncap) {
    if (ncap >= MAXHEADS * 2)
      skyG_runerror(L, SKY_ERRMEM, "table overflow");
    int newcap = ncap * 2;
    Bucket *nb;
    if (buckets == &bucket0) {
      nb = skyM_newvectorchecked<Bucket>(L, cast_sizet(newcap));
      ::new (&nb[0]) Bucket(bucket0);
      bucket0 = Bucket();
    }
    else
      nb = skyM_reallocvector(L, buckets, cast_sizet(ncap), cast_sizet(newcap));
    buckets = nb;
    ncap = newcap;
  }
  int b = nused++;
  ::new (&buckets[b]) Bucket();
  buckets[lastb].next = b;
  return b;
}


/*
** Double the number of chains. Entries keep their insertion order and
** are placed by their stored hashes; keys are not compared again, as
** they are known to be distinct. Storage for the worst case (every
** chain filling overflow buckets) is allocated up front, so nothing
** can fail once entries start moving.
*/
template<typename Policy>
void HashTable<Policy>::grow () {
  if (nheads >= MAXHEADS)
    skyG_runerror(L, SKY_ERRMEM, "table overflow");
  int newheads = nheads * 2;
  int newcap = newheads + cast_int(length / BUCKETSIZE) + 1;
  Bucket *nb = skyM_newvectorchecked<Bucket>(L, cast_sizet(newcap));
  for (int i = 0; i < newcap; i++)
    ::new (&nb[i]) Bucket();
  int newused = newheads;
  int newhead = -1;
  int newtail = -1;
  for (int idx = head; idx >= 0; idx = entry(idx).next) {
    const Entry& e = entry(idx);
    int b = cast_int(e.hash & cast_hash(newheads - 1));
    while (nb[b].next >= 0)
      b = nb[b].next;
    int slot = 0;  /* chains fill in order; only the last bucket has room */
    while (slot < BUCKETSIZE && nb[b].entries[slot].hash != 0)
      slot++;
    if (slot == BUCKETSIZE) {
      sky_assert(newused < newcap);
      nb[b].next = newused;
      b = newused++;
      slot = 0;
    }
    int ni = b * BUCKETSIZE + slot;
    Entry& ne = nb[b].entries[slot];
    ne.hash = e.hash;
    ne.key = e.key;
    ne.value = e.value;
    ne.prev = newtail;
    ne.next = -1;
    if (newtail < 0)
      newhead = ni;
    else
      nb[newtail / BUCKETSIZE].entries[newtail % BUCKETSIZE].next = ni;
    newtail = ni;
  }
  freeBuckets();
  bucket0 = Bucket();  /* clear out unused initial bucket */
  buckets = nb;
  nheads = newheads;
  nused = newused;
  ncap = newcap;
  head = newhead;
  tail = newtail;
}


template<typename Policy>
void HashTable<Policy>::insert (const Key& k, const TValue& v) {
  checkMutable("insert into");
  l_hash h = hashKey(k);
  for (;;) {
    int freeslot, lastb;
    int idx = find(k, h, &freeslot, &lastb);
    checkMutable("insert into");  /* comparisons may have frozen it */
    if (idx >= 0) {  /* key already present; update value */
      entry(idx).value = v;
      return;
    }
    if (overloaded(length, cast_sizet(nheads))) {
      grow();
      continue;  /* chain positions have changed; scan again */
    }
    if (freeslot < 0)  /* no space in existing buckets? */
      freeslot = newBucket(lastb) * BUCKETSIZE;
    Entry& e = entry(freeslot);
    e.hash = h;
    e.key = k;
    e.value = v;
    e.prev = tail;
    e.next = -1;
    tailLink() = freeslot;
    tail = freeslot;
    length++;
    return;
  }
}


template<typename Policy>
bool HashTable<Policy>::lookup (const Key& k, TValue *v) const {
  l_hash h = hashKey(k);
  int idx = find(k, h, nullptr, nullptr);
  if (idx < 0)
    return false;
  if (v != nullptr)
    *v = entry(idx).value;
  return true;
}


/*
** Remove the entry of key 'k', if present. Its slot is cleared; empty
** overflow buckets stay in their chains.
*/
template<typename Policy>
bool HashTable<Policy>::erase (const Key& k, TValue *removed) {
  checkMutable("delete from");
  l_hash h = hashKey(k);
  int idx = find(k, h, nullptr, nullptr);
  checkMutable("delete from");
  if (idx < 0)
    return false;
  Entry& e = entry(idx);
  if (e.prev < 0)
    head = e.next;
  else
    entry(e.prev).next = e.next;
  if (e.next < 0)
    tail = e.prev;  /* deletion of last entry */
  else
    entry(e.next).prev = e.prev;
  if (removed != nullptr)
    *removed = e.value;
  e = Entry();
  length--;
  return true;
}


template<typename Policy>
void HashTable<Policy>::clear () {
  checkMutable("clear");
  for (int i = 0; i < nheads; i++)
    buckets[i] = Bucket();
  nused = nheads;  /* overflow buckets are kept for reuse */
  head = tail = -1;
  length = 0;
}


/*
** Deep freeze. The flag is set before visiting the contents, so a
** cycle leading back to this table stops here.
*/
template<typename Policy>
void HashTable<Policy>::freeze () {
  if (!frozen) {
    frozen = true;
    for (int idx = head; idx >= 0; idx = entry(idx).next) {
      Entry& e = entry(idx);
      Policy::freeze(L, e.key);
      skyV_freeze(L, &e.value);
    }
  }
}


template<typename Policy>
SkyVector<typename HashTable<Policy>::Key> HashTable<Policy>::keys () const {
  SkyVector<Key> res(L);
  res.reserve(length);
  for (int idx = head; idx >= 0; idx = entry(idx).next)
    res.push_back(entry(idx).key);
  return res;
}


template<typename Policy>
SkyVector<std::pair<typename HashTable<Policy>::Key, TValue>>
HashTable<Policy>::items () const {
  SkyVector<std::pair<Key, TValue>> res(L);
  res.reserve(length);
  for (int idx = head; idx >= 0; idx = entry(idx).next) {
    const Entry& e = entry(idx);
    res.emplace_back(e.key, e.value);
  }
  return res;
}


template<typename Policy>
bool HashTable<Policy>::first (Key *k) const noexcept {
  if (head < 0)
    return false;
  *k = entry(head).key;
  return true;
}


/* print the whole structure of the table; an aid to debugging */
template<typename Policy>
void HashTable<Policy>::dump () const {
  char buff[128];
  std::snprintf(buff, sizeof(buff),
                "hashtable %p len=%u heads=%d buckets=%d head=%d tail=%d\n",
                static_cast<const void*>(this), length, nheads, nused,
                head, tail);
  sky_writestringerror("%s", buff);
  for (int j = 0; j < nheads; j++) {
    sky_writestringerror("bucket chain %d\n", j);
    for (int b = j; b >= 0; b = buckets[b].next) {
      sky_writestringerror("bucket %d\n", b);
      for (int i = 0; i < BUCKETSIZE; i++) {
        const Entry& e = buckets[b].entries[i];
        std::string line = "\tentry " + std::to_string(b * BUCKETSIZE + i) +
                           " hash=" + std::to_string(e.hash);
        if (e.hash != 0) {
          line += " key=" + Policy::display(L, e.key);
          line += " value=" + skyV_tostring(L, &e.value);
          line += " prev=" + std::to_string(e.prev);
          line += " next=" + std::to_string(e.next);
        }
        line += "\n";
        sky_writestringerror("%s", line.c_str());
      }
    }
  }
}


template class HashTable<ValueKeys>;
template class HashTable<StringKeys>;
