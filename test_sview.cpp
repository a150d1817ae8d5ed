/*
** Test program for positionally indexed views
*/

#include <iostream>
#include <string>

#include "sky.h"
#include "sobject.h"
#include "sstate.h"
#include "sview.h"
#include "test_helpers.h"


static void test_positions(sky_State* L) {
    OrderedView d(L);
    d.append(str(L, "c"), intv(3));
    d.append(str(L, "a"), intv(1));
    d.append(str(L, "b"), intv(2));

    CHECK(d.len() == 3);
    // positions follow the order of appends, not the keys
    CHECK(d.index(0).intValue() == 3);
    CHECK(d.index(1).intValue() == 1);
    TValue v;
    TString* k = d.keyIndex(2, &v);
    CHECK(k->view() == "b" && v.intValue() == 2);

    SkyVector<TString*> ks = d.keys();
    CHECK(ks.size() == 3 && ks[0]->view() == "c" && ks[2]->view() == "b");
}


static void test_get_set(sky_State* L) {
    OrderedView d(L, 4);
    d.append(str(L, "x"), intv(1));
    d.append(str(L, "y"), intv(2));

    TValue v;
    CHECK(d.get("x", &v) && v.intValue() == 1);
    CHECK(d.get(str(L, "y"), &v) && v.intValue() == 2);
    CHECK(!d.get("z", &v));

    CHECK(d.set("x", intv(10)));
    CHECK(d.get("x", &v) && v.intValue() == 10);
    CHECK(d.index(0).intValue() == 10);

    // the key set is fixed: setting a missing key adds nothing
    CHECK(!d.set("z", intv(3)));
    CHECK(d.len() == 2);
    CHECK(!d.get("z", &v));
}


static void test_duplicate(sky_State* L) {
    OrderedView d(L);
    d.append(str(L, "a"), intv(1));
    CHECK(raises(L, SKY_ERRDUPKEY, "duplicate key a",
                 [&] { d.append(str(L, "a"), intv(2)); }));
    CHECK(d.len() == 1);
    CHECK(d.index(0).intValue() == 1);
}


static void test_growth(sky_State* L) {
    OrderedView d(L);
    for (int i = 0; i < 1000; i++)
        d.append(str(L, ("k" + std::to_string(i)).c_str()), intv(i));
    CHECK(d.len() == 1000);
    CHECK(d.numHeads() > 1);

    TValue v;
    for (int i = 0; i < 1000; i++) {
        std::string k = "k" + std::to_string(i);
        CHECK(d.get(k, &v) && v.intValue() == i);
        CHECK(d.index(i).intValue() == i);
        CHECK(d.keyIndex(i)->view() == k);
    }
}


static void test_range(sky_State* L) {
    OrderedView d(L);
    for (int i = 0; i < 10; i++)
        d.append(str(L, ("k" + std::to_string(i)).c_str()), intv(i));

    int visited = 0;
    d.range([&](TString* k, const TValue& v) {
        visited++;
        return !(k->view() == "k5" && v.intValue() == 5);
    });
    CHECK(visited == 6);

    sky_Integer sum = 0;
    d.range([&](TString*, const TValue& v) {
        sum += v.intValue();
        return true;
    });
    CHECK(sum == 45);
}


static void test_from_string_map(sky_State* L) {
    StringMap m(L);
    const char* names[] = {"pear", "apple", "fig", "banana"};
    for (int i = 0; i < 4; i++)
        m.insert(str(L, names[i]), intv(i));

    OrderedView d(L, m);
    CHECK(d.len() == 4);
    const char* sorted[] = {"apple", "banana", "fig", "pear"};
    const int values[] = {1, 3, 2, 0};
    for (int i = 0; i < 4; i++) {
        TValue v;
        CHECK(d.keyIndex(i, &v)->view() == sorted[i]);
        CHECK(v.intValue() == values[i]);
    }
}


static void test_bad_index(sky_State* L) {
    OrderedView d(L);
    d.append(str(L, "a"), intv(1));
    CHECK(raises(L, SKY_ERRRUN, "view index 1 out of range [0, 1)",
                 [&] { (void)d.index(1); }));
    CHECK(raises(L, SKY_ERRRUN, "view index -1 out of range [0, 1)",
                 [&] { (void)d.keyIndex(-1); }));
}


static void test_memory_release(sky_State* L) {
    SkyVector<TString*> keys(L);  // keys are created up front
    for (int i = 0; i < 200; i++)
        keys.push_back(str(L, ("n" + std::to_string(i)).c_str()));

    l_mem before = L->getTotalBytes();
    {
        OrderedView d(L);
        for (int i = 0; i < 200; i++)
            d.append(keys[i], intv(i));
        CHECK(L->getTotalBytes() > before);
    }
    CHECK(L->getTotalBytes() == before);
}


static void test_dump(sky_State* L) {
    OrderedView d(L);
    d.append(str(L, "a"), intv(1));
    d.append(str(L, "b"), strv(L, "two"));
    d.dump();
    CHECK(d.len() == 2);
}


int main() {
    std::cout << "=== Ordered View Test Suite ===" << std::endl;
    std::cout << std::endl;

    sky_State* L = skyL_newstate();
    if (!L) {
        std::cerr << "Failed to create Sky state" << std::endl;
        return 1;
    }

    run_test(L, "Positions", test_positions);
    run_test(L, "Get and set", test_get_set);
    run_test(L, "Duplicate keys", test_duplicate);
    run_test(L, "Growth", test_growth);
    run_test(L, "Range", test_range);
    run_test(L, "From a string map", test_from_string_map);
    run_test(L, "Index out of range", test_bad_index);
    run_test(L, "Memory release", test_memory_release);
    run_test(L, "Dump", test_dump);

    int res = finish("Ordered View Test Suite");
    sky_close(L);
    return res;
}
