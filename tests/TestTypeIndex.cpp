#include "TestHelpers.h"

#include <set>
#include <vector>

#include "acsf_errors.hpp"
#include "cutoff.hpp"
#include "type_index.hpp"

using namespace std;
using af::acsf::TypeIndex;

void testSlotsFollowSortedTypes() {
    TypeIndex index({1, 6, 8, 16});
    assertTrue(index.ntypes() == 4, "ntypes");
    assertTrue(index.nsym_types() == 10, "nsym_types");
    assertTrue(index.slot_of(1) == 0, "H slot");
    assertTrue(index.slot_of(6) == 1, "C slot");
    assertTrue(index.slot_of(8) == 2, "O slot");
    assertTrue(index.slot_of(16) == 3, "S slot");
    assertTrue(index.contains(8) && !index.contains(7), "contains");
}

void testPairSlotsAreSymmetricBijection() {
    for (size_t n = 1; n <= 6; n++) {
        vector<int> types;
        for (size_t t = 0; t < n; t++)
            types.push_back(static_cast<int>(3 * t + 1));
        TypeIndex index(types);
        set<size_t> seen;
        for (size_t a = 0; a < n; a++) {
            for (size_t b = 0; b < n; b++) {
                size_t p = index.pair_slot_of(a, b);
                assertTrue(p == index.pair_slot_of(b, a), "pair slot symmetric");
                assertTrue(p < n * (n + 1) / 2, "pair slot in range");
                if (a <= b)
                    seen.insert(p);
            }
        }
        assertTrue(seen.size() == n * (n + 1) / 2, "pair slots distinct");
    }
}

void testPairSlotOrdering() {
    // (0,0) (0,1) (0,2) (1,1) (1,2) (2,2)
    TypeIndex index({1, 6, 8});
    assertTrue(index.pair_slot_of(0, 0) == 0, "(0,0)");
    assertTrue(index.pair_slot_of(0, 1) == 1, "(0,1)");
    assertTrue(index.pair_slot_of(2, 0) == 2, "(0,2)");
    assertTrue(index.pair_slot_of(1, 1) == 3, "(1,1)");
    assertTrue(index.pair_slot_of(2, 1) == 4, "(1,2)");
    assertTrue(index.pair_slot_of(2, 2) == 5, "(2,2)");
}

void testUnknownAndInvalid() {
    TypeIndex index({1, 8});
    assertThrows<af::acsf::UnknownType>([&] { index.slot_of(6); }, "undeclared atomic number");
    assertThrows<af::acsf::UnknownType>([&] { index.slots_of({1, 8, 7}); }, "undeclared in list");
    assertThrows<std::out_of_range>([&] { index.pair_slot_of(0, 2); }, "slot out of range");
    assertThrows<af::acsf::InvalidConfig>([] { TypeIndex(vector<int>{}); }, "empty types");
    assertThrows<af::acsf::InvalidConfig>([] { TypeIndex(vector<int>{8, 1}); }, "unsorted types");
    assertThrows<af::acsf::InvalidConfig>([] { TypeIndex(vector<int>{1, 1}); }, "duplicate types");
}

void testCutoffFunction() {
    const double radii[] = {0.5, 1.0, 3.7, 5.0, 12.0};
    for (double rc : radii) {
        assertExact(1.0, af::acsf::cutoff_function(0.0, rc));
        assertExact(0.0, af::acsf::cutoff_function(rc, rc));
        assertExact(0.0, af::acsf::cutoff_function(rc * 1.0001, rc));
        assertExact(0.0, af::acsf::cutoff_function(rc + 10.0, rc));
        assertEqual(0.5, af::acsf::cutoff_function(0.5 * rc, rc), 1e-12, 1e-12);

        // Monotone decreasing and continuous at the boundary
        double prev = 1.0;
        for (int k = 1; k <= 100; k++) {
            double v = af::acsf::cutoff_function(rc * k / 100.0, rc);
            assertTrue(v <= prev, "cutoff monotone");
            prev = v;
        }
        assertTrue(af::acsf::cutoff_function(rc * (1 - 1e-9), rc) < 1e-15, "continuous at rc");
    }
}

int main() {
    testSlotsFollowSortedTypes();
    testPairSlotsAreSymmetricBijection();
    testPairSlotOrdering();
    testUnknownAndInvalid();
    testCutoffFunction();
    return 0;
}
