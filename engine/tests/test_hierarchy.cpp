#include "checklist_engine/hierarchy.hpp"
#include "test_util.hpp"
#include <algorithm>

using namespace checklist;
using namespace checklist_test;

static std::vector<size_t> hidden_by(const std::vector<Item>& items, size_t index) {
    std::vector<size_t> out;
    for (size_t i = index + 1; i < subtree_end(items, index); ++i) out.push_back(i);
    return out;
}

int main() {
    // 1) Title owns its section
    {
        std::vector<Item> items = { title("CABIN", 0), step("A", 1), step("B", 1) };
        assert_eq_size(child_count(items, 0), 2, "CABIN has two children");
        assert_eq_size(child_count(items, 1), 0, "A is a leaf");
        auto vis = visible_indices(items, { "CABIN" });
        assert_true(vis == std::vector<size_t>{ 0 }, "collapsed CABIN hides A and B");
        assert_true(visible_indices(items, {}) == iota(3), "no collapse shows everything");
    }

    // 2) Section rule takes same-depth non-title items, stops at next Title at or above
    {
        std::vector<Item> items = { title("T0", 0), step("X", 0), step("Y", 0), title("T1", 0), step("Z", 0) };
        assert_eq_size(child_count(items, 0), 2, "T0 owns X and Y");
        assert_eq_size(child_count(items, 3), 1, "T1 owns Z");
        assert_eq_size(child_count(items, 1), 0, "X (depth rule) owns nothing at same depth");
        auto vis = visible_indices(items, { "T0" });
        assert_true(vis == (std::vector<size_t>{ 0, 3, 4 }), "collapsed T0 hides X and Y only");
    }

    // 3) Nested titles
    {
        std::vector<Item> items = { title("T", 0), step("A", 1), title("T2", 1), step("B", 2),
                                    title("T3", 0), step("C", 0) };
        assert_eq_size(child_count(items, 0), 3, "T stops at T3");
        assert_eq_size(child_count(items, 2), 1, "T2 stops at T3 (title at shallower depth)");
        assert_eq_size(child_count(items, 4), 1, "T3 owns C");
        // a deeper title's section runs past shallower non-title items
        std::vector<Item> loose = { title("S", 1), step("X", 0), title("S2", 0) };
        assert_eq_size(child_count(loose, 0), 1, "section rule ignores depth of non-title items");
    }

    // 4) Depth rule
    {
        std::vector<Item> items = { step("A", 0), step("B", 1), step("C", 2), step("D", 1), step("E", 0) };
        assert_eq_size(child_count(items, 0), 3, "A owns B C D");
        assert_eq_size(child_count(items, 1), 1, "B owns C");
        assert_eq_size(child_count(items, 3), 0, "D leaf");
        assert_eq_size(child_count(items, 4), 0, "E leaf");
        assert_eq_size(child_count(items, 99), 0, "out of range is zero");

        assert_true(visible_indices(items, { "A" }) == (std::vector<size_t>{ 0, 4 }), "collapse A");
        assert_true(visible_indices(items, { "B" }) == (std::vector<size_t>{ 0, 1, 3, 4 }), "collapse B");
        // B is hidden under A; collapsing it as well changes nothing
        assert_true(visible_indices(items, { "A", "B" }) == (std::vector<size_t>{ 0, 4 }), "hidden collapse no effect");
        // expanding A again leaves only B collapsed
        assert_true(visible_indices(items, { "B" }) == (std::vector<size_t>{ 0, 1, 3, 4 }), "expand A restores");
        assert_true(visible_indices(items, {}) == iota(items.size()), "expand all restores everything");

        auto ids = visible_ids(items, { "B" });
        assert_eq(join(ids), "A,B,D,E", "visible ids follow visible indices");
    }

    // 5) Collapsing any single item removes exactly its descendants
    {
        std::vector<Item> items = { title("T", 0), step("A", 0), step("B", 1), title("U", 1), step("C", 2),
                                    item("W", ItemKind::Warning, 1), title("V", 0), step("D", 1), step("E", 3),
                                    item("N", ItemKind::Note, 0) };
        for (size_t i = 0; i < items.size(); ++i) {
            auto vis = visible_indices(items, { items[i].id });
            auto hidden = hidden_by(items, i);
            assert_eq_size(vis.size() + hidden.size(), items.size(), "visible + hidden covers sequence");
            for (size_t h : hidden) {
                assert_true(std::find(vis.begin(), vis.end(), h) == vis.end(), "descendant hidden");
            }
            assert_eq_size(hidden.size(), child_count(items, i), "hidden count equals child_count");
        }
    }

    // 6) Mixed: non-title collapsed inside a title section
    {
        std::vector<Item> items = { title("T", 0), step("A", 0), step("B", 1), title("T2", 0), step("C", 0) };
        assert_true(visible_indices(items, { "T" }) == (std::vector<size_t>{ 0, 3, 4 }), "title collapse");
        assert_true(visible_indices(items, { "A" }) == (std::vector<size_t>{ 0, 1, 3, 4 }), "depth collapse in section");
    }

    // 7) Parent inference tolerates inconsistent depths
    {
        std::vector<Item> items = { step("A", 0), step("B", 1), step("C", 2), step("D", 1) };
        assert_true(parent_index(items, 2) == std::optional<size_t>(1), "C under B");
        assert_true(parent_index(items, 3) == std::optional<size_t>(0), "D under A");
        assert_true(!parent_index(items, 0).has_value(), "A has no parent");
        std::vector<Item> jump = { step("A", 0), step("B", 3) };
        assert_true(parent_index(jump, 1) == std::optional<size_t>(0), "depth jump still parents to A");
        assert_eq_size(child_count(jump, 0), 1, "depth jump still counted");
        assert_true(index_of(jump, "B") == std::optional<size_t>(1), "index_of");
        assert_true(!index_of(jump, "zz").has_value(), "index_of unknown");
    }

    // 8) Queries do not touch their input
    {
        std::vector<Item> items = { title("T", 0), step("A", 1) };
        auto copy = items;
        (void)child_count(items, 0);
        (void)visible_indices(items, { "T" });
        assert_true(items == copy, "queries are pure");
        assert_true(containment_policy(ItemKind::Title) == ContainmentPolicy::Section, "title policy");
        assert_true(containment_policy(ItemKind::Caution) == ContainmentPolicy::Depth, "caution policy");
    }

    std::cout << "All hierarchy tests passed.\n";
    return 0;
}
