#include "checklist_engine/hierarchy.hpp"
#include "checklist_engine/state_utils.hpp"
#include "checklist_engine/structure.hpp"
#include "test_util.hpp"

using namespace checklist;
using namespace checklist_test;

static std::vector<File> sample_files() {
    Checklist preflight{ "cl-pre", "Preflight", { title("CABIN", 0), step("A", 1), step("B", 1) } };
    Checklist taxi{ "cl-taxi", "Taxi", { step("BRAKES", 0), step("INSTR", 1) } };
    Checklist fire{ "cl-fire", "Engine Fire", { item("W", ItemKind::Warning, 0), item("MIX", ItemKind::ChallengeResponse, 1, "mixture") } };
    Group normal{ "g-normal", "Normal", GroupCategory::Normal, { preflight, taxi } };
    Group emergency{ "g-emer", "Emergency", GroupCategory::Emergency, { fire } };
    File f1;
    f1.id = "f1";
    f1.name = "N123";
    f1.groups = { normal, emergency };
    File f2;
    f2.id = "f2";
    f2.name = "Spare";
    f2.groups = { Group{ "g-other", "Other", GroupCategory::Abnormal, {} } };
    return { f1, f2 };
}

static std::string checklist_ids(const std::vector<File>& files, const std::string& fileId, const std::string& groupId) {
    const File* f = find_file(files, fileId);
    const Group* g = f ? find_group(*f, groupId) : nullptr;
    std::vector<std::string> out;
    if (g) {
        for (const auto& cl : g->checklists) out.push_back(cl.id);
    }
    return join(out);
}

int main() {
    IdSource ids;
    ids.prefix = "x";
    const auto files = sample_files();
    verify_invariants(files);

    // 1) Groups
    {
        auto e = add_group(files, "f1", "Abnormal", GroupCategory::Abnormal, ids);
        assert_true(e.applied, "add group");
        assert_eq(e.created.front(), "x1", "group id from source");
        assert_eq_size(e.value[0].groups.size(), 3, "group appended");
        assert_true(e.value[0].groups[2].category == GroupCategory::Abnormal, "category kept");
        assert_true(!add_group(files, "nope", "X", GroupCategory::Normal, ids).applied, "unknown file");

        assert_true(remove_group(files, "f1", "g-emer").applied, "remove group");
        assert_true(!remove_group(files, "f1", "ghost").applied, "remove unknown group");
        assert_true(rename_group(files, "f1", "g-normal", "Normals").applied, "rename group");
        assert_true(!rename_group(files, "f1", "g-normal", "Normal").applied, "rename to same name is a no-op");
        assert_true(set_group_category(files, "f1", "g-normal", GroupCategory::Emergency).applied, "set category");
        assert_true(!set_group_category(files, "f1", "g-normal", GroupCategory::Normal).applied, "same category");

        auto r = reorder_groups(files, "f1", 0, 1);
        assert_true(r.applied && r.value[0].groups[0].id == "g-emer", "reorder groups");
        assert_true(!reorder_groups(files, "f1", 0, 2).applied, "reorder groups out of range");
    }

    // 2) Checklists within a group
    {
        auto e = add_checklist(files, "f1", "g-normal", "Landing", ids);
        assert_true(e.applied, "add checklist");
        assert_eq(checklist_ids(e.value, "f1", "g-normal"), "cl-pre,cl-taxi," + e.created.front(), "appended");

        auto d = duplicate_checklist(files, ChecklistRef{ "f1", "g-normal", "cl-pre" }, ids);
        assert_true(d.applied, "duplicate checklist");
        const Group& g = d.value[0].groups[0];
        assert_eq(g.checklists[1].id, d.created.front(), "copy right after source");
        assert_eq(g.checklists[1].name, "Preflight (Copy)", "copy name");
        assert_eq_size(g.checklists[1].items.size(), 3, "items copied");
        for (size_t i = 0; i < 3; ++i) {
            assert_true(g.checklists[1].items[i].id != g.checklists[0].items[i].id, "fresh item ids");
            assert_true(g.checklists[1].items[i].depth == g.checklists[0].items[i].depth, "depths copied");
        }
        verify_invariants(d.value);

        assert_true(rename_checklist(files, ChecklistRef{ "f1", "g-normal", "cl-taxi" }, "Taxi Out").applied, "rename");
        auto rm = remove_checklist(files, ChecklistRef{ "f1", "g-normal", "cl-taxi" });
        assert_eq(checklist_ids(rm.value, "f1", "g-normal"), "cl-pre", "removed");
        assert_true(!remove_checklist(files, ChecklistRef{ "f1", "g-emer", "cl-taxi" }).applied, "wrong group");

        auto ro = reorder_checklists(files, "f1", "g-normal", 1, 0);
        assert_eq(checklist_ids(ro.value, "f1", "g-normal"), "cl-taxi,cl-pre", "reordered");

        auto im = import_checklists(files, "f2", "g-other", { files[0].groups[0].checklists[0] }, ids);
        assert_true(im.applied, "import");
        verify_invariants(im.value);
        assert_true(!import_checklists(files, "f2", "g-other", {}, ids).applied, "empty import");
    }

    // 3) Move keeps the whole item sequence, across groups and files
    {
        const ChecklistRef taxi{ "f1", "g-normal", "cl-taxi" };
        auto m = move_checklist(files, taxi, "f1", "g-emer", 0);
        assert_true(m.applied, "move across groups");
        assert_eq(checklist_ids(m.value, "f1", "g-normal"), "cl-pre", "gone from source");
        assert_eq(checklist_ids(m.value, "f1", "g-emer"), "cl-taxi,cl-fire", "inserted at 0");
        const Checklist* moved = find_checklist(m.value, ChecklistRef{ "f1", "g-emer", "cl-taxi" });
        assert_true(moved && moved->items == files[0].groups[0].checklists[1].items, "items intact");

        auto x = move_checklist(files, taxi, "f2", "g-other");
        assert_eq(checklist_ids(x.value, "f2", "g-other"), "cl-taxi", "moved to other file");
        verify_invariants(x.value);

        auto same = move_checklist(files, taxi, "f1", "g-normal", 1);
        assert_true(!same.applied, "drop at own position is a no-op");
        auto within = move_checklist(files, taxi, "f1", "g-normal", 0);
        assert_eq(checklist_ids(within.value, "f1", "g-normal"), "cl-taxi,cl-pre", "move within group");
        assert_true(!move_checklist(files, taxi, "f1", "ghost").applied, "unknown target group");
        assert_true(!move_checklist(files, ChecklistRef{ "f1", "g-normal", "ghost" }, "f2", "g-other").applied,
                    "unknown checklist");
    }

    // 4) Copy gives fresh ids and leaves the source
    {
        const ChecklistRef pre{ "f1", "g-normal", "cl-pre" };
        auto c = copy_checklist(files, pre, "f2", "g-other", ids);
        assert_true(c.applied, "copy across files");
        assert_eq(checklist_ids(c.value, "f1", "g-normal"), "cl-pre,cl-taxi", "source untouched");
        const Checklist* copy = find_checklist(c.value, ChecklistRef{ "f2", "g-other", c.created.front() });
        assert_true(copy != nullptr, "copy present");
        assert_eq(copy->name, "Preflight", "copy keeps name");
        assert_eq_size(child_count(copy->items, 0), 2, "hierarchy survives the copy");
        verify_invariants(c.value);
        assert_true(!copy_checklist(files, pre, "f9", "g-other", ids).applied, "unknown target file");
    }

    // 5) File level
    {
        assert_true(rename_file(files, "f1", "N456").applied, "rename file");
        MetadataChanges meta;
        meta.makeModel = std::string("C172");
        auto m = update_file_metadata(files, "f1", meta);
        assert_true(m.applied && m.value[0].metadata.makeModel == "C172", "metadata");
        assert_true(!update_file_metadata(m.value, "f1", meta).applied, "metadata unchanged");
        auto u = uppercase_file(files, "f1");
        assert_true(u.applied, "uppercase file");
        assert_eq(u.value[0].groups[0].checklists[0].items[0].challenge, "CABIN", "title untouched");
        assert_eq(u.value[0].groups[1].checklists[0].items[1].challenge, "MIXTURE", "challenge upper");
    }

    // 6) Replacing an item sequence
    {
        const ChecklistRef pre{ "f1", "g-normal", "cl-pre" };
        ItemEdit edit{ { step("Q", 0) }, true, {} };
        auto r = replace_items(files, pre, edit);
        assert_true(r.applied && find_checklist(r.value, pre)->items.size() == 1, "items replaced");
        edit.applied = false;
        assert_true(!replace_items(files, pre, edit).applied, "refused item edit passes through");
    }

    std::cout << "All structure tests passed.\n";
    return 0;
}
