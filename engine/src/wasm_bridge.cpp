#ifdef __EMSCRIPTEN__
#include <emscripten/bind.h>
#include "checklist_engine/document_store.hpp"
#include "checklist_engine/types.hpp"
#include <optional>
#include <string>
#include <vector>

using namespace emscripten;
using namespace checklist;

// A thin wrapper that owns a DocumentStore and exposes it to the editor UI.
// Checklists are addressed by (fileId, groupId, checklistId) string triples.
class EngineWasm {
public:
  std::string createFile(const std::string& name) { return store_.create_file(name); }
  std::string addGroup(const std::string& fileId, const std::string& name, int category) {
    return store_.add_group(fileId, name, static_cast<GroupCategory>(category));
  }
  std::string addChecklist(const std::string& fileId, const std::string& groupId, const std::string& name) {
    return store_.add_checklist(fileId, groupId, name);
  }
  // Takes a file object from a format reader; returns the id it was opened under.
  std::string openFile(val file) { return store_.open_file(file_from_val(file)); }
  bool closeFile(const std::string& fileId) { return store_.close_file(fileId); }
  // The whole file as a plain object, for the save path. Null when unknown.
  val getFile(const std::string& fileId) const {
    const File* f = store_.file(fileId);
    return f ? file_to_val(*f) : val::null();
  }
  val fileIds() const {
    std::vector<std::string> ids;
    for (const auto& f : store_.files()) ids.push_back(f.id);
    return to_array(ids);
  }
  bool isDirty(const std::string& fileId) const { return store_.is_dirty(fileId); }
  void markClean(const std::string& fileId) { store_.mark_clean(fileId); }

  // targetIndex < 0 appends to the target group.
  bool moveChecklist(const std::string& f, const std::string& g, const std::string& c, const std::string& toFile,
                     const std::string& toGroup, int targetIndex) {
    return store_.move_checklist(ref(f, g, c), toFile, toGroup, index_or_end(targetIndex));
  }
  std::string copyChecklist(const std::string& f, const std::string& g, const std::string& c,
                            const std::string& toFile, const std::string& toGroup, int targetIndex) {
    return store_.copy_checklist(ref(f, g, c), toFile, toGroup, index_or_end(targetIndex));
  }

  // Rows for rendering: one {id, kind, challenge, response, depth, centered, collapsible} per item.
  val items(const std::string& f, const std::string& g, const std::string& c) const {
    val arr = val::array();
    const Checklist* cl = store_.checklist(ref(f, g, c));
    if (!cl) return arr;
    for (size_t i = 0; i < cl->items.size(); ++i) arr.set(i, item_to_val(cl->items[i]));
    return arr;
  }
  val getItem(const std::string& f, const std::string& g, const std::string& c, const std::string& id) const {
    const Checklist* cl = store_.checklist(ref(f, g, c));
    if (!cl) return val::null();
    for (const auto& it : cl->items) {
      if (it.id == id) return item_to_val(it);
    }
    return val::null();
  }

  // afterIndex < 0 appends at the end.
  std::string insertItem(const std::string& f, const std::string& g, const std::string& c, int kind, int afterIndex) {
    return store_.insert_item(ref(f, g, c), static_cast<ItemKind>(kind), index_or_end(afterIndex));
  }
  bool removeItem(const std::string& f, const std::string& g, const std::string& c, const std::string& id) {
    return store_.remove_item(ref(f, g, c), id);
  }
  val duplicateItem(const std::string& f, const std::string& g, const std::string& c, const std::string& id) {
    return to_array(store_.duplicate_item(ref(f, g, c), id));
  }
  bool moveItem(const std::string& f, const std::string& g, const std::string& c, const std::string& id, int toIndex) {
    if (toIndex < 0) return false;
    return store_.move_item(ref(f, g, c), id, static_cast<size_t>(toIndex));
  }
  bool setDepth(const std::string& f, const std::string& g, const std::string& c, const std::string& id, int delta) {
    return store_.set_depth(ref(f, g, c), id, delta);
  }
  bool setText(const std::string& f, const std::string& g, const std::string& c, const std::string& id,
               const std::string& challenge, const std::string& response) {
    ItemChanges changes;
    changes.challenge = challenge;
    changes.response = response;
    return store_.update_item(ref(f, g, c), id, changes);
  }

  // Hierarchy queries for rendering
  int childCount(const std::string& f, const std::string& g, const std::string& c, int index) const {
    if (index < 0) return 0;
    return static_cast<int>(store_.child_count(ref(f, g, c), static_cast<size_t>(index)));
  }
  val visibleIds(const std::string& f, const std::string& g, const std::string& c) const {
    return to_array(store_.visible_ids(ref(f, g, c)));
  }
  void toggleCollapsed(const std::string& id) { store_.toggle_collapsed(id); }

  // Selection
  void selectItem(const std::string& id) { store_.select_item(id); }
  void selectRange(const std::string& f, const std::string& g, const std::string& c, const std::string& id) {
    store_.select_range(ref(f, g, c), id);
  }
  std::string activeId() const { return store_.selection().active(); }
  val selectedIds() const {
    const auto& sel = store_.selection().selected();
    return to_array(std::vector<std::string>(sel.begin(), sel.end()));
  }

  bool undo() { return store_.undo(); }
  bool redo() { return store_.redo(); }
  bool canUndo() const { return store_.can_undo(); }
  bool canRedo() const { return store_.can_redo(); }

private:
  static ChecklistRef ref(const std::string& f, const std::string& g, const std::string& c) {
    return ChecklistRef{ f, g, c };
  }
  static val to_array(const std::vector<std::string>& ids) {
    val arr = val::array();
    for (size_t i = 0; i < ids.size(); ++i) arr.set(i, ids[i]);
    return arr;
  }
  static std::optional<size_t> index_or_end(int index) {
    if (index < 0) return std::nullopt;
    return static_cast<size_t>(index);
  }
  static std::string str_or_empty(const val& v, const char* key) {
    val field = v[key];
    return field.isUndefined() || field.isNull() ? std::string() : field.as<std::string>();
  }
  static int int_or(const val& v, const char* key, int fallback) {
    val field = v[key];
    return field.isUndefined() || field.isNull() ? fallback : field.as<int>();
  }
  static bool bool_or_false(const val& v, const char* key) {
    val field = v[key];
    return field.isUndefined() || field.isNull() ? false : field.as<bool>();
  }

  static val item_to_val(const Item& it) {
    val obj = val::object();
    obj.set("id", it.id);
    obj.set("kind", static_cast<int>(it.kind));
    obj.set("challenge", it.challenge);
    obj.set("response", it.response);
    obj.set("depth", it.depth);
    obj.set("centered", it.centered);
    obj.set("collapsible", it.collapsible);
    return obj;
  }
  static Item item_from_val(const val& v) {
    Item it;
    it.id = str_or_empty(v, "id");
    it.kind = static_cast<ItemKind>(int_or(v, "kind", 0));
    it.challenge = str_or_empty(v, "challenge");
    it.response = str_or_empty(v, "response");
    it.depth = int_or(v, "depth", kMinDepth);
    if (!is_valid_depth(it.depth)) it.depth = it.depth < kMinDepth ? kMinDepth : kMaxDepth;
    it.centered = bool_or_false(v, "centered");
    it.collapsible = bool_or_false(v, "collapsible");
    return it;
  }

  static val file_to_val(const File& f) {
    val groups = val::array();
    for (size_t gi = 0; gi < f.groups.size(); ++gi) {
      const Group& g = f.groups[gi];
      val checklists = val::array();
      for (size_t ci = 0; ci < g.checklists.size(); ++ci) {
        const Checklist& cl = g.checklists[ci];
        val rows = val::array();
        for (size_t i = 0; i < cl.items.size(); ++i) rows.set(i, item_to_val(cl.items[i]));
        val clObj = val::object();
        clObj.set("id", cl.id);
        clObj.set("name", cl.name);
        clObj.set("items", rows);
        checklists.set(ci, clObj);
      }
      val gObj = val::object();
      gObj.set("id", g.id);
      gObj.set("name", g.name);
      gObj.set("category", static_cast<int>(g.category));
      gObj.set("checklists", checklists);
      groups.set(gi, gObj);
    }
    val meta = val::object();
    meta.set("aircraftRegistration", f.metadata.aircraftRegistration);
    meta.set("makeModel", f.metadata.makeModel);
    meta.set("copyright", f.metadata.copyright);
    val obj = val::object();
    obj.set("id", f.id);
    obj.set("name", f.name);
    obj.set("format", static_cast<int>(f.format));
    obj.set("path", f.path ? val(*f.path) : val::null());
    obj.set("metadata", meta);
    obj.set("groups", groups);
    obj.set("dirty", f.dirty);
    return obj;
  }
  static File file_from_val(const val& v) {
    File f;
    f.id = str_or_empty(v, "id");
    f.name = str_or_empty(v, "name");
    f.format = static_cast<FileFormat>(int_or(v, "format", static_cast<int>(FileFormat::Json)));
    const std::string path = str_or_empty(v, "path");
    if (!path.empty()) f.path = path;
    val meta = v["metadata"];
    if (!meta.isUndefined() && !meta.isNull()) {
      f.metadata.aircraftRegistration = str_or_empty(meta, "aircraftRegistration");
      f.metadata.makeModel = str_or_empty(meta, "makeModel");
      f.metadata.copyright = str_or_empty(meta, "copyright");
    }
    val groups = v["groups"];
    if (groups.isUndefined() || groups.isNull()) return f;
    const unsigned groupCount = groups["length"].as<unsigned>();
    for (unsigned gi = 0; gi < groupCount; ++gi) {
      val gv = groups[gi];
      Group g;
      g.id = str_or_empty(gv, "id");
      g.name = str_or_empty(gv, "name");
      g.category = static_cast<GroupCategory>(int_or(gv, "category", 0));
      val checklists = gv["checklists"];
      const unsigned clCount = checklists.isUndefined() ? 0 : checklists["length"].as<unsigned>();
      for (unsigned ci = 0; ci < clCount; ++ci) {
        val cv = checklists[ci];
        Checklist cl;
        cl.id = str_or_empty(cv, "id");
        cl.name = str_or_empty(cv, "name");
        val rows = cv["items"];
        const unsigned rowCount = rows.isUndefined() ? 0 : rows["length"].as<unsigned>();
        for (unsigned i = 0; i < rowCount; ++i) cl.items.push_back(item_from_val(rows[i]));
        g.checklists.push_back(std::move(cl));
      }
      f.groups.push_back(std::move(g));
    }
    return f;
  }

  DocumentStore store_;
};

EMSCRIPTEN_BINDINGS(checklist_engine_module) {
  class_<EngineWasm>("Engine")
      .constructor<>()
      .function("createFile", &EngineWasm::createFile)
      .function("addGroup", &EngineWasm::addGroup)
      .function("addChecklist", &EngineWasm::addChecklist)
      .function("openFile", &EngineWasm::openFile)
      .function("closeFile", &EngineWasm::closeFile)
      .function("getFile", &EngineWasm::getFile)
      .function("fileIds", &EngineWasm::fileIds)
      .function("isDirty", &EngineWasm::isDirty)
      .function("markClean", &EngineWasm::markClean)
      .function("moveChecklist", &EngineWasm::moveChecklist)
      .function("copyChecklist", &EngineWasm::copyChecklist)
      .function("items", &EngineWasm::items)
      .function("getItem", &EngineWasm::getItem)
      .function("insertItem", &EngineWasm::insertItem)
      .function("removeItem", &EngineWasm::removeItem)
      .function("duplicateItem", &EngineWasm::duplicateItem)
      .function("moveItem", &EngineWasm::moveItem)
      .function("setDepth", &EngineWasm::setDepth)
      .function("setText", &EngineWasm::setText)
      .function("childCount", &EngineWasm::childCount)
      .function("visibleIds", &EngineWasm::visibleIds)
      .function("toggleCollapsed", &EngineWasm::toggleCollapsed)
      .function("selectItem", &EngineWasm::selectItem)
      .function("selectRange", &EngineWasm::selectRange)
      .function("activeId", &EngineWasm::activeId)
      .function("selectedIds", &EngineWasm::selectedIds)
      .function("undo", &EngineWasm::undo)
      .function("redo", &EngineWasm::redo)
      .function("canUndo", &EngineWasm::canUndo)
      .function("canRedo", &EngineWasm::canRedo);
}

#endif // __EMSCRIPTEN__
