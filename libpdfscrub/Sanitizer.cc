#include <pdfscrub/Sanitizer.hh>

#include <pdfscrub/ActionClassifier.hh>
#include <pdfscrub/ScrubExc.hh>

#include <qpdf/QIntC.hh>

#include <vector>

using namespace pdfscrub;

namespace
{
    std::string
    describe(QPDFObjectHandle const& oh)
    {
        auto og = oh.getObjGen();
        if (og.isIndirect()) {
            return "object " + og.unparse(' ') + " R";
        }
        return "direct object";
    }
} // namespace

Sanitizer::Stats&
Sanitizer::Stats::operator+=(Stats const& other)
{
    keys_removed += other.keys_removed;
    array_items_removed += other.array_items_removed;
    aa_dictionaries_removed += other.aa_dictionaries_removed;
    name_trees_removed += other.name_trees_removed;
    return *this;
}

int
Sanitizer::Stats::total() const
{
    return keys_removed + array_items_removed + aa_dictionaries_removed + name_trees_removed;
}

Sanitizer::Sanitizer(Diagnostics const& diag) :
    diag(diag)
{
}

Sanitizer::Stats const&
Sanitizer::getStats() const
{
    return stats;
}

void
Sanitizer::resetStats()
{
    stats = Stats();
}

bool
Sanitizer::sanitizePass(QPDFObjectHandle node, QPDFObjGen::set& visited)
{
    switch (node.getTypeCode()) {
    case ot_dictionary:
    case ot_stream:
    case ot_array:
        break;

    case ot_destroyed:
        throw ScrubExc(
            pdfscrub_e_structure, "", "encountered an object from a destroyed document");

    case ot_uninitialized:
    case ot_reserved:
    case ot_null:
    case ot_boolean:
    case ot_integer:
    case ot_real:
    case ot_string:
    case ot_name:
    case ot_operator:
    case ot_inlineimage:
    case ot_unresolved:
        return false;
    }

    auto og = node.getObjGen();
    if (!visited.add(og)) {
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": skipping already visited object " << og.unparse(' ') << " R\n";
        });
        return false;
    }

    auto owner = describe(node);
    if (node.isArray()) {
        return sanitizeArray(node, owner, visited);
    }
    if (node.isStream()) {
        return sanitizeDictionary(node.getDict(), owner, visited);
    }
    return sanitizeDictionary(node, owner, visited);
}

bool
Sanitizer::sanitizeDictionary(
    QPDFObjectHandle dict, std::string const& owner, QPDFObjGen::set& visited)
{
    bool changed = false;
    std::vector<std::string> to_remove;

    // Iterate over a copy of the entries. Keys of dict are only removed after the loop.
    for (auto& [key, value]: dict.getDictAsMap()) {
        if (key == "/A" || key == "/OpenAction") {
            if (ActionClassifier::isJavaScriptAction(value)) {
                to_remove.push_back(key);
                continue;
            }
        } else if (key == "/AA" && value.isDictionary()) {
            bool emptied = false;
            if (sanitizeAdditionalActions(value, owner, visited, emptied)) {
                changed = true;
            }
            if (emptied) {
                to_remove.push_back(key);
                ++stats.aa_dictionaries_removed;
            }
            continue;
        } else if (key == "/Names" && value.isDictionary()) {
            if (value.hasKey("/JavaScript")) {
                value.removeKey("/JavaScript");
                ++stats.name_trees_removed;
                changed = true;
                diag.info("removed /JavaScript name tree from " + owner);
            }
            // The rest of the names dictionary may still hold actions elsewhere.
        }
        if (sanitizePass(value, visited)) {
            changed = true;
        }
    }

    for (auto const& key: to_remove) {
        dict.removeKey(key);
        if (key != "/AA") {
            ++stats.keys_removed;
        }
        changed = true;
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": removed " << key << " from " << owner << "\n";
        });
    }
    return changed;
}

bool
Sanitizer::sanitizeAdditionalActions(
    QPDFObjectHandle aa, std::string const& owner, QPDFObjGen::set& visited, bool& emptied)
{
    bool changed = false;
    std::vector<std::string> to_remove;
    for (auto& [trigger, action]: aa.getDictAsMap()) {
        if (ActionClassifier::isJavaScriptAction(action)) {
            to_remove.push_back(trigger);
        } else if (sanitizePass(action, visited)) {
            changed = true;
        }
    }
    if (to_remove.empty()) {
        return changed;
    }

    for (auto const& trigger: to_remove) {
        aa.removeKey(trigger);
        ++stats.keys_removed;
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": removed additional action " << trigger << " from " << owner << "\n";
        });
    }
    emptied = aa.getKeys().empty();
    return true;
}

bool
Sanitizer::sanitizeArray(
    QPDFObjectHandle array, std::string const& owner, QPDFObjGen::set& visited)
{
    bool changed = false;
    auto items = array.getArrayAsVector();
    std::vector<int> to_erase;
    int n = QIntC::to_int(items.size());
    for (int i = 0; i < n; ++i) {
        if (ActionClassifier::isJavaScriptAction(items.at(QIntC::to_size(i)))) {
            to_erase.push_back(i);
        } else if (sanitizePass(items.at(QIntC::to_size(i)), visited)) {
            changed = true;
        }
    }

    // Highest index first so the indices still to be erased don't shift.
    for (auto iter = to_erase.rbegin(); iter != to_erase.rend(); ++iter) {
        array.eraseItem(*iter);
        ++stats.array_items_removed;
        changed = true;
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": removed item " << *iter << " from array " << owner << "\n";
        });
    }
    return changed;
}
