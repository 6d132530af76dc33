#include <pdfscrub/Detector.hh>

#include <pdfscrub/ActionClassifier.hh>
#include <pdfscrub/ScrubExc.hh>

#include <qpdf/QPDFPageDocumentHelper.hh>

#include <algorithm>

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

    bool
    is_action_key(std::string const& key)
    {
        auto const& keys = ActionClassifier::actionKeys();
        return std::find(keys.begin(), keys.end(), key) != keys.end();
    }
} // namespace

Detector::Detector(QPDF& qpdf, Diagnostics const& diag) :
    QPDFDocumentHelper(qpdf),
    diag(diag)
{
}

Detector::Detection
Detector::detect()
{
    Detection result;
    QPDFObjGen::set visited;
    if (scan(qpdf.getRoot(), visited, result.location) || checkDocumentActions(result.location) ||
        checkPages(result.location)) {
        result.found = true;
        diag.warn("found JavaScript in " + result.location);
    }
    return result;
}

bool
Detector::containsJavaScript()
{
    return detect().found;
}

bool
Detector::scan(QPDFObjectHandle node, QPDFObjGen::set& visited, std::string& location)
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

    if (!visited.add(node.getObjGen())) {
        return false;
    }

    if (node.isArray()) {
        for (auto& item: node.aitems()) {
            if (scan(item, visited, location)) {
                return true;
            }
        }
        return false;
    }

    if (ActionClassifier::isJavaScriptAction(node)) {
        location = describe(node);
        return true;
    }
    // A stream's dictionary is searched like any other dictionary.
    auto dict = node.isStream() ? node.getDict() : node;
    for (auto& [key, value]: dict.ditems()) {
        if (is_action_key(key) && ActionClassifier::isJavaScriptAction(value)) {
            location = key + " of " + describe(node);
            return true;
        }
        if (scan(value, visited, location)) {
            return true;
        }
    }
    return false;
}

bool
Detector::checkDocumentActions(std::string& location)
{
    auto root = qpdf.getRoot();
    if (ActionClassifier::isJavaScriptAction(root.getKey("/OpenAction"))) {
        location = "document /OpenAction";
        return true;
    }
    // The document-level JavaScript name tree is disallowed regardless of what it contains.
    auto names = root.getKey("/Names");
    if (names.isDictionary() && names.hasKey("/JavaScript")) {
        location = "document /Names tree";
        return true;
    }
    return false;
}

bool
Detector::checkPages(std::string& location)
{
    int pageno = 0;
    for (auto& page: QPDFPageDocumentHelper(qpdf).getAllPages()) {
        ++pageno;
        auto page_oh = page.getObjectHandle();
        auto page_aa = page_oh.getKey("/AA");
        if (page_aa.isDictionary()) {
            for (auto const& trigger: ActionClassifier::pageTriggerKeys()) {
                if (ActionClassifier::isJavaScriptAction(page_aa.getKey(trigger))) {
                    location = "page " + std::to_string(pageno) + " additional action " + trigger;
                    return true;
                }
            }
        }

        auto annots = page_oh.getKey("/Annots");
        if (annots.isNull()) {
            continue;
        }
        if (!annots.isArray()) {
            diag.warn(
                "page " + std::to_string(pageno) + ": /Annots is " + annots.getTypeName() +
                ", not an array; skipping its annotations");
            continue;
        }
        int annotno = 0;
        for (auto& annot: annots.aitems()) {
            ++annotno;
            if (!annot.isDictionary()) {
                continue;
            }
            auto where =
                "annotation " + std::to_string(annotno) + " on page " + std::to_string(pageno);
            auto action = annot.getKey("/A");
            if (ActionClassifier::isJavaScriptAction(action)) {
                location = where + " action";
                diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
                    v << prefix << ": annotation: " << annot.unparseResolved() << "\n"
                      << prefix << ": action: " << action.unparseResolved() << "\n";
                });
                return true;
            }
            auto annot_aa = annot.getKey("/AA");
            if (!annot_aa.isDictionary()) {
                continue;
            }
            for (auto const& trigger: ActionClassifier::annotationTriggerKeys()) {
                if (ActionClassifier::isJavaScriptAction(annot_aa.getKey(trigger))) {
                    location = where + " additional action " + trigger;
                    return true;
                }
            }
        }
    }
    return false;
}
