#include <pdfscrub/ActionClassifier.hh>

#include <qpdf/QPDFObjGen.hh>

using namespace pdfscrub;

namespace
{
    bool
    is_javascript_action(QPDFObjectHandle node, QPDFObjGen::set& seen)
    {
        switch (node.getTypeCode()) {
        case ot_dictionary:
            return node.getKey("/S").isNameAndEquals("/JavaScript");

        case ot_array:
            if (!seen.add(node.getObjGen())) {
                return false;
            }
            for (auto& item: node.aitems()) {
                if (is_javascript_action(item, seen)) {
                    return true;
                }
            }
            return false;

        case ot_uninitialized:
        case ot_reserved:
        case ot_null:
        case ot_boolean:
        case ot_integer:
        case ot_real:
        case ot_string:
        case ot_name:
        case ot_stream:
        case ot_operator:
        case ot_inlineimage:
        case ot_unresolved:
        case ot_destroyed:
            return false;
        }
        return false;
    }
} // namespace

bool
ActionClassifier::isJavaScriptAction(QPDFObjectHandle node)
{
    QPDFObjGen::set seen;
    return is_javascript_action(node, seen);
}

std::vector<std::string> const&
ActionClassifier::actionKeys()
{
    static std::vector<std::string> const keys{"/A", "/AA", "/OpenAction"};
    return keys;
}

std::vector<std::string> const&
ActionClassifier::pageTriggerKeys()
{
    static std::vector<std::string> const keys{"/O", "/C"};
    return keys;
}

std::vector<std::string> const&
ActionClassifier::annotationTriggerKeys()
{
    static std::vector<std::string> const keys{
        "/E", "/X", "/D", "/U", "/Fo", "/Bl", "/PO", "/PC", "/PV", "/PI"};
    return keys;
}
