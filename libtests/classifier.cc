#include <pdfscrub/assert_test.h>

// This program tests classification of JavaScript actions.

#include "test_docs.hh"

#include <pdfscrub/ActionClassifier.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <iostream>

using namespace pdfscrub;

static void
test_dictionaries()
{
    assert(ActionClassifier::isJavaScriptAction(js_action()));
    assert(ActionClassifier::isJavaScriptAction("<< /S /JavaScript >>"_qpdf));
    assert(!ActionClassifier::isJavaScriptAction(uri_action()));
    assert(!ActionClassifier::isJavaScriptAction("<< /JS (app.alert\\(1\\)) >>"_qpdf));
    // /S must be a name, not a string
    assert(!ActionClassifier::isJavaScriptAction("<< /S (JavaScript) >>"_qpdf));
    assert(!ActionClassifier::isJavaScriptAction("<< /S /Javascript >>"_qpdf));
    assert(!ActionClassifier::isJavaScriptAction("<< >>"_qpdf));
}

static void
test_arrays()
{
    assert(!ActionClassifier::isJavaScriptAction("[]"_qpdf));
    assert(!ActionClassifier::isJavaScriptAction(
        QPDFObjectHandle::newArray({uri_action(), uri_action()})));
    assert(ActionClassifier::isJavaScriptAction(
        QPDFObjectHandle::newArray({uri_action(), js_action()})));
    // Chained lists may be nested
    auto inner = QPDFObjectHandle::newArray({js_action()});
    assert(ActionClassifier::isJavaScriptAction(
        QPDFObjectHandle::newArray({uri_action(), inner})));
    assert(!ActionClassifier::isJavaScriptAction("[1 /JavaScript (JavaScript) null]"_qpdf));
}

static void
test_other_types()
{
    assert(!ActionClassifier::isJavaScriptAction(QPDFObjectHandle::newNull()));
    assert(!ActionClassifier::isJavaScriptAction(QPDFObjectHandle::newName("/JavaScript")));
    assert(!ActionClassifier::isJavaScriptAction(QPDFObjectHandle::newString("JavaScript")));
    assert(!ActionClassifier::isJavaScriptAction(QPDFObjectHandle::newInteger(1)));
    assert(!ActionClassifier::isJavaScriptAction(QPDFObjectHandle::newBool(true)));
    assert(!ActionClassifier::isJavaScriptAction(QPDFObjectHandle()));

    // A stream is never an action, even if its dictionary looks like one.
    QPDF q;
    q.emptyPDF();
    auto stream = QPDFObjectHandle::newStream(&q, "app.alert(1);");
    stream.getDict().replaceKey("/S", QPDFObjectHandle::newName("/JavaScript"));
    assert(!ActionClassifier::isJavaScriptAction(stream));
}

static void
test_indirect()
{
    QPDF q;
    q.emptyPDF();

    auto action = q.makeIndirectObject(js_action());
    assert(ActionClassifier::isJavaScriptAction(action));
    assert(ActionClassifier::isJavaScriptAction(QPDFObjectHandle::newArray({action})));

    // An array that contains itself must not loop forever.
    auto loop = q.makeIndirectObject(QPDFObjectHandle::newArray());
    loop.appendItem(loop);
    loop.appendItem(QPDFObjectHandle::newName("/Next"));
    assert(!ActionClassifier::isJavaScriptAction(loop));
    loop.appendItem(action);
    assert(ActionClassifier::isJavaScriptAction(loop));

    // Two arrays that contain each other
    auto a = q.makeIndirectObject(QPDFObjectHandle::newArray());
    auto b = q.makeIndirectObject(QPDFObjectHandle::newArray({a}));
    a.appendItem(b);
    assert(!ActionClassifier::isJavaScriptAction(a));
    assert(!ActionClassifier::isJavaScriptAction(b));
}

static void
test_key_tables()
{
    auto const& action_keys = ActionClassifier::actionKeys();
    assert(action_keys.size() == 3);
    assert(action_keys.at(0) == "/A");
    assert(action_keys.at(1) == "/AA");
    assert(action_keys.at(2) == "/OpenAction");

    auto const& page_keys = ActionClassifier::pageTriggerKeys();
    assert(page_keys.size() == 2);
    assert(page_keys.at(0) == "/O");
    assert(page_keys.at(1) == "/C");

    auto const& annot_keys = ActionClassifier::annotationTriggerKeys();
    assert(annot_keys.size() == 10);
    assert(annot_keys.front() == "/E");
    assert(annot_keys.back() == "/PI");
}

int
main()
{
    test_dictionaries();
    test_arrays();
    test_other_types();
    test_indirect();
    test_key_tables();
    std::cout << "classifier tests passed" << std::endl;
    return 0;
}
