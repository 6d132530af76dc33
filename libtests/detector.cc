#include <pdfscrub/assert_test.h>

// This program tests read-only detection of JavaScript actions in documents built in memory.

#include "test_docs.hh"

#include <pdfscrub/Detector.hh>
#include <pdfscrub/Diagnostics.hh>
#include <pdfscrub/ScrubExc.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>

using namespace pdfscrub;

static std::string warnings;

static Diagnostics
quiet_diagnostics()
{
    auto l = QPDFLogger::create();
    l->setInfo(l->discard());
    l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    return {l, false, "detector"};
}

static bool
found(QPDF& q)
{
    return Detector(q, quiet_diagnostics()).detect().found;
}

static void
test_clean()
{
    auto q = make_document(2);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", uri_action());
    q->getRoot().replaceKey("/OpenAction", "[0 /Fit]"_qpdf);
    auto names = "<< /Dests << /Names [] >> >>"_qpdf;
    q->getRoot().replaceKey("/Names", names);

    Detector d(*q, quiet_diagnostics());
    auto detection = d.detect();
    assert(!detection.found);
    assert(detection.location.empty());
    assert(!d.containsJavaScript());
}

static void
test_open_action()
{
    auto q = make_document(1);
    q->getRoot().replaceKey("/OpenAction", js_action());
    warnings.clear();
    auto detection = Detector(*q, quiet_diagnostics()).detect();
    assert(detection.found);
    assert(!detection.location.empty());
    assert(warnings.find("found JavaScript in") != std::string::npos);

    // Chained actions in an array
    auto q2 = make_document(1);
    q2->getRoot().replaceKey(
        "/OpenAction", QPDFObjectHandle::newArray({uri_action(), js_action()}));
    assert(found(*q2));
}

static void
test_names_tree()
{
    // The mere presence of /Names /JavaScript counts, even with nothing in it.
    auto q = make_document(1);
    q->getRoot().replaceKey("/Names", "<< /JavaScript << /Names [] >> >>"_qpdf);
    auto detection = Detector(*q, quiet_diagnostics()).detect();
    assert(detection.found);
    assert(detection.location == "document /Names tree");
}

static void
test_page_actions()
{
    auto q = make_document(3);
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/C", js_action());
    page_at(*q, 2).replaceKey("/AA", aa);
    assert(found(*q));

    auto q2 = make_document(1);
    auto aa2 = QPDFObjectHandle::newDictionary();
    aa2.replaceKey("/O", uri_action());
    page_at(*q2, 0).replaceKey("/AA", aa2);
    assert(!found(*q2));
}

static void
test_annotations()
{
    auto q = make_document(2);
    auto annot = add_annotation(*q, page_at(*q, 1));
    annot.replaceKey("/A", js_action());
    assert(found(*q));

    for (auto const& trigger: {"/E", "/X", "/D", "/U", "/Fo", "/Bl", "/PO", "/PC", "/PV", "/PI"}) {
        auto q2 = make_document(1);
        auto annot2 = add_annotation(*q2, page_at(*q2, 0));
        auto aa = QPDFObjectHandle::newDictionary();
        aa.replaceKey(trigger, js_action());
        annot2.replaceKey("/AA", aa);
        assert(found(*q2));
    }
}

static void
test_scan()
{
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", js_action());

    Detector d(*q, quiet_diagnostics());
    QPDFObjGen::set visited;
    std::string location;
    assert(d.scan(q->getRoot(), visited, location));
    assert(!location.empty());

    // Everything is visited already, so a second scan with the same set finds nothing.
    location.clear();
    assert(!d.scan(q->getRoot(), visited, location));
    assert(location.empty());
}

static void
test_nested()
{
    // An action buried in an unrelated structure is found by the generic walk.
    auto q = make_document(1);
    auto outline = q->makeIndirectObject("<< /Title (Chapter 1) >>"_qpdf);
    outline.replaceKey("/A", js_action());
    auto outlines = q->makeIndirectObject("<< /Type /Outlines >>"_qpdf);
    outlines.replaceKey("/First", outline);
    outlines.replaceKey("/Last", outline);
    outline.replaceKey("/Parent", outlines);
    q->getRoot().replaceKey("/Outlines", outlines);
    assert(found(*q));

    // Action dictionaries chain through /Next.
    auto q2 = make_document(1);
    auto first = uri_action();
    first.replaceKey("/Next", js_action());
    q2->getRoot().replaceKey("/OpenAction", first);
    assert(found(*q2));

    // Stream dictionaries are walked too.
    auto q3 = make_document(1);
    auto stream = QPDFObjectHandle::newStream(q3.get(), "BT ET");
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/PO", js_action());
    stream.getDict().replaceKey("/AA", aa);
    page_at(*q3, 0).replaceKey("/Contents", stream);
    assert(found(*q3));
}

static void
test_cycles()
{
    // /A points back at the dictionary that holds it.
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", annot);
    assert(!found(*q));

    // /A points back at an ancestor.
    auto q2 = make_document(1);
    auto page = page_at(*q2, 0);
    auto annot2 = add_annotation(*q2, page);
    annot2.replaceKey("/A", page);
    assert(!found(*q2));
    annot2.replaceKey("/AA", QPDFObjectHandle::newDictionary());
    annot2.getKey("/AA").replaceKey("/U", js_action());
    assert(found(*q2));

    // An array that contains itself
    auto q3 = make_document(1);
    auto loop = q3->makeIndirectObject(QPDFObjectHandle::newArray());
    loop.appendItem(loop);
    q3->getRoot().replaceKey("/Loop", loop);
    assert(!found(*q3));
}

static void
test_bad_annots()
{
    auto q = make_document(1);
    page_at(*q, 0).replaceKey("/Annots", "<< /Not /AnArray >>"_qpdf);
    warnings.clear();
    assert(!found(*q));
    assert(warnings.find("not an array") != std::string::npos);
}

static void
test_destroyed()
{
    // Handles outlive the QPDF they came from.
    auto q = make_document(1);
    auto root = q->getRoot();
    q.reset();

    auto other = make_document(1);
    Detector d(*other, quiet_diagnostics());
    QPDFObjGen::set visited;
    std::string location;
    bool thrown = false;
    try {
        d.scan(root, visited, location);
    } catch (ScrubExc& e) {
        thrown = true;
        assert(e.getErrorCode() == pdfscrub_e_structure);
    }
    assert(thrown);
    assert(location.empty());
}

int
main()
{
    test_clean();
    test_open_action();
    test_names_tree();
    test_page_actions();
    test_annotations();
    test_scan();
    test_nested();
    test_cycles();
    test_bad_annots();
    test_destroyed();
    std::cout << "detector tests passed" << std::endl;
    return 0;
}
