#include <pdfscrub/assert_test.h>

// This program tests repeated sanitization passes over whole documents.

#include "test_docs.hh"

#include <pdfscrub/ConvergenceDriver.hh>
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
    return {l, false, "convergence"};
}

static ConvergenceDriver::Result
converge(QPDF& q, int max_passes = ConvergenceDriver::DEFAULT_MAX_PASSES)
{
    return ConvergenceDriver(q, quiet_diagnostics()).sanitizeDocument(max_passes);
}

static bool
found(QPDF& q)
{
    return Detector(q, quiet_diagnostics()).detect().found;
}

static void
check_stable(QPDF& q)
{
    assert(!found(q));
    auto again = converge(q);
    assert(!again.changed);
    assert(!again.reached_limit);
    assert(again.passes == 1);
    assert(again.stats.total() == 0);
}

static void
test_open_action()
{
    auto q = make_document(1);
    q->getRoot().replaceKey("/OpenAction", js_action());
    assert(found(*q));

    auto r = converge(*q);
    assert(r.changed);
    assert(!r.reached_limit);
    assert(r.passes == 2);
    assert(r.stats.keys_removed == 1);
    assert(!q->getRoot().hasKey("/OpenAction"));
    check_stable(*q);
}

static void
test_names_tree()
{
    auto q = make_document(1);
    auto names = "<< /Dests << /Names [] >> /JavaScript << /Names [] >> >>"_qpdf;
    q->getRoot().replaceKey("/Names", names);

    auto r = converge(*q);
    assert(r.changed);
    assert(r.stats.name_trees_removed == 1);
    auto after = q->getRoot().getKey("/Names");
    assert(!after.hasKey("/JavaScript"));
    assert(after.hasKey("/Dests"));
    check_stable(*q);
}

static void
test_annotation_additional_actions()
{
    auto q = make_document(2);
    auto annot = add_annotation(*q, page_at(*q, 1));
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/E", js_action());
    aa.replaceKey("/Bl", js_action("this.submitForm();"));
    annot.replaceKey("/AA", aa);

    auto r = converge(*q);
    assert(r.changed);
    assert(!annot.hasKey("/AA"));
    assert(r.stats.keys_removed == 2);
    assert(r.stats.aa_dictionaries_removed == 1);
    check_stable(*q);
}

static void
test_clean()
{
    auto q = make_document(3);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", uri_action());
    q->getRoot().replaceKey("/OpenAction", "[0 /Fit]"_qpdf);

    auto r = converge(*q);
    assert(!r.changed);
    assert(!r.reached_limit);
    assert(r.passes == 1);
    assert(annot.hasKey("/A"));
    assert(q->getRoot().hasKey("/OpenAction"));
}

static void
test_page_additional_actions()
{
    // Removing the only trigger empties /AA, which must be gone by the end.
    auto q = make_document(1);
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/O", js_action());
    page_at(*q, 0).replaceKey("/AA", aa);

    auto r = converge(*q);
    assert(r.changed);
    assert(r.passes <= 2);
    assert(!page_at(*q, 0).hasKey("/AA"));
    check_stable(*q);
}

static void
test_everything()
{
    auto q = make_document(3);
    q->getRoot().replaceKey("/OpenAction", js_action());
    q->getRoot().replaceKey("/Names", "<< /JavaScript << /Names [] >> >>"_qpdf);
    auto page_aa = QPDFObjectHandle::newDictionary();
    page_aa.replaceKey("/C", js_action());
    page_aa.replaceKey("/O", uri_action());
    page_at(*q, 2).replaceKey("/AA", page_aa);
    for (size_t i = 0; i < 3; ++i) {
        auto annot = add_annotation(*q, page_at(*q, i));
        annot.replaceKey("/A", js_action());
        auto aa = QPDFObjectHandle::newDictionary();
        aa.replaceKey("/U", js_action());
        annot.replaceKey("/AA", aa);
    }
    auto list = q->makeIndirectObject(QPDFObjectHandle::newArray({js_action(), uri_action()}));
    q->getRoot().replaceKey("/Extra", list);

    auto r = converge(*q);
    assert(r.changed);
    assert(!r.reached_limit);
    assert(r.stats.name_trees_removed == 1);
    assert(r.stats.array_items_removed == 1);
    assert(page_at(*q, 2).getKey("/AA").hasKey("/O"));
    assert(q->getRoot().getKey("/Extra").getArrayNItems() == 1);
    check_stable(*q);
}

static void
test_shared_annotation()
{
    auto q = make_document(2);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", js_action());
    page_at(*q, 1).replaceKey("/Annots", QPDFObjectHandle::newArray({annot}));

    auto r = converge(*q);
    assert(r.changed);
    assert(r.stats.keys_removed == 1);
    assert(!annot.hasKey("/A"));
    check_stable(*q);
}

static void
test_cycles()
{
    auto q = make_document(1);
    auto page = page_at(*q, 0);
    auto annot = add_annotation(*q, page);
    annot.replaceKey("/A", page);
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/X", js_action());
    annot.replaceKey("/AA", aa);
    auto loop = q->makeIndirectObject(QPDFObjectHandle::newArray());
    loop.appendItem(loop);
    q->getRoot().replaceKey("/Loop", loop);

    auto r = converge(*q);
    assert(r.changed);
    assert(!r.reached_limit);
    assert(!annot.hasKey("/AA"));
    assert(annot.getKey("/A").isDictionary());
    check_stable(*q);
}

static void
test_pass_limit()
{
    auto q = make_document(1);
    q->getRoot().replaceKey("/OpenAction", js_action());
    warnings.clear();
    auto r = converge(*q, 1);
    assert(r.reached_limit);
    assert(r.changed);
    assert(r.passes == 1);
    assert(warnings.find("maximum number of passes") != std::string::npos);

    // One pass is enough when nothing changes.
    auto q2 = make_document(1);
    auto r2 = converge(*q2, 1);
    assert(!r2.reached_limit);
    assert(!r2.changed);

    bool thrown = false;
    try {
        converge(*q2, 0);
    } catch (ScrubExc& e) {
        thrown = true;
        assert(e.getErrorCode() == pdfscrub_e_invocation);
    }
    assert(thrown);
}

static void
test_bad_annots()
{
    auto q = make_document(2);
    page_at(*q, 1).replaceKey("/Annots", QPDFObjectHandle::newInteger(7));
    warnings.clear();
    auto r = converge(*q);
    assert(!r.changed);
    assert(warnings.find("page 2: /Annots is integer, not an array") != std::string::npos);
}

static void
test_next_chain()
{
    // A JavaScript action reached only through /Next of another action is found by the detector
    // but is outside the removal rules, so the document is stable with it still present.
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    auto first = uri_action();
    first.replaceKey("/Next", js_action());
    annot.replaceKey("/A", first);
    assert(found(*q));

    auto r = converge(*q);
    assert(!r.changed);
    assert(!r.reached_limit);
    assert(r.passes == 1);
    assert(r.stats.total() == 0);
    assert(annot.getKey("/A").getKey("/Next").getKey("/S").isNameAndEquals("/JavaScript"));
    assert(found(*q));
}

int
main()
{
    test_open_action();
    test_names_tree();
    test_annotation_additional_actions();
    test_clean();
    test_page_additional_actions();
    test_everything();
    test_shared_annotation();
    test_cycles();
    test_pass_limit();
    test_bad_annots();
    test_next_chain();
    std::cout << "convergence tests passed" << std::endl;
    return 0;
}
