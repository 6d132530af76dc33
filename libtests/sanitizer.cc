#include <pdfscrub/assert_test.h>

// This program tests a single sanitization pass over documents built in memory.

#include "test_docs.hh"

#include <pdfscrub/Diagnostics.hh>
#include <pdfscrub/Sanitizer.hh>
#include <pdfscrub/ScrubExc.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>

using namespace pdfscrub;

static std::string info;

static Diagnostics
quiet_diagnostics(bool verbose = false)
{
    auto l = QPDFLogger::create();
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setWarn(l->discard());
    return {l, verbose, "sanitizer"};
}

static bool
sanitize(QPDF& q, Sanitizer& s)
{
    QPDFObjGen::set visited;
    return s.sanitizePass(q.getRoot(), visited);
}

static void
test_clean()
{
    auto q = make_document(2);
    auto annot = add_annotation(*q, page_at(*q, 1));
    annot.replaceKey("/A", uri_action());
    q->getRoot().replaceKey("/OpenAction", uri_action("https://example.com/open"));

    Sanitizer s(quiet_diagnostics());
    assert(!sanitize(*q, s));
    assert(s.getStats().total() == 0);
    assert(annot.hasKey("/A"));
    assert(q->getRoot().getKey("/OpenAction").getKey("/S").isNameAndEquals("/URI"));
}

static void
test_action_keys()
{
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", js_action());
    q->getRoot().replaceKey("/OpenAction", js_action("this.print();"));

    Sanitizer s(quiet_diagnostics());
    assert(sanitize(*q, s));
    assert(!annot.hasKey("/A"));
    assert(!q->getRoot().hasKey("/OpenAction"));
    assert(annot.getKey("/Subtype").isNameAndEquals("/Link"));
    assert(s.getStats().keys_removed == 2);

    // A chained action list counts as a JavaScript action as a whole.
    auto q2 = make_document(1);
    q2->getRoot().replaceKey(
        "/OpenAction", QPDFObjectHandle::newArray({uri_action(), js_action()}));
    Sanitizer s2(quiet_diagnostics());
    assert(sanitize(*q2, s2));
    assert(!q2->getRoot().hasKey("/OpenAction"));
}

static void
test_additional_actions()
{
    // Non-JavaScript triggers survive.
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/E", js_action());
    aa.replaceKey("/X", uri_action());
    aa.replaceKey("/D", js_action());
    annot.replaceKey("/AA", aa);

    Sanitizer s(quiet_diagnostics());
    assert(sanitize(*q, s));
    auto remaining = annot.getKey("/AA");
    assert(remaining.isDictionary());
    assert(!remaining.hasKey("/E"));
    assert(!remaining.hasKey("/D"));
    assert(remaining.hasKey("/X"));
    assert(s.getStats().keys_removed == 2);
    assert(s.getStats().aa_dictionaries_removed == 0);

    // /AA goes away once it is empty.
    auto q2 = make_document(1);
    auto aa2 = QPDFObjectHandle::newDictionary();
    aa2.replaceKey("/O", js_action());
    page_at(*q2, 0).replaceKey("/AA", aa2);
    Sanitizer s2(quiet_diagnostics());
    assert(sanitize(*q2, s2));
    assert(!page_at(*q2, 0).hasKey("/AA"));
    assert(s2.getStats().keys_removed == 1);
    assert(s2.getStats().aa_dictionaries_removed == 1);

    // An /AA that was already empty is left alone.
    auto q3 = make_document(1);
    page_at(*q3, 0).replaceKey("/AA", QPDFObjectHandle::newDictionary());
    Sanitizer s3(quiet_diagnostics());
    assert(!sanitize(*q3, s3));
    assert(page_at(*q3, 0).hasKey("/AA"));

    // /AA that is not a dictionary is walked like anything else.
    auto q4 = make_document(1);
    auto annot4 = add_annotation(*q4, page_at(*q4, 0));
    auto inner = uri_action();
    inner.replaceKey("/A", js_action());
    annot4.replaceKey("/AA", QPDFObjectHandle::newArray({inner}));
    Sanitizer s4(quiet_diagnostics());
    assert(sanitize(*q4, s4));
    assert(annot4.getKey("/AA").isArray());
    assert(!annot4.getKey("/AA").getArrayItem(0).hasKey("/A"));
}

static void
test_names()
{
    auto q = make_document(1);
    auto names = "<< /Dests << /Names [(first) [0 /Fit]] >> >>"_qpdf;
    names.replaceKey("/JavaScript", "<< /Names [(init) null] >>"_qpdf);
    names.getKey("/JavaScript").getKey("/Names").setArrayItem(1, js_action());
    q->getRoot().replaceKey("/Names", names);

    info.clear();
    Sanitizer s(quiet_diagnostics());
    assert(sanitize(*q, s));
    auto after = q->getRoot().getKey("/Names");
    assert(!after.hasKey("/JavaScript"));
    assert(after.hasKey("/Dests"));
    assert(s.getStats().name_trees_removed == 1);
    assert(info.find("removed /JavaScript name tree") != std::string::npos);

    // The rest of /Names is still walked.
    auto q2 = make_document(1);
    auto names2 = QPDFObjectHandle::newDictionary();
    auto holder = uri_action();
    holder.replaceKey("/A", js_action());
    names2.replaceKey("/Other", holder);
    q2->getRoot().replaceKey("/Names", names2);
    Sanitizer s2(quiet_diagnostics());
    assert(sanitize(*q2, s2));
    assert(!q2->getRoot().getKey("/Names").getKey("/Other").hasKey("/A"));
}

static void
test_arrays()
{
    auto q = make_document(1);
    auto items = QPDFObjectHandle::newArray(
        {QPDFObjectHandle::newString("a"),
         js_action(),
         QPDFObjectHandle::newString("b"),
         js_action(),
         js_action(),
         QPDFObjectHandle::newString("c")});
    q->getRoot().replaceKey("/Items", items);

    Sanitizer s(quiet_diagnostics());
    assert(sanitize(*q, s));
    auto after = q->getRoot().getKey("/Items");
    assert(after.getArrayNItems() == 3);
    assert(after.getArrayItem(0).getUTF8Value() == "a");
    assert(after.getArrayItem(1).getUTF8Value() == "b");
    assert(after.getArrayItem(2).getUTF8Value() == "c");
    assert(s.getStats().array_items_removed == 3);

    s.resetStats();
    assert(s.getStats().total() == 0);
    assert(!sanitize(*q, s));
}

static void
test_streams()
{
    auto q = make_document(1);
    auto stream = QPDFObjectHandle::newStream(q.get(), "BT ET");
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/PC", js_action());
    stream.getDict().replaceKey("/AA", aa);
    page_at(*q, 0).replaceKey("/Contents", stream);

    Sanitizer s(quiet_diagnostics());
    assert(sanitize(*q, s));
    assert(!page_at(*q, 0).getKey("/Contents").getDict().hasKey("/AA"));
}

static void
test_visited()
{
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", js_action());

    Sanitizer s(quiet_diagnostics());
    QPDFObjGen::set visited;
    visited.add(annot.getObjGen());
    assert(!s.sanitizePass(annot, visited));
    assert(annot.hasKey("/A"));

    // With a fresh set the annotation is processed.
    QPDFObjGen::set fresh;
    assert(s.sanitizePass(annot, fresh));
    assert(!annot.hasKey("/A"));

    // Scalars are never changed.
    assert(!s.sanitizePass(QPDFObjectHandle::newInteger(3), fresh));
    assert(!s.sanitizePass(QPDFObjectHandle::newNull(), fresh));
}

static void
test_cycles()
{
    auto q = make_document(1);
    auto page = page_at(*q, 0);
    auto annot = add_annotation(*q, page);
    annot.replaceKey("/A", page);
    auto loop = q->makeIndirectObject(QPDFObjectHandle::newArray());
    loop.appendItem(loop);
    loop.appendItem(QPDFObjectHandle::newString("x"));
    q->getRoot().replaceKey("/Loop", loop);
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/U", js_action());
    annot.replaceKey("/AA", aa);

    Sanitizer s(quiet_diagnostics());
    assert(sanitize(*q, s));
    assert(annot.getKey("/A").isDictionary());
    assert(!annot.hasKey("/AA"));
    assert(q->getRoot().getKey("/Loop").getArrayNItems() == 2);
    assert(!sanitize(*q, s));
}

static void
test_verbose()
{
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", js_action());

    info.clear();
    Sanitizer s(quiet_diagnostics(true));
    assert(sanitize(*q, s));
    assert(info.find("sanitizer: removed /A from object ") != std::string::npos);

    // Quiet mode says nothing about individual removals.
    auto q2 = make_document(1);
    auto annot2 = add_annotation(*q2, page_at(*q2, 0));
    annot2.replaceKey("/A", js_action());
    info.clear();
    Sanitizer s2(quiet_diagnostics());
    assert(sanitize(*q2, s2));
    assert(info.empty());
}

static void
test_stats()
{
    Sanitizer::Stats a;
    a.keys_removed = 2;
    a.array_items_removed = 1;
    Sanitizer::Stats b;
    b.keys_removed = 1;
    b.aa_dictionaries_removed = 1;
    b.name_trees_removed = 1;
    a += b;
    assert(a.keys_removed == 3);
    assert(a.array_items_removed == 1);
    assert(a.aa_dictionaries_removed == 1);
    assert(a.name_trees_removed == 1);
    assert(a.total() == 6);
    assert(b.total() == 3);
}

static void
test_destroyed()
{
    auto q = make_document(1);
    auto root = q->getRoot();
    q.reset();

    Sanitizer s(quiet_diagnostics());
    QPDFObjGen::set visited;
    bool thrown = false;
    try {
        s.sanitizePass(root, visited);
    } catch (ScrubExc& e) {
        thrown = true;
        assert(e.getErrorCode() == pdfscrub_e_structure);
    }
    assert(thrown);
    assert(s.getStats().total() == 0);
}

int
main()
{
    test_clean();
    test_action_keys();
    test_additional_actions();
    test_names();
    test_arrays();
    test_streams();
    test_visited();
    test_cycles();
    test_verbose();
    test_stats();
    test_destroyed();
    std::cout << "sanitizer tests passed" << std::endl;
    return 0;
}
