#ifndef PDFSCRUB_TEST_DOCS_HH
#define PDFSCRUB_TEST_DOCS_HH

// Helpers shared by the libtests programs for building small documents in memory.

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <memory>
#include <string>

// Create an empty document with npages blank pages.
inline std::shared_ptr<QPDF>
make_document(int npages)
{
    auto q = QPDF::create();
    q->emptyPDF();
    QPDFPageDocumentHelper dh(*q);
    for (int i = 0; i < npages; ++i) {
        auto page = q->makeIndirectObject("<< /Type /Page /MediaBox [0 0 612 792] >>"_qpdf);
        dh.addPage(QPDFPageObjectHelper(page), false);
    }
    return q;
}

inline QPDFObjectHandle
js_action(std::string const& script = "app.alert(1);")
{
    auto action = QPDFObjectHandle::newDictionary();
    action.replaceKey("/Type", QPDFObjectHandle::newName("/Action"));
    action.replaceKey("/S", QPDFObjectHandle::newName("/JavaScript"));
    action.replaceKey("/JS", QPDFObjectHandle::newString(script));
    return action;
}

inline QPDFObjectHandle
uri_action(std::string const& uri = "https://example.com/")
{
    auto action = QPDFObjectHandle::newDictionary();
    action.replaceKey("/S", QPDFObjectHandle::newName("/URI"));
    action.replaceKey("/URI", QPDFObjectHandle::newString(uri));
    return action;
}

// Add an indirect link annotation to the given page and return it.
inline QPDFObjectHandle
add_annotation(QPDF& q, QPDFObjectHandle page)
{
    auto annot = q.makeIndirectObject("<< /Type /Annot /Subtype /Link /Rect [0 0 10 10] >>"_qpdf);
    annot.replaceKey("/P", page);
    if (!page.getKey("/Annots").isArray()) {
        page.replaceKey("/Annots", QPDFObjectHandle::newArray());
    }
    page.getKey("/Annots").appendItem(annot);
    return annot;
}

inline QPDFObjectHandle
page_at(QPDF& q, size_t n)
{
    return q.getAllPages().at(n);
}

#endif // PDFSCRUB_TEST_DOCS_HH
