#include <pdfscrub/assert_test.h>

// This program writes the input files used by the pdfscrub command-line tests to the current
// directory.

#include "test_docs.hh"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFJob.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include <cstdio>
#include <iostream>

static void
write_pdf(QPDF& q, char const* filename)
{
    QPDFWriter w(q, filename);
    w.setStaticID(true);
    w.write();
    assert(QUtil::file_can_be_opened(filename));
}

static void
write_js()
{
    auto q = make_document(2);
    q->getRoot().replaceKey("/OpenAction", js_action());
    auto annot = add_annotation(*q, page_at(*q, 1));
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/Bl", js_action());
    annot.replaceKey("/AA", aa);
    write_pdf(*q, "cli-js.pdf");
}

static void
write_clean()
{
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", uri_action());
    write_pdf(*q, "cli-clean.pdf");
}

static void
write_next_chain()
{
    // JavaScript that the removal rules don't reach
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    auto first = uri_action();
    first.replaceKey("/Next", js_action());
    annot.replaceKey("/A", first);
    write_pdf(*q, "cli-next.pdf");
}

static void
write_encrypted()
{
    QPDFJob j;
    j.config()
        ->inputFile("cli-js.pdf")
        ->outputFile("cli-encrypted.pdf")
        ->encrypt(256, "user", "owner")
        ->endEncrypt()
        ->checkConfiguration();
    j.run();
    assert(QUtil::file_can_be_opened("cli-encrypted.pdf"));
}

static void
write_garbage()
{
    FILE* f = QUtil::safe_fopen("cli-garbage.pdf", "wb");
    fputs("garbage\n", f);
    fclose(f);
}

int
main()
{
    write_js();
    write_clean();
    write_next_chain();
    write_encrypted();
    write_garbage();
    std::cout << "cli fixtures tests passed" << std::endl;
    return 0;
}
