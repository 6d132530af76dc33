#include <pdfscrub/assert_test.h>

// This program tests the file-level interface. It writes its input and output files to the
// current directory.

#include "test_docs.hh"

#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubJob.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFJob.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include <cstdio>
#include <iostream>
#include <stdexcept>

using namespace pdfscrub;

static std::string info;
static std::string warnings;
static std::string errors;

static void
clear_logs()
{
    info.clear();
    warnings.clear();
    errors.clear();
}

static ScrubJob
make_job()
{
    auto l = QPDFLogger::create();
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    l->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
    ScrubJob j;
    j.setLogger(l);
    j.setMessagePrefix("scrub_job");
    return j;
}

static void
write_pdf(QPDF& q, char const* filename)
{
    QPDFWriter w(q, filename);
    w.setStaticID(true);
    w.write();
}

static void
write_js_pdf(char const* filename)
{
    auto q = make_document(2);
    q->getRoot().replaceKey("/OpenAction", js_action());
    auto annot = add_annotation(*q, page_at(*q, 1));
    auto aa = QPDFObjectHandle::newDictionary();
    aa.replaceKey("/E", js_action());
    aa.replaceKey("/X", uri_action());
    annot.replaceKey("/AA", aa);
    write_pdf(*q, filename);
}

static void
write_clean_pdf(char const* filename)
{
    auto q = make_document(1);
    auto annot = add_annotation(*q, page_at(*q, 0));
    annot.replaceKey("/A", uri_action());
    write_pdf(*q, filename);
}

static void
test_setup()
{
    ScrubJob j;
    assert(j.getMessagePrefix() == "pdfscrub");
    assert(!j.isVerbose());
    assert(j.getMaxPasses() == ConvergenceDriver::DEFAULT_MAX_PASSES);
    assert(j.getLogger() == QPDFLogger::defaultLogger());
    j.setVerbose(true);
    j.setMaxPasses(3);
    assert(j.isVerbose());
    assert(j.getMaxPasses() == 3);
    auto l = QPDFLogger::create();
    j.setLogger(l);
    assert(j.getLogger() == l);
    j.setLogger(nullptr);
    assert(j.getLogger() == QPDFLogger::defaultLogger());
}

static void
test_check()
{
    write_js_pdf("job-js.pdf");
    write_clean_pdf("job-clean.pdf");
    auto j = make_job();

    clear_logs();
    auto r = j.check("job-js.pdf");
    assert(r.checked());
    assert(r.found);
    assert(!r.location.empty());
    assert(warnings.find("scrub_job: JavaScript found in job-js.pdf") != std::string::npos);
    assert(j.containsJavaScript("job-js.pdf"));

    clear_logs();
    auto r2 = j.check("job-clean.pdf");
    assert(r2.checked());
    assert(!r2.found);
    assert(r2.location.empty());
    assert(info.find("scrub_job: no JavaScript found in job-clean.pdf") != std::string::npos);
    assert(!j.containsJavaScript("job-clean.pdf"));
}

static void
test_open_errors()
{
    auto j = make_job();

    clear_logs();
    auto r = j.check("job-does-not-exist.pdf");
    assert(!r.checked());
    assert(!r.found);
    assert(r.error == pdfscrub_e_input_not_found);
    assert(errors.find("unable to check job-does-not-exist.pdf (input not found)") !=
           std::string::npos);
    assert(!j.containsJavaScript("job-does-not-exist.pdf"));

    bool thrown = false;
    try {
        j.createQPDF("job-does-not-exist.pdf");
    } catch (ScrubExc& e) {
        thrown = true;
        assert(e.getErrorCode() == pdfscrub_e_input_not_found);
        assert(e.getFilename() == "job-does-not-exist.pdf");
    }
    assert(thrown);

    FILE* f = QUtil::safe_fopen("job-garbage.pdf", "wb");
    fputs("This is not a PDF file.\nIt has no objects and no trailer.\n", f);
    fclose(f);
    clear_logs();
    auto r2 = j.check("job-garbage.pdf");
    assert(!r2.checked());
    assert(!r2.found);
    assert(r2.error == pdfscrub_e_structure);
    assert(!r2.cause.empty());
    auto rr = j.remove("job-garbage.pdf", "job-garbage-out.pdf");
    assert(!rr.success);
    assert(rr.error == pdfscrub_e_structure);
    assert(!QUtil::file_can_be_opened("job-garbage-out.pdf"));

    write_js_pdf("job-plain.pdf");
    QPDFJob encrypt_job;
    encrypt_job.config()
        ->inputFile("job-plain.pdf")
        ->outputFile("job-encrypted.pdf")
        ->encrypt(256, "user", "owner")
        ->endEncrypt()
        ->checkConfiguration();
    encrypt_job.run();
    clear_logs();
    auto r3 = j.check("job-encrypted.pdf");
    assert(!r3.checked());
    assert(!r3.found);
    assert(r3.error == pdfscrub_e_password);
    assert(errors.find("password protected") != std::string::npos);
    assert(!j.removeJavaScript("job-encrypted.pdf", "job-encrypted-out.pdf"));
}

static void
test_remove()
{
    write_js_pdf("job-remove-in.pdf");
    auto j = make_job();

    clear_logs();
    auto r = j.remove("job-remove-in.pdf", "job-remove-out.pdf");
    assert(r.success);
    assert(r.error == pdfscrub_e_success);
    assert(r.result.changed);
    assert(!r.result.reached_limit);
    assert(r.result.stats.total() > 0);
    assert(info.find("JavaScript removed") != std::string::npos);

    // The output is clean and the input is untouched.
    auto out = j.check("job-remove-out.pdf");
    assert(out.checked());
    assert(!out.found);
    assert(j.containsJavaScript("job-remove-in.pdf"));

    // Non-JavaScript actions survive the round trip.
    auto pdf = j.createQPDF("job-remove-out.pdf");
    auto annot = pdf->getAllPages().at(1).getKey("/Annots").getArrayItem(0);
    assert(annot.getKey("/AA").hasKey("/X"));
    assert(!annot.getKey("/AA").hasKey("/E"));

    // A clean input is still written.
    write_clean_pdf("job-clean-in.pdf");
    clear_logs();
    auto r2 = j.remove("job-clean-in.pdf", "job-clean-out.pdf");
    assert(r2.success);
    assert(!r2.result.changed);
    assert(r2.result.passes == 1);
    assert(QUtil::file_can_be_opened("job-clean-out.pdf"));
    assert(info.find("saving output anyway") != std::string::npos);
    assert(j.removeJavaScript("job-clean-in.pdf", "job-clean-out2.pdf"));

    // Pass limit
    j.setMaxPasses(1);
    auto r3 = j.remove("job-remove-in.pdf", "job-limit-out.pdf");
    assert(r3.success);
    assert(r3.result.reached_limit);
    assert(r3.result.passes == 1);
}

static void
test_invocation_errors()
{
    write_js_pdf("job-same.pdf");
    auto j = make_job();

    clear_logs();
    auto r = j.remove("job-same.pdf", "./job-same.pdf");
    assert(!r.success);
    assert(r.error == pdfscrub_e_invocation);
    assert(errors.find("(invalid invocation)") != std::string::npos);
    assert(j.containsJavaScript("job-same.pdf"));

    // Detected before the input is opened
    auto r2 = j.remove("job-same-missing.pdf", "job-same-missing.pdf");
    assert(r2.error == pdfscrub_e_invocation);
    assert(!QUtil::file_can_be_opened("job-same-missing.pdf"));

    j.setMaxPasses(0);
    auto r3 = j.remove("job-same.pdf", "job-zero-out.pdf");
    assert(!r3.success);
    assert(r3.error == pdfscrub_e_invocation);
    assert(!QUtil::file_can_be_opened("job-zero-out.pdf"));
}

static void
test_output_errors()
{
    write_js_pdf("job-output.pdf");
    auto j = make_job();
    clear_logs();
    auto r = j.remove("job-output.pdf", "job-no-such-directory/out.pdf");
    assert(!r.success);
    assert(r.error == pdfscrub_e_output);
    assert(!r.cause.empty());
    assert(errors.find("(output write error)") != std::string::npos);
}

namespace
{
    class FailingProvider: public QPDFObjectHandle::StreamDataProvider
    {
      public:
        ~FailingProvider() override = default;
        void
        provideStreamData(QPDFObjGen const&, Pipeline*) override
        {
            throw std::runtime_error("stream data is unavailable");
        }
    };
} // namespace

static void
test_incomplete_output()
{
    // A write that fails after the output file is opened leaves nothing behind.
    write_clean_pdf("job-partial-in.pdf");
    auto j = make_job();
    auto pdf = j.createQPDF("job-partial-in.pdf");
    auto stream = QPDFObjectHandle::newStream(pdf.get());
    stream.replaceStreamData(
        std::make_shared<FailingProvider>(),
        QPDFObjectHandle::newNull(),
        QPDFObjectHandle::newNull());
    pdf->getRoot().replaceKey("/Broken", stream);

    bool thrown = false;
    try {
        j.writeQPDF(*pdf, "job-partial-out.pdf");
    } catch (ScrubExc& e) {
        thrown = true;
        assert(e.getErrorCode() == pdfscrub_e_output);
        assert(e.getFilename() == "job-partial-out.pdf");
    }
    assert(thrown);
    assert(!QUtil::file_can_be_opened("job-partial-out.pdf"));
}

static void
test_verbose()
{
    write_js_pdf("job-verbose.pdf");
    auto j = make_job();
    j.setVerbose(true);
    clear_logs();
    assert(j.removeJavaScript("job-verbose.pdf", "job-verbose-out.pdf"));
    assert(info.find("scrub_job: starting removal pass 1") != std::string::npos);
    assert(info.find("scrub_job: wrote file job-verbose-out.pdf") != std::string::npos);
}

int
main()
{
    test_setup();
    test_check();
    test_open_errors();
    test_remove();
    test_invocation_errors();
    test_output_errors();
    test_incomplete_output();
    test_verbose();
    std::cout << "scrub job tests passed" << std::endl;
    return 0;
}
