// Fuzzer for JavaScript detection and removal
// Runs the detector, the convergence driver, and the writer over arbitrary input.

#include <pdfscrub/ConvergenceDriver.hh>
#include <pdfscrub/Detector.hh>
#include <pdfscrub/Diagnostics.hh>

#include <qpdf/Buffer.hh>
#include <qpdf/BufferInputSource.hh>
#include <qpdf/Pl_DCT.hh>
#include <qpdf/Pl_Discard.hh>
#include <qpdf/Pl_Flate.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFWriter.hh>

#include <cstdlib>
#include <iostream>

using namespace pdfscrub;

class FuzzHelper
{
  public:
    FuzzHelper(unsigned char const* data, size_t size);
    void run();

  private:
    std::shared_ptr<QPDF> getQpdf();
    void testScrub();
    void doChecks();

    Buffer input_buffer;
    Pl_Discard discard;
    std::shared_ptr<QPDFLogger> log;
};

FuzzHelper::FuzzHelper(unsigned char const* data, size_t size) :
    input_buffer(const_cast<unsigned char*>(data), size),
    log(QPDFLogger::create())
{
    log->setInfo(log->discard());
    log->setWarn(log->discard());
}

std::shared_ptr<QPDF>
FuzzHelper::getQpdf()
{
    auto is =
        std::shared_ptr<InputSource>(new BufferInputSource("fuzz input", &this->input_buffer));
    auto qpdf = QPDF::create();
    qpdf->setLogger(log);
    qpdf->setMaxWarnings(200);
    qpdf->processInputSource(is);
    return qpdf;
}

void
FuzzHelper::testScrub()
{
    std::shared_ptr<QPDF> q = getQpdf();
    Diagnostics diag(log, false, "fuzz");

    std::cerr << "info: detect\n";
    auto before = Detector(*q, diag).detect();
    std::cerr << "info: found = " << before.found << '\n';

    std::cerr << "info: sanitizeDocument\n";
    auto result = ConvergenceDriver(*q, diag).sanitizeDocument();
    std::cerr << "info: " << result.passes << " passes, " << result.stats.total()
              << " removals\n";

    std::cerr << "info: detect after removal\n";
    Detector(*q, diag).detect();

    std::cerr << "info: writing output\n";
    QPDFWriter w(*q);
    w.setOutputPipeline(&discard);
    w.setDeterministicID(true);
    w.write();
}

void
FuzzHelper::doChecks()
{
    Pl_DCT::setMemoryLimit(100'000'000);
    Pl_DCT::setScanLimit(50);
    Pl_Flate::memory_limit(200'000);
    Pl_DCT::setThrowOnCorruptData(true);

    std::cerr << "\ninfo: starting testScrub\n";
    testScrub();
}

void
FuzzHelper::run()
{
    try {
        doChecks();
    } catch (QPDFExc const& e) {
        std::cerr << "QPDFExc: " << e.what() << '\n';
    } catch (std::runtime_error const& e) {
        std::cerr << "runtime_error: " << e.what() << '\n';
    }
}

extern "C" int
LLVMFuzzerTestOneInput(unsigned char const* data, size_t size)
{
#ifndef _WIN32
    setenv("JSIMD_FORCENONE", "1", 1);
#endif
    FuzzHelper f(data, size);
    f.run();
    return 0;
}
