#include <pdfscrub/ConvergenceDriver.hh>

#include <pdfscrub/ScrubExc.hh>

#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

using namespace pdfscrub;

ConvergenceDriver::ConvergenceDriver(QPDF& qpdf, Diagnostics const& diag) :
    QPDFDocumentHelper(qpdf),
    diag(diag)
{
}

ConvergenceDriver::Result
ConvergenceDriver::sanitizeDocument(int max_passes)
{
    if (max_passes < 1) {
        throw ScrubExc(
            pdfscrub_e_invocation,
            "",
            "the maximum number of passes must be at least 1; got " + std::to_string(max_passes));
    }

    Result result;
    Sanitizer sanitizer(diag);
    bool stable = false;
    while (!stable && result.passes < max_passes) {
        ++result.passes;
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": starting removal pass " << result.passes << "\n";
        });
        bool changed = runPass(sanitizer, result.passes);
        result.stats += sanitizer.getStats();
        sanitizer.resetStats();
        if (changed) {
            result.changed = true;
            diag.info("changes made during removal pass " + std::to_string(result.passes));
        } else {
            stable = true;
            diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
                v << prefix << ": no changes made during removal pass " << result.passes
                  << "; stopping\n";
            });
        }
    }
    if (!stable) {
        result.reached_limit = true;
        result.changed = true;
        diag.warn(
            "removal reached the maximum number of passes (" + std::to_string(max_passes) +
            "); the document structure may be unusual or contain loops");
    }
    return result;
}

bool
ConvergenceDriver::runPass(Sanitizer& sanitizer, int pass)
{
    bool changed = false;
    QPDFObjGen::set visited;

    if (sanitizer.sanitizePass(qpdf.getRoot(), visited)) {
        changed = true;
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": changes made from the document root in pass " << pass << "\n";
        });
    }

    // Walk each page's annotations directly as well. A page object already visited from the root
    // is not skipped here. Only the annotations themselves are subject to the visited set.
    int pageno = 0;
    for (auto& page: QPDFPageDocumentHelper(qpdf).getAllPages()) {
        ++pageno;
        auto annots = page.getObjectHandle().getKey("/Annots");
        if (annots.isNull()) {
            continue;
        }
        if (!annots.isArray()) {
            diag.warn(
                "page " + std::to_string(pageno) + ": /Annots is " + annots.getTypeName() +
                ", not an array; skipping its annotations");
            continue;
        }
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": scanning " << annots.getArrayNItems() << " annotations on page "
              << pageno << " in pass " << pass << "\n";
        });
        int annotno = 0;
        for (auto& annot: annots.getArrayAsVector()) {
            ++annotno;
            if (sanitizer.sanitizePass(annot, visited)) {
                changed = true;
                diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
                    v << prefix << ": changes made in annotation " << annotno << " on page "
                      << pageno << " in pass " << pass << "\n";
                });
            }
        }
    }
    return changed;
}
