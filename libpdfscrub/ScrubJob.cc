#include <pdfscrub/ScrubJob.hh>

#include <pdfscrub/Detector.hh>
#include <pdfscrub/ScrubExc.hh>

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include <filesystem>
#include <system_error>

using namespace pdfscrub;

namespace
{
    bool
    same_path(std::string const& a, std::string const& b)
    {
        std::error_code ec_a;
        std::error_code ec_b;
        auto path_a = std::filesystem::absolute(a, ec_a).lexically_normal();
        auto path_b = std::filesystem::absolute(b, ec_b).lexically_normal();
        if (ec_a || ec_b) {
            return a == b;
        }
        return path_a == path_b;
    }
} // namespace

ScrubJob::Members::Members() :
    log(QPDFLogger::defaultLogger())
{
}

ScrubJob::ScrubJob() :
    m(new Members())
{
}

void
ScrubJob::setMessagePrefix(std::string const& message_prefix)
{
    m->message_prefix = message_prefix;
}

std::string
ScrubJob::getMessagePrefix() const
{
    return m->message_prefix;
}

std::shared_ptr<QPDFLogger>
ScrubJob::getLogger()
{
    return m->log;
}

void
ScrubJob::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l ? l : QPDFLogger::defaultLogger();
}

void
ScrubJob::setVerbose(bool verbose)
{
    m->verbose = verbose;
}

bool
ScrubJob::isVerbose() const
{
    return m->verbose;
}

void
ScrubJob::setMaxPasses(int max_passes)
{
    m->max_passes = max_passes;
}

int
ScrubJob::getMaxPasses() const
{
    return m->max_passes;
}

Diagnostics
ScrubJob::diagnostics() const
{
    return {m->log, m->verbose, m->message_prefix};
}

std::unique_ptr<QPDF>
ScrubJob::createQPDF(std::string const& filename)
{
    if (!QUtil::file_can_be_opened(filename.c_str())) {
        throw ScrubExc(pdfscrub_e_input_not_found, filename, "file not found or not readable");
    }
    auto pdf = std::make_unique<QPDF>();
    pdf->setLogger(m->log);
    try {
        pdf->processFile(filename.c_str());
    } catch (QPDFExc& e) {
        if (e.getErrorCode() == qpdf_e_password) {
            throw ScrubExc(pdfscrub_e_password, filename, "file is password protected");
        }
        throw ScrubExc(pdfscrub_e_structure, filename, e.getMessageDetail());
    } catch (std::runtime_error& e) {
        throw ScrubExc(pdfscrub_e_structure, filename, e.what());
    }
    return pdf;
}

void
ScrubJob::writeQPDF(QPDF& pdf, std::string const& filename)
{
    bool opened = false;
    try {
        // QPDFWriter must have block scope so the output file will be closed after write()
        // finishes or throws.
        QPDFWriter w(pdf);
        w.setOutputFilename(filename.c_str());
        opened = true;
        w.write();
    } catch (std::runtime_error& e) {
        if (opened) {
            // Don't leave a truncated file behind.
            try {
                QUtil::remove_file(filename.c_str());
            } catch (std::runtime_error& re) {
                diagnostics().warn("unable to remove incomplete output: " + std::string(re.what()));
            }
        }
        throw ScrubExc(pdfscrub_e_output, filename, e.what());
    }
}

ScrubJob::CheckResult
ScrubJob::check(std::string const& filename)
{
    CheckResult result;
    auto diag = diagnostics();
    diag.info("checking " + filename + " for JavaScript");
    try {
        auto pdf = createQPDF(filename);
        auto detection = Detector(*pdf, diag).detect();
        result.found = detection.found;
        result.location = detection.location;
    } catch (ScrubExc& e) {
        result.error = e.getErrorCode();
        result.cause = e.getMessageDetail();
    } catch (std::exception& e) {
        result.error = pdfscrub_e_structure;
        result.cause = e.what();
    }

    if (!result.checked()) {
        diag.error(
            "unable to check " + filename + " (" + ScrubExc::describe(result.error) +
            "): " + result.cause);
    } else if (result.found) {
        diag.warn("JavaScript found in " + filename);
    } else {
        diag.info("no JavaScript found in " + filename);
    }
    return result;
}

bool
ScrubJob::containsJavaScript(std::string const& filename)
{
    return check(filename).found;
}

void
ScrubJob::checkInvocation(std::string const& infile, std::string const& outfile) const
{
    if (m->max_passes < 1) {
        throw ScrubExc(
            pdfscrub_e_invocation,
            "",
            "the maximum number of passes must be at least 1; got " +
                std::to_string(m->max_passes));
    }
    if (QUtil::same_file(infile.c_str(), outfile.c_str()) || same_path(infile, outfile)) {
        throw ScrubExc(
            pdfscrub_e_invocation, outfile, "input and output files must not be the same file");
    }
}

ScrubJob::RemoveResult
ScrubJob::remove(std::string const& infile, std::string const& outfile)
{
    RemoveResult result;
    auto diag = diagnostics();
    try {
        checkInvocation(infile, outfile);
        diag.info("removing JavaScript from " + infile);
        auto pdf = createQPDF(infile);
        result.result = ConvergenceDriver(*pdf, diag).sanitizeDocument(m->max_passes);
        if (result.result.changed) {
            diag.info(
                "JavaScript removed (" + std::to_string(result.result.stats.total()) +
                " removals in " + std::to_string(result.result.passes) +
                " passes); saving sanitized file");
        } else {
            diag.info("no JavaScript found or removed; saving output anyway");
        }
        writeQPDF(*pdf, outfile);
        diag.doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": wrote file " << outfile << "\n";
        });
        result.success = true;
    } catch (ScrubExc& e) {
        result.error = e.getErrorCode();
        result.cause = e.getMessageDetail();
    } catch (std::exception& e) {
        result.error = pdfscrub_e_structure;
        result.cause = e.what();
    }

    if (!result.success) {
        diag.error(
            "unable to sanitize " + infile + " (" + ScrubExc::describe(result.error) +
            "): " + result.cause);
    }
    return result;
}

bool
ScrubJob::removeJavaScript(std::string const& infile, std::string const& outfile)
{
    return remove(infile, outfile).success;
}
