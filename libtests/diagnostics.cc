#include <pdfscrub/assert_test.h>

// This program tests the logging context and the exception type.

#include <pdfscrub/Diagnostics.hh>
#include <pdfscrub/ScrubExc.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>
#include <stdexcept>

using namespace pdfscrub;

static void
test_messages()
{
    std::string info;
    std::string warn;
    std::string error;
    auto l = QPDFLogger::create();
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setWarn(std::make_shared<Pl_String>("warn", nullptr, warn));
    l->setError(std::make_shared<Pl_String>("error", nullptr, error));

    Diagnostics d(l, false, "test");
    assert(d.getLogger() == l);
    assert(!d.isVerbose());
    assert(d.getMessagePrefix() == "test");
    d.info("one");
    d.warn("two");
    d.error("three");
    assert(info == "test: one\n");
    assert(warn == "test: two\n");
    assert(error == "test: three\n");

    bool called = false;
    d.doIfVerbose([&](Pipeline&, std::string const&) { called = true; });
    assert(!called);

    // Copies share the logger.
    Diagnostics v(l, true, "verbose");
    auto copy = v;
    info.clear();
    copy.doIfVerbose([&](Pipeline& p, std::string const& prefix) {
        called = true;
        p << prefix << ": details " << 12 << "\n";
    });
    assert(called);
    assert(info == "verbose: details 12\n");
}

static void
test_defaults()
{
    Diagnostics d;
    assert(d.getLogger() == QPDFLogger::defaultLogger());
    assert(!d.isVerbose());
    assert(d.getMessagePrefix() == "pdfscrub");

    Diagnostics d2(nullptr, true);
    assert(d2.getLogger() == QPDFLogger::defaultLogger());
    assert(d2.isVerbose());
}

static void
test_exception()
{
    try {
        throw ScrubExc(pdfscrub_e_password, "locked.pdf", "file is password protected");
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "locked.pdf: file is password protected");
    }

    try {
        throw ScrubExc(pdfscrub_e_invocation, "", "bad pass limit");
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == pdfscrub_e_invocation);
        assert(e.getFilename().empty());
        assert(e.getMessageDetail() == "bad pass limit");
        assert(std::string(e.what()) == "bad pass limit");
    }

    assert(std::string(ScrubExc::describe(pdfscrub_e_success)) == "success");
    assert(std::string(ScrubExc::describe(pdfscrub_e_input_not_found)) == "input not found");
    assert(std::string(ScrubExc::describe(pdfscrub_e_password)) == "password protected");
    assert(std::string(ScrubExc::describe(pdfscrub_e_structure)) == "structural error");
    assert(std::string(ScrubExc::describe(pdfscrub_e_output)) == "output write error");
    assert(std::string(ScrubExc::describe(pdfscrub_e_invocation)) == "invalid invocation");
}

int
main()
{
    test_messages();
    test_defaults();
    test_exception();
    std::cout << "diagnostics tests passed" << std::endl;
    return 0;
}
