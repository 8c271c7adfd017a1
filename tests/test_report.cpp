#include <sstream>
#include <string>

#include "gtest/gtest.h"
#include "pinfetch/report.hpp"

using pinfetch::Error;
using pinfetch::exit_code_for;
using pinfetch::FetchResult;
using pinfetch::write_diagnostic;
using pinfetch::write_report;

TEST(ReportTest, SuccessFormat) {
    FetchResult r;
    r.status = "200 OK";
    r.status_code = 200;
    r.protocol = "HTTP/1.1";
    r.headers["Set-Cookie"] = {"a=1", "b=2"};
    r.headers["Content-Type"] = {"text/plain"};
    r.body = "hello";
    r.body_size = 5;

    std::ostringstream out;
    write_report(out, r);
    EXPECT_EQ(out.str(),
              "Status: 200 OK\n"
              "Protocol: HTTP/1.1\n"
              "Headers:\n"
              "  Content-Type: text/plain\n"
              "  Set-Cookie: a=1\n"
              "  Set-Cookie: b=2\n"
              "Body length: 5 bytes\n");
}

TEST(ReportTest, NoHeaders) {
    FetchResult r;
    r.status = "204 No Content";
    r.protocol = "HTTP/1.1";

    std::ostringstream out;
    write_report(out, r);
    EXPECT_EQ(out.str(),
              "Status: 204 No Content\n"
              "Protocol: HTTP/1.1\n"
              "Headers:\n"
              "Body length: 0 bytes\n");
}

TEST(ReportTest, DiagnosticNamesClassAndReason) {
    std::ostringstream out;
    write_diagnostic(out, Error{Error::Code::DialFailure,
                                Error::Reason::Timeout,
                                "dial 10.0.0.1:443: timed out"});
    EXPECT_EQ(out.str(), "dial failure (timeout): dial 10.0.0.1:443: timed out\n");
}

TEST(ReportTest, DiagnosticWithoutReason) {
    std::ostringstream out;
    write_diagnostic(out, Error{Error::Code::MissingHost, Error::Reason::None,
                                "example.com/path"});
    EXPECT_EQ(out.str(), "URL has no host: example.com/path\n");
}

TEST(ReportTest, ExitCodes) {
    auto code = [](Error::Code c) {
        return exit_code_for(Error{c, Error::Reason::None, ""});
    };
    EXPECT_EQ(code(Error::Code::InvalidUrl), 1);
    EXPECT_EQ(code(Error::Code::MissingHost), 1);
    EXPECT_EQ(code(Error::Code::UnknownScheme), 1);
    EXPECT_EQ(code(Error::Code::RequestBuildFailed), 2);
    EXPECT_EQ(code(Error::Code::DialFailure), 3);
    EXPECT_EQ(code(Error::Code::TransportFailure), 3);
    EXPECT_EQ(code(Error::Code::ReadFailure), 4);
}
